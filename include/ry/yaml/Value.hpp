#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace ry::yaml {

class Value;

using Sequence = std::vector<Value>;

enum class ValueType {
    Null,
    Boolean,
    Integer,
    Float,
    String,
    Sequence,
    Mapping
};

const char* ValueTypeName(ValueType type);

/**
 * @brief Ordered string-keyed collection of values.
 *
 * Keys are unique. Setting an existing key replaces its value and keeps the
 * key at its original position.
 */
class Mapping {
public:
    using Entry = std::pair<std::string, Value>;
    using iterator = std::vector<Entry>::iterator;
    using const_iterator = std::vector<Entry>::const_iterator;

    Value& Set(std::string key, Value value);

    const Value* Find(std::string_view key) const;
    Value* Find(std::string_view key);
    bool Contains(std::string_view key) const;

    /// Throws core::KeyNotFoundError when the key is absent.
    const Value& At(std::string_view key) const;
    Value& At(std::string_view key);

    std::size_t Size() const;
    bool Empty() const;
    std::vector<std::string> Keys() const;

    iterator begin();
    iterator end();
    const_iterator begin() const;
    const_iterator end() const;

    friend bool operator==(const Mapping& lhs, const Mapping& rhs);
    friend bool operator!=(const Mapping& lhs, const Mapping& rhs) { return !(lhs == rhs); }

private:
    std::vector<Entry> m_entries;
};

/**
 * @brief Node of a document tree.
 *
 * Holds exactly one of null, boolean, integer, float, string, sequence or
 * mapping. Collections own their children.
 */
class Value {
public:
    using Storage = std::variant<std::monostate, bool, std::int64_t, double, std::string, Sequence, Mapping>;

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool value) : m_storage(value) {}
    Value(int value) : m_storage(static_cast<std::int64_t>(value)) {}
    Value(std::int64_t value) : m_storage(value) {}
    Value(double value) : m_storage(value) {}
    Value(const char* value) : m_storage(std::string(value)) {}
    Value(std::string value) : m_storage(std::move(value)) {}
    Value(Sequence value) : m_storage(std::move(value)) {}
    Value(Mapping value) : m_storage(std::move(value)) {}

    ValueType Type() const { return static_cast<ValueType>(m_storage.index()); }

    bool IsNull() const { return Type() == ValueType::Null; }
    bool IsBool() const { return Type() == ValueType::Boolean; }
    bool IsInteger() const { return Type() == ValueType::Integer; }
    bool IsFloat() const { return Type() == ValueType::Float; }
    bool IsString() const { return Type() == ValueType::String; }
    bool IsSequence() const { return Type() == ValueType::Sequence; }
    bool IsMapping() const { return Type() == ValueType::Mapping; }
    bool IsScalar() const { return !IsSequence() && !IsMapping(); }
    bool IsNonEmptyCollection() const;

    // Throw core::ValueTypeError on mismatch.
    bool AsBool() const;
    std::int64_t AsInteger() const;
    double AsFloat() const;
    const std::string& AsString() const;
    const Sequence& AsSequence() const;
    Sequence& AsSequence();
    const Mapping& AsMapping() const;
    Mapping& AsMapping();

    friend bool operator==(const Value& lhs, const Value& rhs);
    friend bool operator!=(const Value& lhs, const Value& rhs) { return !(lhs == rhs); }

private:
    Storage m_storage;
};

inline std::size_t Mapping::Size() const { return m_entries.size(); }
inline bool Mapping::Empty() const { return m_entries.empty(); }
inline Mapping::iterator Mapping::begin() { return m_entries.begin(); }
inline Mapping::iterator Mapping::end() { return m_entries.end(); }
inline Mapping::const_iterator Mapping::begin() const { return m_entries.begin(); }
inline Mapping::const_iterator Mapping::end() const { return m_entries.end(); }

} // namespace ry::yaml
