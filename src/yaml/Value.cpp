#include "ry/yaml/Value.hpp"

#include "ry/core/Error.hpp"

#include <algorithm>

namespace ry::yaml {

const char* ValueTypeName(ValueType type) {
    switch (type) {
        case ValueType::Null:     return "null";
        case ValueType::Boolean:  return "boolean";
        case ValueType::Integer:  return "integer";
        case ValueType::Float:    return "float";
        case ValueType::String:   return "string";
        case ValueType::Sequence: return "sequence";
        case ValueType::Mapping:  return "mapping";
    }
    return "unknown";
}

Value& Mapping::Set(std::string key, Value value) {
    if (Value* existing = Find(key)) {
        *existing = std::move(value);
        return *existing;
    }
    m_entries.emplace_back(std::move(key), std::move(value));
    return m_entries.back().second;
}

const Value* Mapping::Find(std::string_view key) const {
    auto it = std::find_if(m_entries.begin(), m_entries.end(),
                           [key](const Entry& entry) { return entry.first == key; });
    return it == m_entries.end() ? nullptr : &it->second;
}

Value* Mapping::Find(std::string_view key) {
    return const_cast<Value*>(static_cast<const Mapping&>(*this).Find(key));
}

bool Mapping::Contains(std::string_view key) const {
    return Find(key) != nullptr;
}

const Value& Mapping::At(std::string_view key) const {
    const Value* value = Find(key);
    if (!value) {
        throw core::KeyNotFoundError(std::string(key));
    }
    return *value;
}

Value& Mapping::At(std::string_view key) {
    return const_cast<Value&>(static_cast<const Mapping&>(*this).At(key));
}

std::vector<std::string> Mapping::Keys() const {
    std::vector<std::string> keys;
    keys.reserve(m_entries.size());
    for (const auto& entry : m_entries) {
        keys.push_back(entry.first);
    }
    return keys;
}

bool operator==(const Mapping& lhs, const Mapping& rhs) {
    return lhs.m_entries == rhs.m_entries;
}

namespace {

template <ValueType Expected, typename T, typename Storage>
auto& Expect(Storage& storage) {
    auto* alternative = std::get_if<T>(&storage);
    if (!alternative) {
        throw core::ValueTypeError(ValueTypeName(Expected),
                                   ValueTypeName(static_cast<ValueType>(storage.index())));
    }
    return *alternative;
}

} // namespace

bool Value::IsNonEmptyCollection() const {
    switch (Type()) {
        case ValueType::Sequence:
            return !std::get<Sequence>(m_storage).empty();
        case ValueType::Mapping:
            return !std::get<Mapping>(m_storage).Empty();
        case ValueType::Null:
        case ValueType::Boolean:
        case ValueType::Integer:
        case ValueType::Float:
        case ValueType::String:
            return false;
    }
    return false;
}

bool Value::AsBool() const {
    return Expect<ValueType::Boolean, bool>(m_storage);
}

std::int64_t Value::AsInteger() const {
    return Expect<ValueType::Integer, std::int64_t>(m_storage);
}

double Value::AsFloat() const {
    return Expect<ValueType::Float, double>(m_storage);
}

const std::string& Value::AsString() const {
    return Expect<ValueType::String, std::string>(m_storage);
}

const Sequence& Value::AsSequence() const {
    return Expect<ValueType::Sequence, Sequence>(m_storage);
}

Sequence& Value::AsSequence() {
    return Expect<ValueType::Sequence, Sequence>(m_storage);
}

const Mapping& Value::AsMapping() const {
    return Expect<ValueType::Mapping, Mapping>(m_storage);
}

Mapping& Value::AsMapping() {
    return Expect<ValueType::Mapping, Mapping>(m_storage);
}

bool operator==(const Value& lhs, const Value& rhs) {
    return lhs.m_storage == rhs.m_storage;
}

} // namespace ry::yaml
