#pragma once

#include <string>
#include <string_view>

#include "ry/yaml/Value.hpp"

namespace ry::yaml {

inline constexpr int kDefaultIndentWidth = 2;

/**
 * @brief Writes a value tree as indentation-structured text.
 *
 * Output lines are joined with '\n' without a trailing newline. Empty
 * collections are written inline as "[]" and "{}".
 */
class Dumper {
public:
    /// Negative widths are clamped to zero.
    explicit Dumper(int indentWidth = kDefaultIndentWidth);

    std::string Dump(const Value& value) const;

    int IndentWidth() const { return m_indentWidth; }

    /// Scalar text; strings holding a reserved character are double-quoted.
    /// Empty collections give "[]" or "{}", non-empty ones an empty string.
    static std::string FormatScalar(const Value& value);
    static bool NeedsQuoting(std::string_view text);

private:
    std::string DumpNode(const Value& value, int level) const;
    std::string DumpSequence(const Sequence& sequence, int level) const;
    std::string DumpMapping(const Mapping& mapping, int level) const;

    int m_indentWidth = kDefaultIndentWidth;
};

} // namespace ry::yaml
