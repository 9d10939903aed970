#pragma once

#include <optional>
#include <string_view>
#include <vector>

#include "ry/yaml/Token.hpp"

namespace ry::yaml {

/**
 * @brief Splits a document into one token per meaningful line.
 *
 * Blank lines and lines whose first non-blank character is '#' are skipped.
 * Indentation is the count of leading spaces; tabs are not expanded.
 * The text must outlive the scanner.
 */
class Scanner {
public:
    explicit Scanner(std::string_view text);

    std::vector<Token> Scan() const;

    /// Returns nothing for blank and comment lines.
    static std::optional<Token> ClassifyLine(std::string_view line, std::size_t lineNumber);

private:
    std::string_view m_text;
};

} // namespace ry::yaml
