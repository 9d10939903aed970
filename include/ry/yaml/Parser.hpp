#pragma once

#include <cstddef>
#include <vector>

#include "ry/yaml/Token.hpp"
#include "ry/yaml/Value.hpp"

namespace ry::yaml {

/**
 * @brief Recursive-descent tree builder over a token sequence.
 *
 * Nesting is decided by indentation alone. The parser never fails: tokens
 * that do not fit the structure being built end that structure, and
 * anything left after the root value is ignored.
 *
 * Limitation: a list item yields one scalar. Deeper-indented lines that
 * follow a "- " line are not attached to it.
 */
class Parser {
public:
    explicit Parser(std::vector<Token> tokens);

    /// Null for an empty token sequence. Restarts from the first token.
    Value Parse();

    std::size_t Position() const { return m_position; }

private:
    Value ParseNode(int baseIndent);
    Value ParseMapping(int baseIndent);
    Value ParseSequence(int baseIndent);

    const Token* Peek() const;

    std::vector<Token> m_tokens;
    std::size_t m_position = 0;
};

} // namespace ry::yaml
