#pragma once

#include <cstddef>
#include <string>

#include "ry/yaml/Value.hpp"

namespace ry::yaml {

enum class TokenKind {
    ListItem,   // "- payload", payload kept raw
    Key,        // "key:" opening a nested block
    KeyValue,   // "key: value"
    Value       // bare scalar line
};

const char* TokenKindName(TokenKind kind);

/**
 * @brief One classified source line.
 *
 * `text` holds the raw list item payload or the key; `value` holds the
 * coerced scalar of KeyValue and Value tokens.
 */
struct Token {
    TokenKind kind = TokenKind::Value;
    std::string text;
    Value value;
    std::size_t line = 0;
    int indent = 0;
};

} // namespace ry::yaml
