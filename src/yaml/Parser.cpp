#include "ry/yaml/Parser.hpp"

#include "ry/core/Logger.hpp"
#include "ry/yaml/ScalarCoercion.hpp"

#include <utility>

namespace ry::yaml {

Parser::Parser(std::vector<Token> tokens)
    : m_tokens(std::move(tokens)) {}

const Token* Parser::Peek() const {
    if (m_position >= m_tokens.size()) {
        return nullptr;
    }
    return &m_tokens[m_position];
}

Value Parser::Parse() {
    m_position = 0;
    if (m_tokens.empty()) {
        return Value();
    }
    Value root = ParseNode(0);
    if (const Token* trailing = Peek()) {
        core::Logger::Debug("[Parser] Ignoring {} token(s) after root value, first at line {}",
                            m_tokens.size() - m_position, trailing->line);
    }
    return root;
}

Value Parser::ParseNode(int baseIndent) {
    const Token* token = Peek();
    if (!token) {
        return Value();
    }

    switch (token->kind) {
        case TokenKind::ListItem:
            return ParseSequence(baseIndent);
        case TokenKind::Key:
        case TokenKind::KeyValue:
            return ParseMapping(baseIndent);
        case TokenKind::Value:
            ++m_position;
            return token->value;
    }
    return Value();
}

Value Parser::ParseMapping(int baseIndent) {
    Mapping mapping;

    while (const Token* token = Peek()) {
        if (token->indent < baseIndent) {
            break;
        }

        if (token->kind == TokenKind::KeyValue) {
            mapping.Set(token->text, token->value);
            ++m_position;
            continue;
        }

        if (token->kind != TokenKind::Key) {
            core::Logger::Debug("[Parser] {} token at line {} ends mapping",
                                TokenKindName(token->kind), token->line);
            break;
        }

        const std::string key = token->text;
        const int keyIndent = token->indent;
        ++m_position;

        const Token* next = Peek();
        if (next && next->indent > keyIndent) {
            Value child = ParseNode(next->indent);
            mapping.Set(key, std::move(child));
        } else {
            mapping.Set(key, Value());
        }
    }

    return Value(std::move(mapping));
}

Value Parser::ParseSequence(int baseIndent) {
    Sequence sequence;

    while (const Token* token = Peek()) {
        if (token->indent < baseIndent) {
            break;
        }
        if (token->kind != TokenKind::ListItem) {
            core::Logger::Debug("[Parser] {} token at line {} ends sequence",
                                TokenKindName(token->kind), token->line);
            break;
        }
        sequence.push_back(CoerceScalar(token->text));
        ++m_position;
    }

    return Value(std::move(sequence));
}

} // namespace ry::yaml
