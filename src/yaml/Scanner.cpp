#include "ry/yaml/Scanner.hpp"

#include "ry/core/Logger.hpp"
#include "ry/yaml/ScalarCoercion.hpp"

#include <string>
#include <utility>

namespace ry::yaml {

namespace {

constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";
constexpr std::string_view kListMarker = "- ";
constexpr std::string_view kKeySeparator = ": ";

bool StartsWith(std::string_view value, std::string_view prefix) {
    return value.substr(0, prefix.size()) == prefix;
}

int CountLeadingSpaces(std::string_view line) {
    int indent = 0;
    while (static_cast<std::size_t>(indent) < line.size() && line[indent] == ' ') {
        ++indent;
    }
    return indent;
}

} // namespace

const char* TokenKindName(TokenKind kind) {
    switch (kind) {
        case TokenKind::ListItem: return "ListItem";
        case TokenKind::Key:      return "Key";
        case TokenKind::KeyValue: return "KeyValue";
        case TokenKind::Value:    return "Value";
    }
    return "Unknown";
}

Scanner::Scanner(std::string_view text)
    : m_text(text) {}

std::optional<Token> Scanner::ClassifyLine(std::string_view line, std::size_t lineNumber) {
    const std::string_view content = TrimView(line);
    if (content.empty() || content.front() == '#') {
        return std::nullopt;
    }

    Token token;
    token.line = lineNumber;
    token.indent = CountLeadingSpaces(line);

    if (StartsWith(content, kListMarker)) {
        token.kind = TokenKind::ListItem;
        token.text = std::string(content.substr(kListMarker.size()));
        return token;
    }

    const auto separator = content.find(kKeySeparator);
    if (content.back() == ':') {
        token.kind = TokenKind::Key;
        token.text = std::string(content.substr(0, content.size() - 1));
        return token;
    }
    if (separator != std::string_view::npos) {
        token.kind = TokenKind::KeyValue;
        token.text = std::string(content.substr(0, separator));
        token.value = CoerceScalar(content.substr(separator + kKeySeparator.size()));
        return token;
    }

    token.kind = TokenKind::Value;
    token.value = CoerceScalar(content);
    return token;
}

std::vector<Token> Scanner::Scan() const {
    std::vector<Token> tokens;
    std::string_view remaining = m_text;
    if (StartsWith(remaining, kUtf8Bom)) {
        remaining.remove_prefix(kUtf8Bom.size());
    }

    std::size_t lineNumber = 0;
    while (true) {
        ++lineNumber;
        const auto newline = remaining.find('\n');
        const std::string_view line = remaining.substr(0, newline);
        if (auto token = ClassifyLine(line, lineNumber)) {
            tokens.push_back(std::move(*token));
        }
        if (newline == std::string_view::npos) {
            break;
        }
        remaining.remove_prefix(newline + 1);
    }

    core::Logger::Debug("[Scanner] {} token(s) from {} line(s)", tokens.size(), lineNumber);
    return tokens;
}

} // namespace ry::yaml
