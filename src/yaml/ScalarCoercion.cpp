#include "ry/yaml/ScalarCoercion.hpp"

#include <array>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <system_error>

namespace ry::yaml {

namespace {

constexpr std::array<std::string_view, 3> kTrueWords{"true", "yes", "on"};
constexpr std::array<std::string_view, 3> kFalseWords{"false", "no", "off"};
constexpr std::array<std::string_view, 2> kNullWords{"null", "~"};

bool EqualsIgnoreCase(std::string_view lhs, std::string_view rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (std::size_t i = 0; i < lhs.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(lhs[i])) !=
            std::tolower(static_cast<unsigned char>(rhs[i]))) {
            return false;
        }
    }
    return true;
}

template <std::size_t N>
bool MatchesAny(std::string_view value, const std::array<std::string_view, N>& words) {
    for (auto word : words) {
        if (EqualsIgnoreCase(value, word)) {
            return true;
        }
    }
    return false;
}

bool IsWrappedIn(std::string_view value, char quote) {
    return !value.empty() && value.front() == quote && value.back() == quote;
}

std::string_view Unwrap(std::string_view value) {
    if (value.size() < 2) {
        return {};
    }
    return value.substr(1, value.size() - 2);
}

// from_chars rejects a leading '+'; accept exactly one.
std::string_view StripPlus(std::string_view value) {
    if (value.size() > 1 && value.front() == '+' && value[1] != '+' && value[1] != '-') {
        value.remove_prefix(1);
    }
    return value;
}

bool IsIntegerLiteral(std::string_view value) {
    std::size_t i = 0;
    if (!value.empty() && (value[0] == '-' || value[0] == '+')) {
        ++i;
    }
    if (i == value.size()) {
        return false;
    }
    for (; i < value.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(value[i]))) {
            return false;
        }
    }
    return true;
}

bool TryParseInteger(std::string_view value, std::int64_t& out) {
    if (!IsIntegerLiteral(value)) {
        return false;
    }
    value = StripPlus(value);
    const char* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(value.data(), end, out);
    return ec == std::errc() && ptr == end;
}

bool TryParseFloat(std::string_view value, double& out) {
    value = StripPlus(value);
    if (value.empty() || value.front() == '+') {
        return false;
    }
    // from_chars accepts the "nan(chars)" payload form; plain "nan" is enough.
    if (value.find('(') != std::string_view::npos) {
        return false;
    }
    const char* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(value.data(), end, out, std::chars_format::general);
    if (ec == std::errc::result_out_of_range && ptr == end) {
        // Saturate like strtod: +-HUGE_VAL on overflow, +-0 (or a denormal) on underflow.
        const std::string literal(value);
        out = std::strtod(literal.c_str(), nullptr);
        return true;
    }
    return ec == std::errc() && ptr == end;
}

} // namespace

std::string_view TrimView(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

Value CoerceScalar(std::string_view text) {
    const std::string_view value = TrimView(text);
    if (value.empty()) {
        return Value();
    }
    if (MatchesAny(value, kTrueWords)) {
        return true;
    }
    if (MatchesAny(value, kFalseWords)) {
        return false;
    }
    if (MatchesAny(value, kNullWords)) {
        return Value();
    }
    if (IsWrappedIn(value, '"') || IsWrappedIn(value, '\'')) {
        return std::string(Unwrap(value));
    }
    std::int64_t integer = 0;
    if (TryParseInteger(value, integer)) {
        return integer;
    }
    double number = 0.0;
    if (TryParseFloat(value, number)) {
        return number;
    }
    return std::string(value);
}

} // namespace ry::yaml
