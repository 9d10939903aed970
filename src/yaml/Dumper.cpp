#include "ry/yaml/Dumper.hpp"

#include "ry/core/Logger.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <vector>

namespace ry::yaml {

namespace {

constexpr std::string_view kReservedCharacters = ":#{}[]&*!|>'\"%@`";

std::string FormatFloat(double number) {
    std::string text = fmt::format("{}", number);
    // Keep a fractional part so the text reads back as a float.
    const bool integral = std::all_of(text.begin(), text.end(), [](char c) {
        return c == '-' || std::isdigit(static_cast<unsigned char>(c));
    });
    if (integral) {
        text.append(".0");
    }
    return text;
}

std::string JoinLines(const std::vector<std::string>& lines) {
    std::string out;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            out.push_back('\n');
        }
        out.append(lines[i]);
    }
    return out;
}

std::string_view TrimLeft(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    return text;
}

} // namespace

Dumper::Dumper(int indentWidth)
    : m_indentWidth(indentWidth) {
    if (m_indentWidth < 0) {
        core::Logger::Warning("[Dumper] Indent width {} is negative, using 0", indentWidth);
        m_indentWidth = 0;
    }
}

std::string Dumper::Dump(const Value& value) const {
    return DumpNode(value, 0);
}

bool Dumper::NeedsQuoting(std::string_view text) {
    return text.find_first_of(kReservedCharacters) != std::string_view::npos;
}

std::string Dumper::FormatScalar(const Value& value) {
    switch (value.Type()) {
        case ValueType::Null:
            return "null";
        case ValueType::Boolean:
            return value.AsBool() ? "true" : "false";
        case ValueType::Integer:
            return fmt::format("{}", value.AsInteger());
        case ValueType::Float:
            return FormatFloat(value.AsFloat());
        case ValueType::String: {
            const std::string& text = value.AsString();
            if (NeedsQuoting(text)) {
                return fmt::format("\"{}\"", text);
            }
            return text;
        }
        case ValueType::Sequence:
            return value.AsSequence().empty() ? "[]" : "";
        case ValueType::Mapping:
            return value.AsMapping().Empty() ? "{}" : "";
    }
    return "";
}

std::string Dumper::DumpNode(const Value& value, int level) const {
    switch (value.Type()) {
        case ValueType::Sequence:
            return DumpSequence(value.AsSequence(), level);
        case ValueType::Mapping:
            return DumpMapping(value.AsMapping(), level);
        case ValueType::Null:
        case ValueType::Boolean:
        case ValueType::Integer:
        case ValueType::Float:
        case ValueType::String:
            return FormatScalar(value);
    }
    return "";
}

std::string Dumper::DumpSequence(const Sequence& sequence, int level) const {
    if (sequence.empty()) {
        return "[]";
    }

    const std::string prefix(static_cast<std::size_t>(level * m_indentWidth), ' ');
    std::vector<std::string> lines;
    lines.reserve(sequence.size());
    for (const auto& item : sequence) {
        if (item.IsScalar()) {
            lines.push_back(prefix + "- " + FormatScalar(item));
            continue;
        }
        const std::string child = DumpNode(item, level + 1);
        lines.push_back(prefix + "- " + std::string(TrimLeft(child)));
    }
    return JoinLines(lines);
}

std::string Dumper::DumpMapping(const Mapping& mapping, int level) const {
    if (mapping.Empty()) {
        return "{}";
    }

    const std::string prefix(static_cast<std::size_t>(level * m_indentWidth), ' ');
    std::vector<std::string> lines;
    lines.reserve(mapping.Size());
    for (const auto& [key, value] : mapping) {
        if (value.IsNonEmptyCollection()) {
            lines.push_back(prefix + key + ":");
            lines.push_back(DumpNode(value, level + 1));
        } else {
            lines.push_back(prefix + key + ": " + DumpNode(value, level));
        }
    }
    return JoinLines(lines);
}

} // namespace ry::yaml
