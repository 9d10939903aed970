#include "ry/yaml/JsonBridge.hpp"

#include "ry/core/Error.hpp"
#include "ry/core/Logger.hpp"
#include "ry/yaml/Yaml.hpp"

#include <cmath>
#include <cstdint>
#include <fstream>
#include <limits>
#include <utility>

#include <fmt/format.h>

namespace ry::yaml {

namespace {

template <typename Json>
Value FromJsonImpl(const Json& json) {
    switch (json.type()) {
        case nlohmann::json::value_t::null:
        case nlohmann::json::value_t::discarded:
            return Value();
        case nlohmann::json::value_t::boolean:
            return json.template get<bool>();
        case nlohmann::json::value_t::number_integer:
            return json.template get<std::int64_t>();
        case nlohmann::json::value_t::number_unsigned: {
            const auto number = json.template get<std::uint64_t>();
            if (number > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                return static_cast<double>(number);
            }
            return static_cast<std::int64_t>(number);
        }
        case nlohmann::json::value_t::number_float:
            return json.template get<double>();
        case nlohmann::json::value_t::string:
            return json.template get<std::string>();
        case nlohmann::json::value_t::array: {
            Sequence sequence;
            sequence.reserve(json.size());
            for (const auto& element : json) {
                sequence.push_back(FromJsonImpl(element));
            }
            return Value(std::move(sequence));
        }
        case nlohmann::json::value_t::object: {
            Mapping mapping;
            for (auto it = json.begin(); it != json.end(); ++it) {
                mapping.Set(it.key(), FromJsonImpl(it.value()));
            }
            return Value(std::move(mapping));
        }
        case nlohmann::json::value_t::binary: {
            Sequence bytes;
            for (auto byte : json.get_binary()) {
                bytes.push_back(static_cast<std::int64_t>(byte));
            }
            return Value(std::move(bytes));
        }
    }
    return Value();
}

} // namespace

nlohmann::ordered_json ToJson(const Value& value) {
    switch (value.Type()) {
        case ValueType::Null:
            return nullptr;
        case ValueType::Boolean:
            return value.AsBool();
        case ValueType::Integer:
            return value.AsInteger();
        case ValueType::Float: {
            const double number = value.AsFloat();
            if (!std::isfinite(number)) {
                core::Logger::Warning("[JsonBridge] Float {} has no JSON form, writing null", number);
                return nullptr;
            }
            return number;
        }
        case ValueType::String:
            return value.AsString();
        case ValueType::Sequence: {
            nlohmann::ordered_json array = nlohmann::ordered_json::array();
            for (const auto& element : value.AsSequence()) {
                array.push_back(ToJson(element));
            }
            return array;
        }
        case ValueType::Mapping: {
            nlohmann::ordered_json object = nlohmann::ordered_json::object();
            for (const auto& [key, child] : value.AsMapping()) {
                object[key] = ToJson(child);
            }
            return object;
        }
    }
    return nullptr;
}

Value FromJson(const nlohmann::json& json) {
    return FromJsonImpl(json);
}

Value FromJson(const nlohmann::ordered_json& json) {
    return FromJsonImpl(json);
}

bool LoadStructuredFile(const std::filesystem::path& path, nlohmann::ordered_json& out, std::string& error) {
    const auto ext = path.extension().string();
    if (ext == ".json" || ext == ".JSON") {
        std::ifstream file(path);
        if (!file) {
            error = fmt::format("Failed to open '{}'", path.string());
            return false;
        }
        try {
            file >> out;
        } catch (const nlohmann::json::exception& e) {
            error = fmt::format("JSON parse error in '{}': {}", path.string(), e.what());
            return false;
        }
        error.clear();
        return true;
    }

    try {
        out = ToJson(LoadFile(path));
    } catch (const core::IoError& e) {
        error = e.what();
        return false;
    }
    error.clear();
    return true;
}

} // namespace ry::yaml
