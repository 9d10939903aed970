#pragma once

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "ry/yaml/Value.hpp"

namespace ry::yaml {

/// Key order of mappings is preserved. Infinite and NaN floats have no JSON
/// form and become null (logged as a Warning).
nlohmann::ordered_json ToJson(const Value& value);

/**
 * @brief Convert a JSON document into a value tree.
 *
 * Unsigned numbers above the signed 64-bit range become floats. Binary
 * payloads become sequences of byte integers.
 */
Value FromJson(const nlohmann::json& json);
Value FromJson(const nlohmann::ordered_json& json);

/**
 * @brief Load either a JSON or a YAML file into a JSON document.
 *
 * Files with a .json extension are parsed as JSON, everything else as YAML.
 *
 * @param path File to read
 * @param out Parsed document
 * @param error Error message on failure
 * @return true on success
 */
bool LoadStructuredFile(const std::filesystem::path& path, nlohmann::ordered_json& out, std::string& error);

} // namespace ry::yaml
