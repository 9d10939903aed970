#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "ry/yaml/Dumper.hpp"
#include "ry/yaml/Value.hpp"

namespace ry::yaml {

/**
 * @brief Parse a document into a value tree.
 *
 * Never throws for odd structure. Empty, whitespace-only and comment-only
 * documents yield null.
 */
Value Load(std::string_view text);
Value Loads(std::string_view text);

std::string Dump(const Value& value, int indentWidth = kDefaultIndentWidth);
std::string Dumps(const Value& value, int indentWidth = kDefaultIndentWidth);

/**
 * @brief Read a whole file and parse it.
 * @throws core::IoError if the file cannot be opened or read
 */
Value LoadFile(const std::filesystem::path& path);

/**
 * @brief Dump a value and write it to a file, creating or truncating it.
 * @throws core::IoError if the file cannot be created or written
 */
void DumpFile(const Value& value, const std::filesystem::path& path, int indentWidth = kDefaultIndentWidth);

} // namespace ry::yaml
