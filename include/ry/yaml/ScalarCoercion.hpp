#pragma once

#include <string_view>

#include "ry/yaml/Value.hpp"

namespace ry::yaml {

/**
 * @brief Convert a raw text fragment into the most specific scalar.
 *
 * The fragment is trimmed first. Rules, first match wins:
 * - empty -> null
 * - true/yes/on, false/no/off (any case) -> boolean
 * - null/~ (any case) -> null
 * - wrapped in "..." or '...' -> string without the quotes (no escapes)
 * - base-10 integer fitting in 64 bits -> integer
 * - floating-point literal -> float
 * - anything else -> string
 *
 * Never fails.
 */
Value CoerceScalar(std::string_view text);

std::string_view TrimView(std::string_view text);

} // namespace ry::yaml
