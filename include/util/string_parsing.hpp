#pragma once

/*
 String Parsing Utilities

 Purpose:
 - Safe parsing of option values to numeric types with validation
 - Used for command-line style dial options (--maxparalleldials=N, ...)

 Behavior:
 - The entire input must be consumed (no trailing garbage)
 - Bounds are inclusive
 - Returns std::nullopt on any parsing error (never throws)
*/

#include <cstdint>
#include <optional>
#include <string>

namespace peerdial {
namespace util {

/**
 * Parse integer string with bounds checking
 *
 * Examples:
 *   SafeParseInt("42", 0, 100) -> 42
 *   SafeParseInt("999", 0, 100) -> std::nullopt (out of range)
 *   SafeParseInt("42x", 0, 100) -> std::nullopt (trailing chars)
 *   SafeParseInt("", 0, 100) -> std::nullopt (empty string)
 */
std::optional<int> SafeParseInt(const std::string& str, int min, int max);

/**
 * Parse int64_t string with bounds checking
 *
 * Examples:
 *   SafeParseInt64("900", 1, 86400) -> 900
 *   SafeParseInt64("-1", 0, 1000000) -> std::nullopt (out of range)
 *   SafeParseInt64("999999999999999999999", 0, INT64_MAX) -> std::nullopt (overflow)
 */
std::optional<int64_t> SafeParseInt64(const std::string& str, int64_t min, int64_t max);

} // namespace util
} // namespace peerdial
