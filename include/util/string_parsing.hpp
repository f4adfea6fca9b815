#pragma once

/*
 String Parsing Utilities

 Purpose:
 - Safe parsing of strings to numeric types with validation
 - Centralized input validation for command-line args and config files
 - Small text helpers shared by the mesh (blank checks, UTF-8 safe cuts)

 Security:
 - All numeric parsers validate entire input is consumed (no trailing garbage)
 - Bounds checking prevents overflow/underflow
 - Returns std::nullopt on any parsing error (no exceptions thrown)
*/

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace agentmesh {
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
 * Parse port number string (1-65535)
 *
 * Examples:
 *   SafeParsePort("54321") -> 54321
 *   SafeParsePort("0") -> std::nullopt (port 0 invalid)
 *   SafeParsePort("99999") -> std::nullopt (out of range)
 */
std::optional<uint16_t> SafeParsePort(const std::string& str);

/**
 * Parse int64_t string with bounds checking
 *
 * Examples:
 *   SafeParseInt64("86400", 0, 1000000) -> 86400
 *   SafeParseInt64("-1", 0, 1000000) -> std::nullopt (out of range)
 */
std::optional<int64_t> SafeParseInt64(const std::string& str, int64_t min, int64_t max);

/**
 * Split a comma-separated list, dropping empty items
 *
 * Example:
 *   SplitCommaList("network,,mesh") -> {"network", "mesh"}
 */
std::vector<std::string> SplitCommaList(const std::string& str);

// True if str is empty or contains only whitespace
bool IsBlank(const std::string& str);

/**
 * Truncate str to at most max_bytes without splitting a UTF-8 sequence
 *
 * Example:
 *   TruncateUtf8("h\xC3\xA9llo", 2) -> "h"
 */
std::string TruncateUtf8(const std::string& str, size_t max_bytes);

} // namespace util
} // namespace agentmesh
