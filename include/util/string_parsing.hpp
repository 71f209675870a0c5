// Copyright (c) 2025 The Lanpeer Developers
// Distributed under the MIT software license

#pragma once

/*
 String Parsing Utilities

 Purpose:
 - Safe parsing of untrusted text (environment, command line, C callers,
   datagrams) with validation
 - Returns std::nullopt / false on any error, never throws

 Key functions:
 - SafeParseInt: Parse integer with bounds checking
 - SafeParsePort: Parse port number (1-65535)
 - IsValidUtf8: Strict UTF-8 validation (no overlongs, no surrogates)
 - IsValidHex / ParseHex / ToHex: hexadecimal encoding helpers
*/

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lanpeer {
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
std::optional<int> SafeParseInt(const std::string &str, int min, int max);

/**
 * Parse port number string (1-65535)
 *
 *   SafeParsePort("45454") -> 45454
 *   SafeParsePort("0") -> std::nullopt
 */
std::optional<uint16_t> SafeParsePort(const std::string &str);

/**
 * Validate UTF-8 encoding
 *
 * Rejects truncated sequences, overlong encodings, UTF-16 surrogates and
 * code points above U+10FFFF. The empty string is valid.
 */
bool IsValidUtf8(std::string_view str);

/**
 * Validate hexadecimal string
 *
 *   IsValidHex("deadbeef") -> true
 *   IsValidHex("xyz") -> false
 *   IsValidHex("") -> false
 */
bool IsValidHex(std::string_view str);

// Decode an even-length hex string; std::nullopt on invalid input
std::optional<std::vector<uint8_t>> ParseHex(std::string_view str);

// Lowercase hex encoding
std::string ToHex(const uint8_t *data, size_t len);

} // namespace util
} // namespace lanpeer
