/**
 * @file string_utils.h
 * @brief String manipulation utilities
 *
 * Digit-oriented string operations used by the ID validation pipeline.
 * "Digit" always means ASCII '0'-'9'; locale and Unicode digit classes are
 * never consulted.
 */

#pragma once

#include <string>
#include <optional>

namespace zaid {
namespace utils {

/**
 * @brief Check for an ASCII decimal digit
 *
 * @param c Character to test
 * @return true only for '0'..'9'
 */
inline bool isAsciiDigit(char c) {
    return c >= '0' && c <= '9';
}

/**
 * @brief Check if string contains only ASCII digits
 *
 * @param str Input string
 * @return true if every character is '0'-'9' (true for empty string)
 */
bool isAllAsciiDigits(const std::string& str);

/**
 * @brief Remove every character that is not an ASCII digit
 *
 * Runs in a single pass over the input. Multi-byte UTF-8 sequences
 * (including full-width digits) and embedded NUL bytes are removed.
 *
 * @param str Input string
 * @return Digits of str in original order, possibly empty
 */
std::string keepAsciiDigits(const std::string& str);

/**
 * @brief Parse a short all-digit string as a non-negative integer
 *
 * Leading zeros are accepted ("0499" -> 499).
 *
 * @param digits Digit string (1 to 9 characters)
 * @return Parsed value, or std::nullopt if empty, too long or non-digit
 */
std::optional<int> parseDigits(const std::string& digits);

} // namespace utils
} // namespace zaid
