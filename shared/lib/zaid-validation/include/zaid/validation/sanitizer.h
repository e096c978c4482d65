/**
 * @file sanitizer.h
 * @brief Input sanitization, the first stage of every pipeline operation
 *
 * Total function: every byte string maps to a (possibly empty) string of
 * ASCII digits. Only '0'-'9' survive; Unicode decimal digits such as
 * full-width U+FF10..U+FF19 are stripped like any other character.
 */

#pragma once

#include <string>

namespace zaid::validation {

/**
 * @brief Remove all non-digit characters
 *
 * Input that is already all ASCII digits is returned unchanged without
 * rebuilding it. Linear in input length.
 *
 * @param input Untrusted raw input of any length or encoding
 * @return ASCII digits of input in original order
 */
std::string sanitizeNumber(const std::string& input);

} // namespace zaid::validation
