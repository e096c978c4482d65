/**
 * @file luhn.h
 * @brief Luhn (mod 10) checksum
 *
 * Digits are processed right to left; every second digit starting with the
 * one left of the rightmost is doubled, and doubled values above 9 have 9
 * subtracted. A number is valid when the sum is a multiple of 10.
 *
 * @see https://en.wikipedia.org/wiki/Luhn_algorithm
 */

#pragma once

#include <string>

namespace zaid::validation {

/**
 * @brief Validate a digit string of any length with the Luhn algorithm
 *
 * @param digits Candidate number including its check digit
 * @return true if the Luhn sum is 0 mod 10; false for empty input or any
 *         non-digit character
 */
bool isValidLuhnChecksum(const std::string& digits);

/**
 * @brief Compute the check digit to append to a payload
 *
 * The rightmost payload digit is doubled first, since it becomes the second
 * digit from the right once the check digit is appended.
 *
 * @param payload Digits without check digit (e.g., the first 12 of an ID)
 * @return Check digit character '0'-'9'
 * @throws common::ValidationException if payload is empty or not all digits
 */
char computeLuhnCheckDigit(const std::string& payload);

} // namespace zaid::validation
