/**
 * @file structure_validator.h
 * @brief Length and citizenship-digit checks
 */

#pragma once

#include <string>
#include "types.h"

namespace zaid::validation {

/**
 * @brief Check that position 10 holds a citizenship code
 *
 * Safe on any length: strings shorter than 11 characters return false.
 *
 * @param number Sanitized digits
 * @return true if number[10] is '0', '1' or '2'
 */
bool isValidCitizenshipDigit(const std::string& number);

/**
 * @brief Run the structural gates in order: length, then citizenship digit
 *
 * @param digits Sanitized digits
 * @return WRONG_LENGTH unless exactly 13 digits, else INVALID_CITIZENSHIP_DIGIT
 *         unless the citizenship digit is valid, else ok() with digits set
 */
StructureCheckResult validateStructure(const std::string& digits);

} // namespace zaid::validation
