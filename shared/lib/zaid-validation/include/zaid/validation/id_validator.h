/**
 * @file id_validator.h
 * @brief Top-level validation state machine
 *
 * Gates run strictly in order, each terminal on failure:
 *   1. sanitize
 *   2. length != 13                     -> INVALID
 *   3. citizenship digit not in {0,1,2} -> CITIZENSHIP_VIOLATION
 *   4. date of birth invalid            -> INVALID
 *   5. Luhn checksum                    -> VALID / INVALID
 *
 * The citizenship gate precedes the date gate, so an ID with both a bad
 * citizenship digit and a bad date reports CITIZENSHIP_VIOLATION.
 */

#pragma once

#include <string>
#include "types.h"

namespace zaid::validation {

/**
 * @brief Validate a South African ID number
 *
 * Never throws. Formatting characters (spaces, dashes) are ignored.
 *
 * @param raw Untrusted input
 * @return Tri-state validation outcome
 */
ValidationOutcome validateIdNumber(const std::string& raw);

/**
 * @brief Convenience predicate: outcome is VALID
 */
inline bool isValidIdNumber(const std::string& raw) {
    return validateIdNumber(raw) == ValidationOutcome::VALID;
}

} // namespace zaid::validation
