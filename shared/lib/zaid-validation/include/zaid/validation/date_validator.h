/**
 * @file date_validator.h
 * @brief Date-of-birth plausibility across ambiguous centuries
 *
 * A two-digit year cannot be placed in a century, so a YYMMDD is accepted
 * when it is a real calendar day in ANY of 18YY, 19YY or 20YY. No age or
 * future-date bound is applied.
 *
 * Examples:
 *   - 880101 -> valid (1 Jan 1888 / 1988)
 *   - 000229 -> valid (29 Feb 2000; 1800 and 1900 are not leap years)
 *   - 010229 -> invalid (1801, 1901, 2001 are not leap years)
 */

#pragma once

#include <array>
#include <string>

namespace zaid::validation {

/// Century prefixes tried, in order
constexpr std::array<const char*, 3> CENTURY_PREFIXES = {"18", "19", "20"};

/**
 * @brief Check a YYMMDD against one explicit century
 *
 * @param yymmdd Six ASCII digits
 * @param century Two-digit century prefix (e.g., "19")
 * @return true if century + yymmdd is a valid YYYYMMDD calendar date
 */
bool isValidDateForCentury(const std::string& yymmdd, const std::string& century);

/**
 * @brief Check a YYMMDD date of birth
 *
 * Fails closed unless the input is exactly six ASCII digits. Prefixes are
 * tried in CENTURY_PREFIXES order and the first valid one short-circuits.
 *
 * @param yymmdd Date of birth as encoded in the ID
 * @return true if at least one century gives a real calendar date
 */
bool isValidIdDate(const std::string& yymmdd);

/**
 * @brief Check the date of birth embedded at the start of a number
 *
 * @param number Sanitized digits (at least 6)
 * @return isValidIdDate of the first six characters, false if too short
 */
bool isValidDateInId(const std::string& number);

} // namespace zaid::validation
