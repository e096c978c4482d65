/**
 * @file time_utils.h
 * @brief Calendar utilities
 *
 * Proleptic Gregorian calendar rules: a year divisible by 4 is a leap year
 * unless it is divisible by 100 and not by 400.
 */

#pragma once

#include <string>

namespace zaid {
namespace utils {

/**
 * @brief Check if year is leap year
 *
 * @param year Year number
 * @return true if leap year
 */
bool isLeapYear(int year);

/**
 * @brief Get number of days in month
 *
 * @param year Year number
 * @param month Month number (1-12)
 * @return Number of days in month, or 0 if month is out of range
 */
int daysInMonth(int year, int month);

/**
 * @brief Check that year/month/day names a real calendar day
 *
 * @param year Four-digit year (1-9999)
 * @param month Month number (1-12)
 * @param day Day of month (1-daysInMonth)
 * @return true if the date exists
 */
bool isValidCalendarDate(int year, int month, int day);

/**
 * @brief Parse and check a compact YYYYMMDD string
 *
 * @param yyyymmdd Exactly eight ASCII digits
 * @return true if the string is well-formed and the date exists
 */
bool isValidCompactDate(const std::string& yyyymmdd);

} // namespace utils
} // namespace zaid
