/**
 * @file test_helpers.h
 * @brief Shared test helpers for zaid::validation unit tests
 *
 * Builds well-formed ID numbers with a check digit computed here, so tests
 * do not depend on the library's own Luhn implementation.
 */

#pragma once

#include <cstddef>
#include <string>

namespace test_helpers {

/// Well-formed modern male SA citizen, 1 Jan 80, sequence 5009
constexpr const char* VALID_MODERN_ID = "8001015009087";
/// Same person with race indicator 9
constexpr const char* VALID_MODERN_ID_9 = "8001015009095";
/// Same date/sequence/citizenship with legacy race indicator 0
constexpr const char* VALID_LEGACY_ID = "8001015009004";

/**
 * @brief Check digit for a 12-digit base (rightmost base digit doubled)
 */
inline char checkDigitFor(const std::string& base) {
    int sum = 0;
    bool doubleIt = true;
    for (size_t i = base.size(); i > 0; --i) {
        int digit = base[i - 1] - '0';
        if (doubleIt) {
            digit *= 2;
            if (digit > 9) digit -= 9;
        }
        sum += digit;
        doubleIt = !doubleIt;
    }
    return static_cast<char>('0' + (10 - sum % 10) % 10);
}

/**
 * @brief Complete a 12-digit base into a checksum-valid 13-digit ID
 */
inline std::string makeIdNumber(const std::string& base) {
    return base + checkDigitFor(base);
}

/**
 * @brief Build an ID from its fields
 */
inline std::string makeIdNumber(
    const std::string& yymmdd,
    const std::string& sequence,
    char citizenship = '0',
    char raceIndicator = '8')
{
    return makeIdNumber(yymmdd + sequence + citizenship + raceIndicator);
}

/**
 * @brief Same ID with the check digit bumped by one (mod 10)
 */
inline std::string withWrongCheckDigit(const std::string& idNumber) {
    std::string result = idNumber;
    char& last = result.back();
    last = static_cast<char>('0' + (last - '0' + 1) % 10);
    return result;
}

} // namespace test_helpers
