/**
 * @file luhn.cpp
 * @brief Luhn checksum implementation
 */

#include "zaid/validation/luhn.h"
#include "zaid/utils/string_utils.h"
#include "exceptions.h"

namespace zaid::validation {

namespace {

/// Sum of digits right to left, doubling every second digit from doubleFirst
int luhnSum(const std::string& digits, bool doubleFirst) {
    int total = 0;
    bool doubleDigit = doubleFirst;

    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        int digit = *it - '0';

        if (doubleDigit) {
            digit *= 2;
            if (digit > 9) {
                digit -= 9;
            }
        }

        total += digit;
        doubleDigit = !doubleDigit;
    }

    return total;
}

} // namespace

bool isValidLuhnChecksum(const std::string& digits) {
    if (digits.empty() || !utils::isAllAsciiDigits(digits)) {
        return false;
    }
    return luhnSum(digits, false) % 10 == 0;
}

char computeLuhnCheckDigit(const std::string& payload) {
    if (payload.empty()) {
        throw common::ValidationException("Luhn payload is empty");
    }
    if (!utils::isAllAsciiDigits(payload)) {
        throw common::ValidationException("Luhn payload contains non-digit characters");
    }

    int sum = luhnSum(payload, true);
    return static_cast<char>('0' + (10 - sum % 10) % 10);
}

} // namespace zaid::validation
