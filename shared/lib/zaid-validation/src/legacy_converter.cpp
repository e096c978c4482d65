/**
 * @file legacy_converter.cpp
 * @brief Legacy-to-modern conversion implementation
 */

#include "zaid/validation/legacy_converter.h"
#include "zaid/validation/id_validator.h"
#include "zaid/validation/luhn.h"
#include "zaid/validation/sanitizer.h"

#include <spdlog/spdlog.h>

namespace zaid::validation {

std::optional<std::string> convertLegacyToModern(const std::string& idNumber, int targetIndicator) {
    if (targetIndicator != 8 && targetIndicator != 9) {
        spdlog::debug("Legacy conversion rejected: target indicator {} is not 8 or 9", targetIndicator);
        return std::nullopt;
    }

    ValidationOutcome outcome = validateIdNumber(idNumber);
    if (outcome != ValidationOutcome::VALID) {
        spdlog::debug("Legacy conversion rejected: outcome {}", validationOutcomeToString(outcome));
        return std::nullopt;
    }

    std::string digits = sanitizeNumber(idNumber);

    const char indicator = digits[RACE_INDICATOR_INDEX];
    if (indicator == '8' || indicator == '9') {
        return digits;
    }

    digits[RACE_INDICATOR_INDEX] = static_cast<char>('0' + targetIndicator);
    digits[CHECK_DIGIT_INDEX] = computeLuhnCheckDigit(digits.substr(0, CHECK_DIGIT_INDEX));
    return digits;
}

} // namespace zaid::validation
