/**
 * @file field_extractor.cpp
 * @brief Field decoding implementation
 */

#include "zaid/validation/field_extractor.h"
#include "zaid/validation/date_validator.h"
#include "zaid/validation/id_validator.h"
#include "zaid/validation/sanitizer.h"
#include "zaid/utils/string_utils.h"

namespace zaid::validation {

namespace {

/// Sanitized 13-digit ID, or std::nullopt
std::optional<std::string> sanitizedId(const std::string& idNumber) {
    std::string digits = sanitizeNumber(idNumber);
    if (digits.size() != ID_LENGTH) {
        return std::nullopt;
    }
    return digits;
}

} // namespace

std::optional<Gender> extractGender(const std::string& idNumber) {
    auto digits = sanitizedId(idNumber);
    if (!digits) {
        return std::nullopt;
    }

    auto sequence = utils::parseDigits(digits->substr(SEQUENCE_OFFSET, SEQUENCE_LENGTH));
    if (!sequence) {
        return std::nullopt;
    }

    return *sequence < MALE_SEQUENCE_THRESHOLD ? Gender::FEMALE : Gender::MALE;
}

std::optional<Citizenship> extractCitizenship(const std::string& idNumber) {
    auto digits = sanitizedId(idNumber);
    if (!digits) {
        return std::nullopt;
    }

    switch ((*digits)[CITIZENSHIP_INDEX]) {
        case '0': return Citizenship::SOUTH_AFRICAN_CITIZEN;
        case '1': return Citizenship::PERMANENT_RESIDENT;
        case '2': return Citizenship::REFUGEE;
        default:  return std::nullopt;
    }
}

bool isLegacyId(const std::string& idNumber) {
    auto digits = sanitizedId(idNumber);
    if (!digits) {
        return false;
    }

    const char indicator = (*digits)[RACE_INDICATOR_INDEX];
    return indicator >= '0' && indicator <= '7';
}

std::optional<DateComponents> extractDateComponents(const std::string& idNumber) {
    auto digits = sanitizedId(idNumber);
    if (!digits || !isValidDateInId(*digits)) {
        return std::nullopt;
    }

    DateComponents components;
    components.year = digits->substr(0, 2);
    components.month = digits->substr(2, 2);
    components.day = digits->substr(4, 2);
    return components;
}

ExtractedInfo extractInfo(const std::string& idNumber) {
    ExtractedInfo info;

    if (validateIdNumber(idNumber) != ValidationOutcome::VALID) {
        return info;
    }

    info.valid = true;
    info.dateComponents = extractDateComponents(idNumber);
    info.gender = extractGender(idNumber);
    info.citizenship = extractCitizenship(idNumber);
    info.isLegacy = isLegacyId(idNumber);
    info.raceIndicator = sanitizeNumber(idNumber)[RACE_INDICATOR_INDEX];
    return info;
}

} // namespace zaid::validation
