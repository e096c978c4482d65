/**
 * @file types.h
 * @brief Common types for the South African ID validation library
 *
 * Shared enums, layout constants and result structs used across all
 * validation modules.
 *
 * ID layout (0-indexed): YYMMDD SSSS C A Z
 *   [0,6)  date of birth
 *   [6,10) sequence number (0000-4999 female, 5000-9999 male)
 *   [10]   citizenship (0 citizen, 1 permanent resident, 2 refugee)
 *   [11]   race indicator (0-7 legacy, 8-9 modern)
 *   [12]   Luhn check digit
 */

#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>

namespace zaid::validation {

/// @name ID layout
/// @{
constexpr size_t ID_LENGTH = 13;
constexpr size_t DATE_OFFSET = 0;
constexpr size_t DATE_LENGTH = 6;
constexpr size_t SEQUENCE_OFFSET = 6;
constexpr size_t SEQUENCE_LENGTH = 4;
constexpr size_t CITIZENSHIP_INDEX = 10;
constexpr size_t RACE_INDICATOR_INDEX = 11;
constexpr size_t CHECK_DIGIT_INDEX = 12;

/// Sequence numbers at or above this value encode male
constexpr int MALE_SEQUENCE_THRESHOLD = 5000;
/// Race indicator written by legacy conversion when none is given
constexpr int DEFAULT_MODERN_INDICATOR = 8;
/// @}

/// @brief Result of the top-level validation state machine
enum class ValidationOutcome {
    VALID,                  ///< Structure, date and checksum all pass
    INVALID,                ///< Wrong length, impossible date or bad checksum
    CITIZENSHIP_VIOLATION   ///< Citizenship digit not in {0,1,2}; later gates not evaluated
};

/// @brief Structural check failure
enum class StructuralError {
    NONE,
    WRONG_LENGTH,
    INVALID_CITIZENSHIP_DIGIT
};

enum class Gender {
    FEMALE,
    MALE
};

enum class Citizenship {
    SOUTH_AFRICAN_CITIZEN,
    PERMANENT_RESIDENT,
    REFUGEE
};

/// @brief Structural check result (length, then citizenship digit)
struct StructureCheckResult {
    StructuralError error = StructuralError::NONE;
    std::string digits;   ///< Checked digits; empty unless ok()

    bool ok() const { return error == StructuralError::NONE; }
};

/// @brief Raw two-digit date fields, leading zeros preserved
struct DateComponents {
    std::string year;
    std::string month;
    std::string day;

    bool operator==(const DateComponents& other) const {
        return year == other.year && month == other.month && day == other.day;
    }
};

/// @brief Everything decodable from one ID; derived fields are empty unless valid
struct ExtractedInfo {
    bool valid = false;
    std::optional<DateComponents> dateComponents;
    std::optional<Gender> gender;
    std::optional<Citizenship> citizenship;
    bool isLegacy = false;
    std::optional<char> raceIndicator;
};

/// @brief Batch results keyed by the original, unsanitized input
using BatchResult = std::map<std::string, ValidationOutcome>;

/// @brief Convert ValidationOutcome to string
inline std::string validationOutcomeToString(ValidationOutcome o) {
    switch (o) {
        case ValidationOutcome::VALID:                 return "VALID";
        case ValidationOutcome::INVALID:               return "INVALID";
        case ValidationOutcome::CITIZENSHIP_VIOLATION: return "CITIZENSHIP_VIOLATION";
    }
    return "UNKNOWN";
}

/// @brief Convert StructuralError to string
inline std::string structuralErrorToString(StructuralError e) {
    switch (e) {
        case StructuralError::NONE:                      return "NONE";
        case StructuralError::WRONG_LENGTH:              return "WRONG_LENGTH";
        case StructuralError::INVALID_CITIZENSHIP_DIGIT: return "INVALID_CITIZENSHIP_DIGIT";
    }
    return "UNKNOWN";
}

/// @brief Convert Gender to string ("female" / "male")
inline std::string genderToString(Gender g) {
    switch (g) {
        case Gender::FEMALE: return "female";
        case Gender::MALE:   return "male";
    }
    return "unknown";
}

/// @brief Convert Citizenship to string
inline std::string citizenshipToString(Citizenship c) {
    switch (c) {
        case Citizenship::SOUTH_AFRICAN_CITIZEN: return "south_african_citizen";
        case Citizenship::PERMANENT_RESIDENT:    return "permanent_resident";
        case Citizenship::REFUGEE:               return "refugee";
    }
    return "unknown";
}

} // namespace zaid::validation
