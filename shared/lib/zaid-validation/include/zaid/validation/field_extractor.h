/**
 * @file field_extractor.h
 * @brief Decoding of the fields carried by an ID number
 *
 * Every extractor sanitizes its input and checks the length itself; none
 * assumes a pre-validated ID. Apart from extractDateComponents (date gate)
 * and extractInfo (full validation), extractors do not verify the checksum.
 */

#pragma once

#include <optional>
#include <string>
#include "types.h"

namespace zaid::validation {

/**
 * @brief Gender from the sequence number (positions 6-9)
 *
 * The sequence is compared as an integer: "0499" is 499 and therefore female.
 *
 * @return FEMALE below 5000, MALE from 5000, std::nullopt unless 13 digits
 */
std::optional<Gender> extractGender(const std::string& idNumber);

/**
 * @brief Citizenship status from position 10
 *
 * @return Mapped status, std::nullopt for other digits or wrong length
 */
std::optional<Citizenship> extractCitizenship(const std::string& idNumber);

/**
 * @brief Check whether the race indicator (position 11) is a legacy value 0-7
 *
 * @return true for 0-7, false for 8-9 or wrong length
 */
bool isLegacyId(const std::string& idNumber);

/**
 * @brief Two-digit year, month and day of birth
 *
 * @return Components as zero-padded strings when the date passes the
 *         century-ambiguous date check, std::nullopt otherwise
 */
std::optional<DateComponents> extractDateComponents(const std::string& idNumber);

/**
 * @brief Decode everything at once
 *
 * Only a VALID outcome populates the derived fields; INVALID and
 * CITIZENSHIP_VIOLATION both yield valid=false with every field empty.
 */
ExtractedInfo extractInfo(const std::string& idNumber);

} // namespace zaid::validation
