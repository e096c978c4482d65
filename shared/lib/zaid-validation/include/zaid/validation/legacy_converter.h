/**
 * @file legacy_converter.h
 * @brief Legacy-to-modern race indicator conversion
 */

#pragma once

#include <optional>
#include <string>
#include "types.h"

namespace zaid::validation {

/**
 * @brief Rewrite a legacy ID (race indicator 0-7) in modern form
 *
 * Position 11 is replaced by targetIndicator and the check digit is
 * recomputed. Already-modern IDs (8 or 9) are returned unchanged in
 * sanitized form.
 *
 * @param idNumber ID to convert (formatting characters allowed)
 * @param targetIndicator Modern indicator, 8 or 9
 * @return Converted 13-digit ID, or std::nullopt if targetIndicator is not
 *         8/9 or the ID does not validate as VALID
 */
std::optional<std::string> convertLegacyToModern(
    const std::string& idNumber,
    int targetIndicator = DEFAULT_MODERN_INDICATOR);

} // namespace zaid::validation
