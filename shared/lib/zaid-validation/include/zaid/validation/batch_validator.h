/**
 * @file batch_validator.h
 * @brief Validation of many IDs in one call
 *
 * Results are keyed by the ORIGINAL input string, so "80-01-01 5009-087"
 * and "8001015009087" produce two entries. Repeated keys collapse to one
 * entry (last write wins; the outcome is identical anyway since validation
 * is deterministic). Elements that are not strings are skipped.
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <variant>
#include <vector>
#include <json/json.h>
#include "types.h"

namespace zaid::validation {

/// @brief Loosely typed batch element (e.g., decoded from a spreadsheet column)
using BatchItem = std::variant<std::nullptr_t, bool, int64_t, double, std::string>;

/**
 * @brief Validate a list of ID strings
 */
BatchResult batchValidate(const std::vector<std::string>& idNumbers);

/**
 * @brief Validate the string elements of a mixed list; other elements are skipped
 */
BatchResult batchValidate(const std::vector<BatchItem>& items);

/**
 * @brief Validate the string elements of a JSON array; other elements are skipped
 *
 * A non-array value (including null) yields an empty result.
 */
BatchResult batchValidate(const Json::Value& idNumbers);

/**
 * @brief Parse a JSON array document and validate its string elements
 *
 * @param jsonText e.g. ["8001015009087", 123, "800101500908"]
 * @throws common::ParsingException if the text is not valid JSON or its
 *         root is not an array
 */
BatchResult batchValidateJson(const std::string& jsonText);

} // namespace zaid::validation
