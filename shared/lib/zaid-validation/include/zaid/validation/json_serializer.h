/**
 * @file json_serializer.h
 * @brief JSON views of validation results (jsoncpp)
 */

#pragma once

#include <json/json.h>
#include "types.h"

namespace zaid::validation {

/**
 * @brief Serialize decoded ID fields
 *
 * Keys: valid, date_components ({year, month, day} or null), gender,
 * citizenship, is_legacy, race_indicator (one-character string or null).
 */
Json::Value toJson(const ExtractedInfo& info);

/**
 * @brief Serialize batch results as {original input: outcome string}
 */
Json::Value toJson(const BatchResult& results);

} // namespace zaid::validation
