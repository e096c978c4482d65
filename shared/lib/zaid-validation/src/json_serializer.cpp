/**
 * @file json_serializer.cpp
 * @brief JSON serialization implementation
 */

#include "zaid/validation/json_serializer.h"

namespace zaid::validation {

Json::Value toJson(const ExtractedInfo& info) {
    Json::Value json(Json::objectValue);

    json["valid"] = info.valid;

    if (info.dateComponents) {
        Json::Value date(Json::objectValue);
        date["year"] = info.dateComponents->year;
        date["month"] = info.dateComponents->month;
        date["day"] = info.dateComponents->day;
        json["date_components"] = date;
    } else {
        json["date_components"] = Json::Value(Json::nullValue);
    }

    json["gender"] = info.gender ? Json::Value(genderToString(*info.gender)) : Json::Value(Json::nullValue);
    json["citizenship"] = info.citizenship
        ? Json::Value(citizenshipToString(*info.citizenship))
        : Json::Value(Json::nullValue);
    json["is_legacy"] = info.isLegacy;
    json["race_indicator"] = info.raceIndicator
        ? Json::Value(std::string(1, *info.raceIndicator))
        : Json::Value(Json::nullValue);

    return json;
}

Json::Value toJson(const BatchResult& results) {
    Json::Value json(Json::objectValue);
    for (const auto& [idNumber, outcome] : results) {
        json[idNumber] = validationOutcomeToString(outcome);
    }
    return json;
}

} // namespace zaid::validation
