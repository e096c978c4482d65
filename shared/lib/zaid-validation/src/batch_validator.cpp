/**
 * @file batch_validator.cpp
 * @brief Batch validation implementation
 */

#include "zaid/validation/batch_validator.h"
#include "zaid/validation/id_validator.h"
#include "exceptions.h"

#include <sstream>
#include <spdlog/spdlog.h>

namespace zaid::validation {

namespace {

void logSummary(const BatchResult& results, size_t inputCount) {
    size_t valid = 0;
    size_t citizenship = 0;
    for (const auto& [key, outcome] : results) {
        if (outcome == ValidationOutcome::VALID) valid++;
        if (outcome == ValidationOutcome::CITIZENSHIP_VIOLATION) citizenship++;
    }
    spdlog::debug("Batch validated: inputs={}, unique={}, valid={}, citizenshipViolations={}",
                  inputCount, results.size(), valid, citizenship);
}

} // namespace

BatchResult batchValidate(const std::vector<std::string>& idNumbers) {
    BatchResult results;
    for (const auto& idNumber : idNumbers) {
        results[idNumber] = validateIdNumber(idNumber);
    }
    logSummary(results, idNumbers.size());
    return results;
}

BatchResult batchValidate(const std::vector<BatchItem>& items) {
    BatchResult results;
    for (const auto& item : items) {
        const auto* idNumber = std::get_if<std::string>(&item);
        if (!idNumber) {
            continue;
        }
        results[*idNumber] = validateIdNumber(*idNumber);
    }
    logSummary(results, items.size());
    return results;
}

BatchResult batchValidate(const Json::Value& idNumbers) {
    BatchResult results;
    if (!idNumbers.isArray()) {
        return results;
    }

    for (const auto& element : idNumbers) {
        if (!element.isString()) {
            continue;
        }
        const std::string idNumber = element.asString();
        results[idNumber] = validateIdNumber(idNumber);
    }
    logSummary(results, idNumbers.size());
    return results;
}

BatchResult batchValidateJson(const std::string& jsonText) {
    Json::CharReaderBuilder reader;
    Json::Value root;
    std::istringstream iss(jsonText);
    std::string errs;

    if (!Json::parseFromStream(reader, iss, &root, &errs)) {
        spdlog::warn("Batch JSON rejected: {}", errs);
        throw common::ParsingException("batch document is not valid JSON: " + errs);
    }
    if (!root.isArray()) {
        spdlog::warn("Batch JSON rejected: root is not an array");
        throw common::ParsingException("batch document root must be an array");
    }

    return batchValidate(root);
}

} // namespace zaid::validation
