/**
 * @file structure_validator.cpp
 * @brief Structural check implementation
 */

#include "zaid/validation/structure_validator.h"

namespace zaid::validation {

bool isValidCitizenshipDigit(const std::string& number) {
    if (number.size() <= CITIZENSHIP_INDEX) {
        return false;
    }

    const char c = number[CITIZENSHIP_INDEX];
    return c == '0' || c == '1' || c == '2';
}

StructureCheckResult validateStructure(const std::string& digits) {
    StructureCheckResult result;

    // Length first: the citizenship check indexes position 10
    if (digits.size() != ID_LENGTH) {
        result.error = StructuralError::WRONG_LENGTH;
        return result;
    }

    if (!isValidCitizenshipDigit(digits)) {
        result.error = StructuralError::INVALID_CITIZENSHIP_DIGIT;
        return result;
    }

    result.digits = digits;
    return result;
}

} // namespace zaid::validation
