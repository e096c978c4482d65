/**
 * @file id_validator.cpp
 * @brief Top-level validation state machine implementation
 */

#include "zaid/validation/id_validator.h"
#include "zaid/validation/date_validator.h"
#include "zaid/validation/luhn.h"
#include "zaid/validation/sanitizer.h"
#include "zaid/validation/structure_validator.h"

namespace zaid::validation {

ValidationOutcome validateIdNumber(const std::string& raw) {
    StructureCheckResult structure = validateStructure(sanitizeNumber(raw));

    switch (structure.error) {
        case StructuralError::WRONG_LENGTH:
            return ValidationOutcome::INVALID;
        case StructuralError::INVALID_CITIZENSHIP_DIGIT:
            return ValidationOutcome::CITIZENSHIP_VIOLATION;
        case StructuralError::NONE:
            break;
    }

    if (!isValidDateInId(structure.digits)) {
        return ValidationOutcome::INVALID;
    }

    return isValidLuhnChecksum(structure.digits)
        ? ValidationOutcome::VALID
        : ValidationOutcome::INVALID;
}

} // namespace zaid::validation
