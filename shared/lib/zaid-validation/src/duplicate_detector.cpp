/**
 * @file duplicate_detector.cpp
 * @brief Duplicate-collision detection implementation
 */

#include "zaid/validation/duplicate_detector.h"
#include "zaid/validation/sanitizer.h"
#include "zaid/validation/types.h"

namespace zaid::validation {

bool wouldBeDuplicates(const std::string& firstId, const std::string& secondId) {
    const std::string first = sanitizeNumber(firstId);
    const std::string second = sanitizeNumber(secondId);

    if (first.size() != ID_LENGTH || second.size() != ID_LENGTH) {
        return false;
    }

    // Date + sequence + citizenship
    return first.compare(0, RACE_INDICATOR_INDEX, second, 0, RACE_INDICATOR_INDEX) == 0;
}

} // namespace zaid::validation
