/**
 * @file sanitizer.cpp
 * @brief Input sanitization implementation
 */

#include "zaid/validation/sanitizer.h"
#include "zaid/utils/string_utils.h"

namespace zaid::validation {

std::string sanitizeNumber(const std::string& input) {
    if (utils::isAllAsciiDigits(input)) {
        return input;
    }
    return utils::keepAsciiDigits(input);
}

} // namespace zaid::validation
