/**
 * @file date_validator.cpp
 * @brief Date-of-birth check implementation
 */

#include "zaid/validation/date_validator.h"
#include "zaid/validation/types.h"
#include "zaid/utils/string_utils.h"
#include "zaid/utils/time_utils.h"

namespace zaid::validation {

bool isValidDateForCentury(const std::string& yymmdd, const std::string& century) {
    if (yymmdd.size() != DATE_LENGTH || century.size() != 2) {
        return false;
    }
    return utils::isValidCompactDate(century + yymmdd);
}

bool isValidIdDate(const std::string& yymmdd) {
    if (yymmdd.size() != DATE_LENGTH || !utils::isAllAsciiDigits(yymmdd)) {
        return false;
    }

    for (const char* century : CENTURY_PREFIXES) {
        if (isValidDateForCentury(yymmdd, century)) {
            return true;
        }
    }
    return false;
}

bool isValidDateInId(const std::string& number) {
    if (number.size() < DATE_LENGTH) {
        return false;
    }
    return isValidIdDate(number.substr(DATE_OFFSET, DATE_LENGTH));
}

} // namespace zaid::validation
