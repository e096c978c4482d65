/**
 * @file time_utils.cpp
 * @brief Calendar utilities implementation
 */

#include "zaid/utils/time_utils.h"
#include "zaid/utils/string_utils.h"

namespace zaid {
namespace utils {

bool isLeapYear(int year) {
    if (year % 400 == 0) return true;
    if (year % 100 == 0) return false;
    return year % 4 == 0;
}

int daysInMonth(int year, int month) {
    switch (month) {
        case 1: case 3: case 5: case 7: case 8: case 10: case 12:
            return 31;
        case 4: case 6: case 9: case 11:
            return 30;
        case 2:
            return isLeapYear(year) ? 29 : 28;
        default:
            return 0;
    }
}

bool isValidCalendarDate(int year, int month, int day) {
    if (year < 1 || year > 9999) {
        return false;
    }
    if (month < 1 || month > 12) {
        return false;
    }
    return day >= 1 && day <= daysInMonth(year, month);
}

bool isValidCompactDate(const std::string& yyyymmdd) {
    if (yyyymmdd.size() != 8) {
        return false;
    }

    auto year = parseDigits(yyyymmdd.substr(0, 4));
    auto month = parseDigits(yyyymmdd.substr(4, 2));
    auto day = parseDigits(yyyymmdd.substr(6, 2));
    if (!year || !month || !day) {
        return false;
    }

    return isValidCalendarDate(*year, *month, *day);
}

} // namespace utils
} // namespace zaid
