/**
 * @file string_utils.cpp
 * @brief Common string utility functions implementation
 */

#include "zaid/utils/string_utils.h"
#include <algorithm>
#include <iterator>

namespace zaid {
namespace utils {

bool isAllAsciiDigits(const std::string& str) {
    return std::all_of(str.begin(), str.end(), isAsciiDigit);
}

std::string keepAsciiDigits(const std::string& str) {
    std::string result;
    result.reserve(str.size());
    std::copy_if(str.begin(), str.end(), std::back_inserter(result), isAsciiDigit);
    return result;
}

std::optional<int> parseDigits(const std::string& digits) {
    // 9 digits always fit in a 32-bit int
    if (digits.empty() || digits.size() > 9 || !isAllAsciiDigits(digits)) {
        return std::nullopt;
    }

    int value = 0;
    for (char c : digits) {
        value = value * 10 + (c - '0');
    }
    return value;
}

} // namespace utils
} // namespace zaid
