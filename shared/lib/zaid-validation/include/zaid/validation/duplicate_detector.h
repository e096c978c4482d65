/**
 * @file duplicate_detector.h
 * @brief Detection of IDs that collide on date, sequence and citizenship
 *
 * Two people can be issued the same first 11 digits; such collisions are
 * told apart only by the race indicator (8 vs 9), which in turn changes the
 * check digit.
 */

#pragma once

#include <string>

namespace zaid::validation {

/**
 * @brief Check whether two IDs share their first 11 digits
 *
 * Checksums are not verified.
 *
 * @return true if both sanitize to 13 digits and digits [0,11) are equal
 */
bool wouldBeDuplicates(const std::string& firstId, const std::string& secondId);

} // namespace zaid::validation
