/**
 * @file calendar.h
 * @brief Gregorian calendar checks and PESEL century bands
 *
 * The month field of a PESEL carries the century as an offset in steps of
 * 20 on top of the calendar month:
 *   01-12 -> 1900s, 21-32 -> 2000s, 41-52 -> 2100s, 61-72 -> 2200s,
 *   81-92 -> 1800s.
 */

#pragma once

#include <optional>

namespace pesel::codec {

/**
 * @brief Check if year is leap year (Gregorian rules)
 */
bool isLeapYear(int year);

/**
 * @brief Get number of days in month
 * @param year Year number
 * @param month Month number (1-12)
 * @return Number of days in month, or 0 for a month outside 1-12
 */
int daysInMonth(int year, int month);

/**
 * @brief Check that (year, month, day) names a real calendar date
 */
bool isValidDate(int year, int month, int day);

/**
 * @brief Century base year for an encoded month field
 * @param monthCode Two-digit month field (0-99)
 * @return 1800, 1900, 2000, 2100 or 2200; std::nullopt if the code lies
 *         in no century band
 */
std::optional<int> centuryBase(int monthCode);

/**
 * @brief Offset added to the calendar month for a given birth year
 * @return 80, 0, 20, 40 or 60; std::nullopt outside 1800-2299
 */
std::optional<int> monthOffset(int year);

/**
 * @brief Calendar month (1-12) of an encoded month field
 */
inline int calendarMonth(int monthCode) {
    return monthCode % 20;
}

} // namespace pesel::codec
