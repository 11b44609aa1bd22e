/**
 * @file calendar.cpp
 * @brief Calendar and century band implementation
 */

#include "pesel/codec/calendar.h"
#include "pesel/codec/types.h"

namespace pesel::codec {

bool isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
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

bool isValidDate(int year, int month, int day) {
    return day >= 1 && day <= daysInMonth(year, month);
}

std::optional<int> centuryBase(int monthCode) {
    // A band holds months 1-12 only; 0, 13-20, 33-40, ... are unassigned
    int month = calendarMonth(monthCode);
    if (monthCode < 0 || month < 1 || month > 12) {
        return std::nullopt;
    }

    switch (monthCode / 20) {
        case 0: return 1900;
        case 1: return 2000;
        case 2: return 2100;
        case 3: return 2200;
        case 4: return 1800;
        default: return std::nullopt;
    }
}

std::optional<int> monthOffset(int year) {
    if (year < MIN_BIRTH_YEAR || year > MAX_BIRTH_YEAR) {
        return std::nullopt;
    }

    switch (year / 100) {
        case 18: return 80;
        case 19: return 0;
        case 20: return 20;
        case 21: return 40;
        case 22: return 60;
        default: return std::nullopt;
    }
}

} // namespace pesel::codec
