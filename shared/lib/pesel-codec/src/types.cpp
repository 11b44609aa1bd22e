/**
 * @file types.cpp
 * @brief BirthDate formatting and DatePolicy lookup
 */

#include "pesel/codec/types.h"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace pesel::codec {

std::string BirthDate::toString() const {
    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(4) << year << '-'
        << std::setw(2) << month << '-'
        << std::setw(2) << day;
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const BirthDate& date) {
    return os << date.toString();
}

std::optional<DatePolicy> datePolicyFromString(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "strict") return DatePolicy::Strict;
    if (lower == "permissive") return DatePolicy::Permissive;
    return std::nullopt;
}

} // namespace pesel::codec
