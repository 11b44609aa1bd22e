/**
 * @file types.h
 * @brief Common types for the PESEL codec library
 *
 * Shared enums and small value structs used across all codec modules.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>

namespace pesel::codec {

/// @brief Number of characters in a PESEL
constexpr std::size_t PESEL_LENGTH = 11;

/// @brief Supported birth year range (inclusive)
constexpr int MIN_BIRTH_YEAR = 1800;
constexpr int MAX_BIRTH_YEAR = 2299;

/// @brief Biological sex encoded by the parity of digit 9
enum class Sex {
    Male,    ///< Odd sex digit
    Female   ///< Even sex digit
};

/// @brief Failure reasons reported by parse and generate
enum class ErrorKind {
    SizeError,      ///< Input length is not 11
    BadFormat,      ///< Input contains a non-digit character
    DoBOutOfRange,  ///< Month code in no century band, or year outside 1800-2299
    InvalidDoB      ///< Day above 31, or not a real calendar date
};

/// @brief How strictly parse checks the encoded calendar date
enum class DatePolicy {
    Strict,     ///< Reject dates that do not exist (e.g. 30 February)
    Permissive  ///< Only enforce the century band, year range and day <= 31
};

/// @brief Decoded date of birth
struct BirthDate {
    int year = 0;
    int month = 0;
    int day = 0;

    /// @brief "YYYY-MM-DD"
    std::string toString() const;

    bool operator==(const BirthDate& other) const {
        return year == other.year && month == other.month && day == other.day;
    }
    bool operator!=(const BirthDate& other) const {
        return !(*this == other);
    }
};

std::ostream& operator<<(std::ostream& os, const BirthDate& date);

/// @brief Convert Sex to its display name ("male" / "female")
inline std::string sexToString(Sex s) {
    switch (s) {
        case Sex::Male:   return "male";
        case Sex::Female: return "female";
    }
    return "unknown";
}

/// @brief Convert ErrorKind to string
inline std::string toString(ErrorKind k) {
    switch (k) {
        case ErrorKind::SizeError:     return "SizeError";
        case ErrorKind::BadFormat:     return "BadFormat";
        case ErrorKind::DoBOutOfRange: return "DoBOutOfRange";
        case ErrorKind::InvalidDoB:    return "InvalidDoB";
    }
    return "UNKNOWN";
}

/// @brief Convert DatePolicy to string
inline std::string datePolicyToString(DatePolicy p) {
    switch (p) {
        case DatePolicy::Strict:     return "strict";
        case DatePolicy::Permissive: return "permissive";
    }
    return "unknown";
}

/**
 * @brief Parse a DatePolicy name (case-insensitive)
 * @return std::nullopt for anything but "strict" or "permissive"
 */
std::optional<DatePolicy> datePolicyFromString(const std::string& name);

} // namespace pesel::codec
