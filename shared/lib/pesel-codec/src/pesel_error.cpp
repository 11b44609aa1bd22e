/**
 * @file pesel_error.cpp
 * @brief PeselError messages
 */

#include "pesel/codec/pesel_error.h"

namespace pesel::codec {

PeselError::PeselError(ErrorKind kind)
    : kind_(kind), message_(messageFor(kind)) {}

std::string PeselError::messageFor(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::SizeError:
            return "PESEL has to be " + std::to_string(PESEL_LENGTH) + " characters long";
        case ErrorKind::BadFormat:
            return "PESEL may only contain digits";
        case ErrorKind::DoBOutOfRange:
            return "Date of birth out of supported range (" + std::to_string(MIN_BIRTH_YEAR) +
                   "-" + std::to_string(MAX_BIRTH_YEAR) + ")";
        case ErrorKind::InvalidDoB:
            return "Invalid date of birth";
    }
    return "Unknown PESEL error";
}

std::ostream& operator<<(std::ostream& os, const PeselError& error) {
    return os << error.message();
}

} // namespace pesel::codec
