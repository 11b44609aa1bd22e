/**
 * @file pesel_error.h
 * @brief Error taxonomy for PESEL parsing and generation
 *
 * A PeselError is plain data: one of four kinds plus a fixed message.
 * It is returned inside PeselResult, never thrown.
 */

#pragma once

#include "types.h"

#include <ostream>
#include <string>

namespace pesel::codec {

class PeselError {
public:
    explicit PeselError(ErrorKind kind);

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    bool operator==(const PeselError& other) const { return kind_ == other.kind_; }
    bool operator!=(const PeselError& other) const { return !(*this == other); }

    /// @brief Fixed human-readable message for a kind
    static std::string messageFor(ErrorKind kind);

private:
    ErrorKind kind_;
    std::string message_;
};

std::ostream& operator<<(std::ostream& os, const PeselError& error);

} // namespace pesel::codec
