/**
 * @file checksum.cpp
 * @brief PESEL check digit implementation
 */

#include "pesel/codec/checksum.h"

#include <stdexcept>
#include <string>

namespace pesel::codec {

int computeChecksum(std::string_view digits) {
    if (digits.size() < CHECKSUM_WEIGHTS.size()) {
        throw std::invalid_argument(
            "Checksum needs " + std::to_string(CHECKSUM_WEIGHTS.size()) +
            " digits, got " + std::to_string(digits.size()));
    }

    // Widest case is all nines: 504
    int sum = 0;
    for (std::size_t i = 0; i < CHECKSUM_WEIGHTS.size(); ++i) {
        char c = digits[i];
        if (c < '0' || c > '9') {
            throw std::invalid_argument(
                "Non-digit at position " + std::to_string(i) + " of checksum input");
        }
        sum += CHECKSUM_WEIGHTS[i] * (c - '0');
    }

    return sum % 10;
}

} // namespace pesel::codec
