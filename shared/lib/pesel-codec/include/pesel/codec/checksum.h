/**
 * @file checksum.h
 * @brief PESEL check digit
 *
 * Weights 9-7-3-1 repeat over the first ten digits; the check digit is the
 * weighted sum modulo 10.
 */

#pragma once

#include <array>
#include <string_view>

namespace pesel::codec {

/// @brief Weights applied to digits 0..9
constexpr std::array<int, 10> CHECKSUM_WEIGHTS = {9, 7, 3, 1, 9, 7, 3, 1, 9, 7};

/**
 * @brief Compute the check digit of a PESEL prefix
 *
 * Only the first ten characters are read, so a full 11-digit PESEL may be
 * passed as well.
 *
 * @param digits At least ten ASCII digits
 * @return Check digit 0-9
 * @throws std::invalid_argument if fewer than ten characters are given or
 *         one of the first ten is not a digit
 */
int computeChecksum(std::string_view digits);

} // namespace pesel::codec
