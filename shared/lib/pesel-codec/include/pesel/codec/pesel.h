/**
 * @file pesel.h
 * @brief PESEL value type: parsing, generation and rendering
 *
 * Layout of the 11 digits:
 *   0-1  year of birth (low two digits)
 *   2-3  month of birth plus century offset (see calendar.h)
 *   4-5  day of birth
 *   6-8  filler, opaque
 *   9    sex (odd = male, even = female)
 *   10   check digit (see checksum.h)
 *
 * A Pesel is immutable. Both parse() and generate() end in the same
 * validating constructor path, so every instance satisfies the same
 * invariants. A checksum mismatch does not reject a parse: numbers that
 * fail the check digit were issued in practice, so the mismatch is only
 * reported through isValid().
 */

#pragma once

#include "pesel_error.h"
#include "random_source.h"
#include "types.h"

#include <json/json.h>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace pesel::codec {

class PeselResult;

/// @brief Options for Pesel::parse
struct ParseOptions {
    DatePolicy datePolicy = DatePolicy::Strict;
};

class Pesel {
public:
    /**
     * @brief Parse an 11-digit PESEL
     *
     * Checks run in order, first failure wins: length (SizeError), digits
     * only (BadFormat), century band and year range (DoBOutOfRange),
     * day <= 31 and, under DatePolicy::Strict, a real calendar date
     * (InvalidDoB).
     */
    static PeselResult parse(std::string_view text, const ParseOptions& options = ParseOptions{});

    /**
     * @brief Parse or throw
     * @throws pesel::common::ParsingException if parse() fails
     */
    static Pesel of(std::string_view text, const ParseOptions& options = ParseOptions{});

    /**
     * @brief Synthesize a PESEL with a correct check digit
     *
     * Filler digits and the particular sex digit are drawn from @p random:
     * three draws of uniform(10) for positions 6-8, then one uniform(5)
     * selecting among the five digits of the requested parity.
     *
     * @return DoBOutOfRange for a year outside 1800-2299, InvalidDoB for a
     *         date that does not exist; otherwise a Pesel with isValid()
     */
    static PeselResult generate(int year, int month, int day, Sex sex, IRandomSource& random);

    /// @brief generate() with an OpenSslRandomSource
    static PeselResult generate(int year, int month, int day, Sex sex);

    [[nodiscard]] bool isValid() const noexcept { return valid_; }
    [[nodiscard]] Sex sex() const noexcept { return sexDigit_ % 2 != 0 ? Sex::Male : Sex::Female; }
    [[nodiscard]] bool isMale() const noexcept { return sex() == Sex::Male; }
    [[nodiscard]] bool isFemale() const noexcept { return sex() == Sex::Female; }
    [[nodiscard]] std::string sexName() const { return sexToString(sex()); }

    [[nodiscard]] BirthDate birthDate() const;

    /// @brief "YYYY-MM-DD"
    [[nodiscard]] std::string dateOfBirth() const { return birthDate().toString(); }

    [[nodiscard]] const std::string& raw() const noexcept { return raw_; }

    // Stored digit fields
    [[nodiscard]] int yearLow() const noexcept { return yearLow_; }
    [[nodiscard]] int monthCode() const noexcept { return monthCode_; }
    [[nodiscard]] int day() const noexcept { return day_; }
    [[nodiscard]] int sexDigit() const noexcept { return sexDigit_; }
    [[nodiscard]] int checksumDigit() const noexcept { return checksumDigit_; }

    /**
     * @brief Decoded fields as JSON
     *
     * Keys: pesel, dateOfBirth, birthYear, birthMonth, birthDay, sex, valid
     */
    [[nodiscard]] Json::Value toJson() const;

    bool operator==(const Pesel& other) const { return raw_ == other.raw_; }
    bool operator!=(const Pesel& other) const { return !(*this == other); }

private:
    Pesel(std::string raw, int yearLow, int monthCode, int day,
          int sexDigit, int checksumDigit, bool valid);

    std::string raw_;
    int yearLow_;
    int monthCode_;
    int day_;
    int sexDigit_;
    int checksumDigit_;
    bool valid_;
};

/// @brief Four-line rendering: PESEL, date of birth, gender, valid
std::ostream& operator<<(std::ostream& os, const Pesel& pesel);

/**
 * @brief Outcome of Pesel::parse / Pesel::generate
 *
 * Holds exactly one of a Pesel or a PeselError.
 */
class PeselResult {
public:
    static PeselResult success(Pesel pesel) { return PeselResult(std::move(pesel)); }
    static PeselResult failure(PeselError error) { return PeselResult(std::move(error)); }

    [[nodiscard]] bool ok() const noexcept { return pesel_.has_value(); }
    explicit operator bool() const noexcept { return ok(); }

    /// @throws pesel::common::ParsingException if the result holds an error
    [[nodiscard]] const Pesel& value() const;

    /// @throws std::logic_error if the result holds a Pesel
    [[nodiscard]] const PeselError& error() const;

private:
    explicit PeselResult(Pesel pesel) : pesel_(std::move(pesel)) {}
    explicit PeselResult(PeselError error) : error_(std::move(error)) {}

    std::optional<Pesel> pesel_;
    std::optional<PeselError> error_;
};

} // namespace pesel::codec
