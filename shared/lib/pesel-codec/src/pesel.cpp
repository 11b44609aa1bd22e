/**
 * @file pesel.cpp
 * @brief Pesel parsing, generation and rendering
 */

#include "pesel/codec/pesel.h"
#include "pesel/codec/calendar.h"
#include "pesel/codec/checksum.h"
#include "exceptions.h"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace pesel::codec {

namespace {

constexpr std::size_t SEX_DIGIT_POS = 9;
constexpr std::size_t CHECKSUM_DIGIT_POS = 10;
constexpr int FILLER_DIGITS = 3;
constexpr int MAX_DAY_FIELD = 31;

bool isAsciiDigit(char c) {
    return c >= '0' && c <= '9';
}

int digitAt(std::string_view text, std::size_t pos) {
    return text[pos] - '0';
}

int twoDigitsAt(std::string_view text, std::size_t pos) {
    return digitAt(text, pos) * 10 + digitAt(text, pos + 1);
}

PeselResult reject(ErrorKind kind, const char* stage) {
    spdlog::debug("[Pesel] {} rejected: {}", stage, toString(kind));
    return PeselResult::failure(PeselError(kind));
}

// Injected sources are not trusted to stay in range
int draw(IRandomSource& random, int bound) {
    int value = random.uniform(bound);
    if (value < 0 || value >= bound) {
        throw common::RandomSourceException(
            "uniform(" + std::to_string(bound) + ") returned " + std::to_string(value));
    }
    return value;
}

} // anonymous namespace

// ==========================================================================
// Construction
// ==========================================================================

Pesel::Pesel(std::string raw, int yearLow, int monthCode, int day,
             int sexDigit, int checksumDigit, bool valid)
    : raw_(std::move(raw)),
      yearLow_(yearLow),
      monthCode_(monthCode),
      day_(day),
      sexDigit_(sexDigit),
      checksumDigit_(checksumDigit),
      valid_(valid) {}

PeselResult Pesel::parse(std::string_view text, const ParseOptions& options) {
    if (text.size() != PESEL_LENGTH) {
        return reject(ErrorKind::SizeError, "parse");
    }
    if (!std::all_of(text.begin(), text.end(), isAsciiDigit)) {
        return reject(ErrorKind::BadFormat, "parse");
    }

    const int yearLow = twoDigitsAt(text, 0);
    const int monthCode = twoDigitsAt(text, 2);
    const int day = twoDigitsAt(text, 4);
    const int sexDigit = digitAt(text, SEX_DIGIT_POS);
    const int checksumDigit = digitAt(text, CHECKSUM_DIGIT_POS);

    auto base = centuryBase(monthCode);
    if (!base) {
        return reject(ErrorKind::DoBOutOfRange, "parse");
    }

    const int year = *base + yearLow;
    if (year < MIN_BIRTH_YEAR || year > MAX_BIRTH_YEAR) {
        return reject(ErrorKind::DoBOutOfRange, "parse");
    }

    if (day > MAX_DAY_FIELD) {
        return reject(ErrorKind::InvalidDoB, "parse");
    }
    if (options.datePolicy == DatePolicy::Strict &&
        !isValidDate(year, calendarMonth(monthCode), day)) {
        return reject(ErrorKind::InvalidDoB, "parse");
    }

    const bool valid = computeChecksum(text) == checksumDigit;
    if (!valid) {
        spdlog::debug("[Pesel] Check digit mismatch, accepted as not valid");
    }

    return PeselResult::success(
        Pesel(std::string(text), yearLow, monthCode, day, sexDigit, checksumDigit, valid));
}

Pesel Pesel::of(std::string_view text, const ParseOptions& options) {
    return parse(text, options).value();
}

PeselResult Pesel::generate(int year, int month, int day, Sex sex, IRandomSource& random) {
    auto offset = monthOffset(year);
    if (!offset) {
        return reject(ErrorKind::DoBOutOfRange, "generate");
    }
    if (!isValidDate(year, month, day)) {
        return reject(ErrorKind::InvalidDoB, "generate");
    }

    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(2) << year % 100
        << std::setw(2) << month + *offset
        << std::setw(2) << day;

    for (int i = 0; i < FILLER_DIGITS; ++i) {
        oss << draw(random, 10);
    }

    // Five candidates per parity: 0,2,4,6,8 or 1,3,5,7,9
    oss << 2 * draw(random, 5) + (sex == Sex::Male ? 1 : 0);

    std::string digits = oss.str();
    digits.push_back(static_cast<char>('0' + computeChecksum(digits)));

    spdlog::debug("[Pesel] Generated number for {}-{:02}-{:02} ({})",
                  year, month, day, sexToString(sex));

    return parse(digits);
}

PeselResult Pesel::generate(int year, int month, int day, Sex sex) {
    OpenSslRandomSource random;
    return generate(year, month, day, sex, random);
}

// ==========================================================================
// Accessors and rendering
// ==========================================================================

BirthDate Pesel::birthDate() const {
    auto base = centuryBase(monthCode_);
    if (!base) {
        // Unreachable: parse() rejects month codes outside every band
        throw std::logic_error("Pesel holds month code " + std::to_string(monthCode_) +
                               " outside every century band");
    }

    BirthDate date;
    date.year = *base + yearLow_;
    date.month = calendarMonth(monthCode_);
    date.day = day_;
    return date;
}

Json::Value Pesel::toJson() const {
    BirthDate date = birthDate();

    Json::Value result;
    result["pesel"] = raw_;
    result["dateOfBirth"] = date.toString();
    result["birthYear"] = date.year;
    result["birthMonth"] = date.month;
    result["birthDay"] = date.day;
    result["sex"] = sexName();
    result["valid"] = valid_;
    return result;
}

std::ostream& operator<<(std::ostream& os, const Pesel& pesel) {
    return os << "PESEL: " << pesel.raw() << '\n'
              << "date of birth: " << pesel.dateOfBirth() << '\n'
              << "gender: " << pesel.sexName() << '\n'
              << "valid: " << std::boolalpha << pesel.isValid() << std::noboolalpha;
}

// ==========================================================================
// PeselResult
// ==========================================================================

const Pesel& PeselResult::value() const {
    if (!pesel_) {
        throw common::ParsingException(error_ ? error_->message() : "empty result");
    }
    return *pesel_;
}

const PeselError& PeselResult::error() const {
    if (!error_) {
        throw std::logic_error("PeselResult holds a Pesel, not an error");
    }
    return *error_;
}

} // namespace pesel::codec
