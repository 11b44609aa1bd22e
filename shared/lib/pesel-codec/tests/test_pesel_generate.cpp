/**
 * @file test_pesel_generate.cpp
 * @brief Unit tests for Pesel::generate
 *
 * Exact output strings use SequenceRandomSource; one sweep over dates uses
 * the default OpenSSL source and only asserts properties, the other replays
 * fixed draws and asserts the exact digits.
 */

#include <gtest/gtest.h>
#include <pesel/codec/calendar.h>
#include <pesel/codec/checksum.h>
#include <pesel/codec/pesel.h>
#include "exceptions.h"
#include "test_helpers.h"

#include <cstdio>
#include <string>
#include <vector>

using namespace pesel::codec;
using namespace test_helpers;

// ============================================================================
// Deterministic output
// ============================================================================

TEST(PeselGenerateTest, ExactDigits_Male1980) {
    SequenceRandomSource random{1, 2, 3, 4};
    auto result = Pesel::generate(1980, 5, 26, Sex::Male, random);
    ASSERT_TRUE(result.ok());

    // filler 1,2,3; sex digit 2*4+1 = 9; check digit 2
    EXPECT_EQ(result.value().raw(), "80052612392");
    EXPECT_TRUE(result.value().isValid());
    EXPECT_EQ(random.bounds(), (std::vector<int>{10, 10, 10, 5}));
}

TEST(PeselGenerateTest, ExactDigits_Female2000) {
    SequenceRandomSource random{0, 0, 0, 0};
    auto result = Pesel::generate(2000, 1, 1, Sex::Female, random);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().raw(), "00210100004");
    EXPECT_EQ(result.value().dateOfBirth(), "2000-01-01");
}

TEST(PeselGenerateTest, ExactDigits_CenturyEdges) {
    SequenceRandomSource first{0, 0, 0, 0};
    auto oldest = Pesel::generate(1800, 1, 1, Sex::Male, first);
    ASSERT_TRUE(oldest.ok());
    EXPECT_EQ(oldest.value().raw(), "00810100019");

    SequenceRandomSource last{9, 9, 9, 4};
    auto newest = Pesel::generate(2299, 12, 31, Sex::Female, last);
    ASSERT_TRUE(newest.ok());
    EXPECT_EQ(newest.value().raw(), "99723199984");
}

TEST(PeselGenerateTest, SexDigitCoversParity) {
    for (int index = 0; index < 5; ++index) {
        SequenceRandomSource male{0, 0, 0, index};
        EXPECT_EQ(Pesel::generate(1990, 6, 15, Sex::Male, male).value().sexDigit(), 2 * index + 1);

        SequenceRandomSource female{0, 0, 0, index};
        EXPECT_EQ(Pesel::generate(1990, 6, 15, Sex::Female, female).value().sexDigit(), 2 * index);
    }
}

// ============================================================================
// Rejections
// ============================================================================

TEST(PeselGenerateTest, YearOutOfRange) {
    SequenceRandomSource random{};
    EXPECT_EQ(Pesel::generate(1799, 12, 31, Sex::Male, random).error().kind(), ErrorKind::DoBOutOfRange);
    EXPECT_EQ(Pesel::generate(2300, 1, 1, Sex::Female, random).error().kind(), ErrorKind::DoBOutOfRange);
    EXPECT_EQ(random.calls(), 0u);
}

TEST(PeselGenerateTest, NotALeapYear) {
    SequenceRandomSource random{};
    auto result = Pesel::generate(1993, 2, 29, Sex::Female, random);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind(), ErrorKind::InvalidDoB);
}

TEST(PeselGenerateTest, ImpossibleDates) {
    SequenceRandomSource random{};
    EXPECT_EQ(Pesel::generate(2000, 13, 1, Sex::Male, random).error().kind(), ErrorKind::InvalidDoB);
    EXPECT_EQ(Pesel::generate(2000, 0, 1, Sex::Male, random).error().kind(), ErrorKind::InvalidDoB);
    EXPECT_EQ(Pesel::generate(2000, 4, 31, Sex::Male, random).error().kind(), ErrorKind::InvalidDoB);
    EXPECT_EQ(Pesel::generate(2000, 4, 0, Sex::Male, random).error().kind(), ErrorKind::InvalidDoB);
}

TEST(PeselGenerateTest, YearCheckedBeforeDate) {
    SequenceRandomSource random{};
    EXPECT_EQ(Pesel::generate(2300, 2, 30, Sex::Male, random).error().kind(), ErrorKind::DoBOutOfRange);
}

TEST(PeselGenerateTest, MisbehavingSource_Throws) {
    ConstantRandomSource random(10);
    EXPECT_THROW(Pesel::generate(1990, 6, 15, Sex::Male, random), pesel::common::RandomSourceException);
}

// ============================================================================
// Properties over the supported range
// ============================================================================

TEST(PeselGenerateTest, RoundTrip_AcrossRange) {
    std::vector<int> years = {1800, 1899, 1900, 1999, 2000, 2099, 2100, 2199, 2200, 2299};
    for (int year = 1801; year < 2299; year += 37) {
        years.push_back(year);
    }

    for (int year : years) {
        for (int month = 1; month <= 12; ++month) {
            for (int day : {1, daysInMonth(year, month)}) {
                for (Sex sex : {Sex::Male, Sex::Female}) {
                    auto result = Pesel::generate(year, month, day, sex);
                    ASSERT_TRUE(result.ok()) << year << "-" << month << "-" << day;

                    const Pesel& p = result.value();
                    EXPECT_TRUE(p.isValid()) << p.raw();
                    EXPECT_EQ(p.sex(), sex) << p.raw();
                    EXPECT_EQ(p.birthDate(), (BirthDate{year, month, day})) << p.raw();

                    Pesel reparsed = Pesel::of(p.raw());
                    EXPECT_EQ(reparsed.birthDate(), p.birthDate());
                    EXPECT_EQ(reparsed.sex(), p.sex());
                    EXPECT_EQ(reparsed.isValid(), p.isValid());
                }
            }
        }
    }
}

TEST(PeselGenerateTest, RoundTrip_ExactDigitsAcrossRange) {
    // Month code offset per century: 1800s +80, 1900s +0, 2000s +20, 2100s +40, 2200s +60
    const int offsets[] = {80, 0, 20, 40, 60};

    for (int year : {1800, 1856, 1899, 1900, 1944, 1999, 2000, 2024, 2099, 2100, 2155, 2200, 2299}) {
        for (int month = 1; month <= 12; ++month) {
            for (int day : {1, 15, daysInMonth(year, month)}) {
                for (Sex sex : {Sex::Male, Sex::Female}) {
                    const int f1 = year % 10;
                    const int f2 = month % 10;
                    const int f3 = day % 10;
                    const int index = (year + month + day) % 5;
                    const int sexDigit = 2 * index + (sex == Sex::Male ? 1 : 0);

                    char prefix[11];
                    std::snprintf(prefix, sizeof(prefix), "%02d%02d%02d%d%d%d%d",
                                  year % 100, month + offsets[year / 100 - 18], day,
                                  f1, f2, f3, sexDigit);
                    const std::string expected = prefix + std::to_string(computeChecksum(prefix));

                    SequenceRandomSource random{f1, f2, f3, index};
                    auto result = Pesel::generate(year, month, day, sex, random);
                    ASSERT_TRUE(result.ok()) << year << "-" << month << "-" << day;
                    EXPECT_EQ(result.value().raw(), expected);

                    Pesel reparsed = Pesel::of(expected);
                    EXPECT_EQ(reparsed, result.value());
                    EXPECT_TRUE(reparsed.isValid()) << expected;
                    EXPECT_EQ(reparsed.birthDate(), (BirthDate{year, month, day})) << expected;
                    EXPECT_EQ(reparsed.sex(), sex) << expected;
                    EXPECT_EQ(reparsed.sexDigit(), sexDigit) << expected;
                }
            }
        }
    }
}

TEST(PeselGenerateTest, LeapDay_Generates) {
    auto result = Pesel::generate(2000, 2, 29, Sex::Female);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().dateOfBirth(), "2000-02-29");
}
