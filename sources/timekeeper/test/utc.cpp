#include <gtest/gtest.h>

#include "utc_test.hpp"

using namespace tk;

TEST(LeapYearTest, Gregorian) {
    EXPECT_TRUE(IsLeapYear(2020));
    EXPECT_TRUE(IsLeapYear(2000));
    EXPECT_TRUE(IsLeapYear(1600));
    EXPECT_FALSE(IsLeapYear(2021));
    EXPECT_FALSE(IsLeapYear(1900));
    EXPECT_FALSE(IsLeapYear(2100));
}

TEST(LeapYearTest, Proleptic) {
    EXPECT_TRUE(IsLeapYear(0));
    EXPECT_TRUE(IsLeapYear(-4));
    EXPECT_TRUE(IsLeapYear(-400));
    EXPECT_FALSE(IsLeapYear(-1));
    EXPECT_FALSE(IsLeapYear(-100));
}

TEST(LeapYearTest, DaysInMonth) {
    EXPECT_EQ(DaysInMonth(2020, 2), 29);
    EXPECT_EQ(DaysInMonth(2021, 2), 28);
    EXPECT_EQ(DaysInMonth(1900, 2), 28);
    EXPECT_EQ(DaysInMonth(2021, 1), 31);
    EXPECT_EQ(DaysInMonth(2021, 4), 30);
    EXPECT_EQ(DaysInMonth(2021, 12), 31);
}

TEST(UtcCreateTest, Fields) {
    Utc utc = NewUtc(2017, 12, 25, 1, 2, 14, 123);
    EXPECT_EQ(utc.year(), 2017);
    EXPECT_EQ(utc.month(), 12);
    EXPECT_EQ(utc.day(), 25);
    EXPECT_EQ(utc.hour(), 1);
    EXPECT_EQ(utc.minute(), 2);
    EXPECT_EQ(utc.second(), 14);
    EXPECT_EQ(utc.nanos(), 123);
    EXPECT_FALSE(utc.isLeapSecond());
}

TEST(UtcCreateTest, DefaultIsEpoch) {
    EXPECT_EQ(Utc(), NewUtc(1900, 1, 1));
}

TEST(UtcCreateTest, LeapDay) {
    Utc result;
    EXPECT_EQ(Utc::create(2020, 2, 29, 0, 0, 0, 0, &result), TkStatusSuccess);
    EXPECT_EQ(Utc::create(2000, 2, 29, 0, 0, 0, 0, &result), TkStatusSuccess);
    EXPECT_EQ(Utc::create(2021, 2, 29, 0, 0, 0, 0, &result), TkStatusCarry);
    EXPECT_EQ(Utc::create(1900, 2, 29, 0, 0, 0, 0, &result), TkStatusCarry);
    EXPECT_EQ(Utc::create(2020, 2, 30, 0, 0, 0, 0, &result), TkStatusCarry);
}

TEST(UtcCreateTest, RejectsOutOfRange) {
    Utc result;
    EXPECT_EQ(Utc::create(2021, 13, 1, 0, 0, 0, 0, &result), TkStatusCarry);
    EXPECT_EQ(Utc::create(2021, 0, 1, 0, 0, 0, 0, &result), TkStatusCarry);
    EXPECT_EQ(Utc::create(2021, 1, 0, 0, 0, 0, 0, &result), TkStatusCarry);
    EXPECT_EQ(Utc::create(2021, 1, 32, 0, 0, 0, 0, &result), TkStatusCarry);
    EXPECT_EQ(Utc::create(2021, 4, 31, 0, 0, 0, 0, &result), TkStatusCarry);
    EXPECT_EQ(Utc::create(2021, 1, 1, 24, 0, 0, 0, &result), TkStatusCarry);
    EXPECT_EQ(Utc::create(2021, 1, 1, 0, 60, 0, 0, &result), TkStatusCarry);
    EXPECT_EQ(Utc::create(2021, 1, 1, 0, 0, 60, 0, &result), TkStatusCarry);
    EXPECT_EQ(Utc::create(2021, 1, 1, 0, 0, 61, 0, &result), TkStatusCarry);
    EXPECT_EQ(Utc::create(2021, 1, 1, 0, 0, 0, kNanosPerSecond, &result), TkStatusCarry);
}

TEST(UtcCreateTest, ResultUntouchedOnFailure) {
    Utc result = NewUtc(2017, 12, 25, 1, 2, 14);
    Utc copy = result;

    EXPECT_EQ(Utc::create(2021, 2, 29, 0, 0, 0, 0, &result), TkStatusCarry);
    EXPECT_EQ(result, copy);
}

TEST(UtcCreateTest, DecemberLeapSecond) {
    Utc result;
    ASSERT_EQ(Utc::create(1971, 12, 31, 23, 59, 60, 0, &result), TkStatusSuccess);
    EXPECT_TRUE(result.isLeapSecond());

    // 1973 is listed as a january leap year
    EXPECT_EQ(Utc::create(1972, 12, 31, 23, 59, 60, 0, &result), TkStatusSuccess);
    EXPECT_EQ(Utc::create(2016, 12, 31, 23, 59, 60, 999'999'999, &result), TkStatusSuccess);

    EXPECT_EQ(Utc::create(1980, 12, 31, 23, 59, 60, 0, &result), TkStatusCarry);
    EXPECT_EQ(Utc::create(2017, 12, 31, 23, 59, 60, 0, &result), TkStatusCarry);
}

TEST(UtcCreateTest, JuneLeapSecond) {
    Utc result;
    EXPECT_EQ(Utc::create(1972, 6, 30, 23, 59, 60, 0, &result), TkStatusSuccess);
    EXPECT_EQ(Utc::create(2015, 6, 30, 23, 59, 60, 0, &result), TkStatusSuccess);
    EXPECT_EQ(Utc::create(1973, 6, 30, 23, 59, 60, 0, &result), TkStatusCarry);
}

TEST(UtcCreateTest, LeapSecondOnlyAtEndOfDay) {
    Utc result;
    EXPECT_EQ(Utc::create(2015, 6, 30, 23, 58, 60, 0, &result), TkStatusCarry);
    EXPECT_EQ(Utc::create(2015, 6, 30, 22, 59, 60, 0, &result), TkStatusCarry);
    EXPECT_EQ(Utc::create(2015, 6, 29, 23, 59, 60, 0, &result), TkStatusCarry);
    EXPECT_EQ(Utc::create(2015, 7, 1, 23, 59, 60, 0, &result), TkStatusCarry);
    EXPECT_EQ(Utc::create(2016, 12, 30, 23, 59, 60, 0, &result), TkStatusCarry);
}

TEST(UtcCreateTest, NegativeYears) {
    Utc result;
    EXPECT_EQ(Utc::create(-44, 3, 15, 12, 0, 0, 0, &result), TkStatusSuccess);
    EXPECT_EQ(Utc::create(-4, 2, 29, 0, 0, 0, 0, &result), TkStatusSuccess);
    EXPECT_EQ(Utc::create(-1, 2, 29, 0, 0, 0, 0, &result), TkStatusCarry);
}

TEST(UtcCreateTest, UtcOffset) {
    EXPECT_EQ(Utc::utcOffset(), (Offset { 0, 0, Era::ePresent }));
    EXPECT_EQ(Utc::utcOffset().asDuration(), Duration());
}

TEST(UtcOrderTest, CalendarOrder) {
    EXPECT_LT(NewUtc(1971, 12, 31, 23, 59, 59), NewUtc(1971, 12, 31, 23, 59, 60));
    EXPECT_LT(NewUtc(1971, 12, 31, 23, 59, 60), NewUtc(1972, 1, 1));
    EXPECT_LT(NewUtc(1899, 12, 31), NewUtc(1900, 1, 1));
    EXPECT_LT(NewUtc(2000, 1, 1, 0, 0, 0, 1), NewUtc(2000, 1, 1, 0, 0, 1, 0));
    EXPECT_EQ(NewUtc(2000, 1, 1), NewUtc(2000, 1, 1));
}

TEST(UtcOrderDeathTest, DaysInMonthInvalidMonth) {
    EXPECT_DEATH({
        (void)DaysInMonth(2000, 13);
    }, "month out of range");
}
