#pragma once

#include "timekeeper/format.hpp"
#include "timekeeper/instant.hpp"
#include "timekeeper/status.hpp"

#include <compare>

#include <stdint.h>

namespace tk {
    static constexpr int32_t kEpochYear = 1900;
    static constexpr int64_t kSecondsPerMinute = 60;
    static constexpr int64_t kSecondsPerHour = 60 * kSecondsPerMinute;
    static constexpr int64_t kSecondsPerDay = 24 * kSecondsPerHour;

    /// @brief Is @p year a leap year in the proleptic Gregorian calendar.
    constexpr bool IsLeapYear(int32_t year) {
        return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    }

    /// @brief The number of days in @p month of @p year.
    ///
    /// @pre @p month is in [1, 12]
    uint8_t DaysInMonth(int32_t year, uint8_t month);

    /// @brief A calendar date and time in UTC.
    ///
    /// Can only be constructed from fields that describe a real moment, see @ref create.
    /// Second 60 is accepted only during a recorded leap second.
    class Utc {
        int32_t mYear;
        uint8_t mMonth;
        uint8_t mDay;
        uint8_t mHour;
        uint8_t mMinute;
        uint8_t mSecond;
        uint32_t mNanos;

        constexpr Utc(int32_t year, uint8_t month, uint8_t day, uint8_t hour, uint8_t minute, uint8_t second, uint32_t nanos)
            : mYear(year)
            , mMonth(month)
            , mDay(day)
            , mHour(hour)
            , mMinute(minute)
            , mSecond(second)
            , mNanos(nanos)
        { }

    public:
        /// @brief The epoch, 1900-01-01T00:00:00.
        constexpr Utc()
            : Utc(kEpochYear, 1, 1, 0, 0, 0, 0)
        { }

        /// @brief Validate calendar fields and construct a date from them.
        ///
        /// Fields are never normalized, a field out of range for its unit is rejected.
        /// Hours are bounded to [0, 23], 24:00:00 must be written as 00:00:00 of the next day.
        ///
        /// @param result The date, only written on success.
        ///
        /// @retval TkStatusSuccess The fields describe a valid date.
        /// @retval TkStatusCarry A field is out of range.
        [[nodiscard]]
        static TkStatus create(int32_t year, uint8_t month, uint8_t day, uint8_t hour, uint8_t minute, uint8_t second, uint32_t nanos, Utc *result);

        /// @brief Convert an instant back into a calendar date.
        ///
        /// The exact instant of a leap second is reconstructed as second 60.
        ///
        /// @pre @p instant falls within the years representable by an int32_t.
        static Utc fromInstant(Instant instant);

        /// @brief UTC is its own reference.
        static constexpr Offset utcOffset() {
            return Offset { .hours = 0, .minutes = 0, .era = Era::ePresent };
        }

        /// @brief The elapsed time from the epoch to this date, leap seconds included.
        Instant asInstant() const;

        constexpr int32_t year() const { return mYear; }
        constexpr uint8_t month() const { return mMonth; }
        constexpr uint8_t day() const { return mDay; }
        constexpr uint8_t hour() const { return mHour; }
        constexpr uint8_t minute() const { return mMinute; }
        constexpr uint8_t second() const { return mSecond; }
        constexpr uint32_t nanos() const { return mNanos; }

        constexpr bool isLeapSecond() const { return mSecond == 60; }

        /// @brief Calendar field ordering, year first.
        constexpr auto operator<=>(const Utc&) const = default;
    };

    /// @brief Order two dates by the elapsed time between them.
    std::strong_ordering CompareElapsed(const Utc& lhs, const Utc& rhs);

    template<>
    struct Format<Utc> {
        static constexpr size_t kStringSize = 32;

        static void format(IOutStream& out, const Utc& value);
    };
}
