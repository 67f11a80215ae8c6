#include "timekeeper/utc.hpp"

#include "timekeeper/leap_seconds.hpp"
#include "timekeeper/log.hpp"
#include "timekeeper/panic.hpp"
#include "timekeeper/quorem.hpp"
#include "timekeeper/time_system.hpp"

#include <algorithm>
#include <array>
#include <span>
#include <vector>

static_assert(tk::IsTimeZone<tk::Utc>);

namespace {
    constexpr int64_t kDaysPerYear = 365;
    constexpr int64_t kDaysPerCycle = 146097;
    constexpr int64_t kYearsPerCycle = 400;
    constexpr int64_t kSecondsPerCycle = kDaysPerCycle * tk::kSecondsPerDay;

    // average month length of 30.4365 days, scaled by 10000
    constexpr int64_t kScaledMonthSeconds = 304365 * tk::kSecondsPerDay;
    constexpr int64_t kMonthScale = 10000;

    constexpr std::array<uint8_t, 12> kDaysInMonth = {
        31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31,
    };

    constexpr std::array<uint16_t, 12> kDaysBeforeMonth = [] {
        std::array<uint16_t, 12> result{};
        uint16_t total = 0;
        for (size_t i = 0; i < kDaysInMonth.size(); i++) {
            result[i] = total;
            total += kDaysInMonth[i];
        }
        return result;
    }();

    static_assert(kDaysBeforeMonth[11] + kDaysInMonth[11] == kDaysPerYear);
    static_assert(kDaysPerCycle == kYearsPerCycle * kDaysPerYear + 97);

    constexpr int64_t FloorDiv(int64_t num, int64_t den) {
        int64_t quotient = num / den;
        if ((num % den != 0) && ((num < 0) != (den < 0))) {
            quotient -= 1;
        }
        return quotient;
    }

    /// @brief The number of leap years in [1, year), counted proleptically and signed for years before 1.
    constexpr int64_t LeapYearsBefore(int64_t year) {
        int64_t prior = year - 1;
        return FloorDiv(prior, 4) - FloorDiv(prior, 100) + FloorDiv(prior, 400);
    }

    /// @brief Signed days between the epoch and the first day of @p year.
    constexpr int64_t DaysBeforeYear(int64_t year) {
        int64_t years = year - tk::kEpochYear;
        return years * kDaysPerYear + LeapYearsBefore(year) - LeapYearsBefore(tk::kEpochYear);
    }

    static_assert(DaysBeforeYear(1900) == 0);
    static_assert(DaysBeforeYear(1901) == 365);
    static_assert(DaysBeforeYear(1905) == 365 * 5 + 1);
    static_assert(DaysBeforeYear(1899) == -365);
    static_assert(DaysBeforeYear(1900) - DaysBeforeYear(1500) == kDaysPerCycle);

    constexpr int64_t DaysBeforeMonth(int64_t year, uint8_t month) {
        int64_t days = kDaysBeforeMonth[month - 1];
        if (month > 2 && tk::IsLeapYear(int32_t(year))) {
            days += 1;
        }
        return days;
    }

    constexpr int64_t DaysInYear(int64_t year) {
        return tk::IsLeapYear(int32_t(year)) ? 366 : 365;
    }

    struct CalendarFields {
        int64_t year;
        uint8_t month;
        uint8_t day;
        uint8_t hour;
        uint8_t minute;
        uint8_t second;
    };

    /// @brief Seconds of the first moment of the calendar, on a timescale without leap seconds.
    constexpr int64_t kMinCalendarSeconds = DaysBeforeYear(INT32_MIN) * tk::kSecondsPerDay;

    /// @brief Seconds of the last whole second of the calendar, on a timescale without leap seconds.
    constexpr int64_t kMaxCalendarSeconds = DaysBeforeYear(int64_t(INT32_MAX) + 1) * tk::kSecondsPerDay - 1;

    /// @brief Split seconds since the epoch on a timescale without leap seconds into calendar fields.
    ///
    /// @pre @p seconds is in [kMinCalendarSeconds, kMaxCalendarSeconds]
    CalendarFields DecomposeSeconds(int64_t seconds) {
        // move pre epoch values forward by whole cycles, every cycle has the same length
        // so the calendar fields only differ in the year.
        int64_t baseYear = tk::kEpochYear;
        if (seconds < 0) {
            int64_t cycles = -FloorDiv(seconds, kSecondsPerCycle);
            seconds += cycles * kSecondsPerCycle;
            baseYear -= cycles * kYearsPerCycle;
        }

        TK_ASSERT(seconds >= 0);

        auto yearStart = [&](int64_t year) {
            return (DaysBeforeYear(year) - DaysBeforeYear(baseYear)) * tk::kSecondsPerDay;
        };

        // whole cycles are exact, a 365 day year inside the cycle overestimates by at most one year
        auto [cycles, cycleSeconds] = tk::Quorem(seconds, kSecondsPerCycle);
        int64_t year = baseYear + cycles * kYearsPerCycle + tk::Quorem(cycleSeconds, kDaysPerYear * tk::kSecondsPerDay).quotient;
        while (yearStart(year) > seconds) {
            year -= 1;
        }

        while (seconds - yearStart(year) >= DaysInYear(year) * tk::kSecondsPerDay) {
            year += 1;
        }

        int64_t yearSeconds = seconds - yearStart(year);

        int64_t estimate = tk::Quorem(yearSeconds * kMonthScale, kScaledMonthSeconds).quotient + 1;
        uint8_t month = uint8_t(std::clamp<int64_t>(estimate, 1, 12));

        while (month > 1 && DaysBeforeMonth(year, month) * tk::kSecondsPerDay > yearSeconds) {
            month -= 1;
        }

        while (month < 12 && DaysBeforeMonth(year, month + 1) * tk::kSecondsPerDay <= yearSeconds) {
            month += 1;
        }

        int64_t monthSeconds = yearSeconds - DaysBeforeMonth(year, month) * tk::kSecondsPerDay;

        auto [day, daySeconds] = tk::Quorem(monthSeconds, tk::kSecondsPerDay);
        auto [hour, hourSeconds] = tk::Quorem(daySeconds, tk::kSecondsPerHour);
        auto [minute, second] = tk::Quorem(hourSeconds, tk::kSecondsPerMinute);

        return CalendarFields {
            .year = year,
            .month = month,
            .day = uint8_t(day + 1),
            .hour = uint8_t(hour),
            .minute = uint8_t(minute),
            .second = uint8_t(second),
        };
    }

    tk::Utc CreateFromFields(CalendarFields fields, uint8_t second, uint32_t nanos) {
        TK_CHECK(fields.year >= INT32_MIN && fields.year <= INT32_MAX, "date computed from instant is invalid");

        tk::Utc result;
        TkStatus status = tk::Utc::create(int32_t(fields.year), fields.month, fields.day, fields.hour, fields.minute, second, nanos, &result);
        TK_CHECK(TK_SUCCESS(status), "date computed from instant is invalid");

        return result;
    }

    uint8_t GetMaxSecond(int32_t year, uint8_t month, uint8_t day, uint8_t hour, uint8_t minute) {
        if (hour != 23 || minute != 59) {
            return 59;
        }

        const tk::LeapSecondTable& table = tk::LeapSecondTable::get();
        if (month == 6 && day == 30 && table.hasJuneLeapSecond(year)) {
            return 60;
        }

        if (month == 12 && day == 31 && table.hasDecemberLeapSecond(year)) {
            return 60;
        }

        return 59;
    }
}

/// @brief The instant of every 23:59:60 in the leap second table, in chronological order.
static std::span<const int64_t> GetLeapSecondStarts() {
    static const std::vector<int64_t> sStarts = [] {
        std::span<const tk::LeapSecond> events = tk::LeapSecondTable::get().events();

        std::vector<int64_t> result;
        result.reserve(events.size());

        for (const tk::LeapSecond& leap : events) {
            tk::Utc utc;
            TkStatus status = tk::Utc::create(leap.year, leap.month, tk::DaysInMonth(leap.year, leap.month), 23, 59, 60, 0, &utc);
            TK_CHECK(TK_SUCCESS(status), "leap second table entry is not a valid date");

            result.push_back(utc.asInstant().sinceEpoch().seconds());
        }

        return result;
    }();

    return sStarts;
}

uint8_t tk::DaysInMonth(int32_t year, uint8_t month) {
    TK_CHECK(month >= 1 && month <= 12, "month out of range");

    if (month == 2 && IsLeapYear(year)) {
        return 29;
    }

    return kDaysInMonth[month - 1];
}

TkStatus tk::Utc::create(int32_t year, uint8_t month, uint8_t day, uint8_t hour, uint8_t minute, uint8_t second, uint32_t nanos, Utc *result) {
    if (month < 1 || month > 12) {
        UtcLog.dbgf("Rejected month ", month, " of year ", year);
        return TkStatusCarry;
    }

    if (day < 1 || day > DaysInMonth(year, month)) {
        UtcLog.dbgf("Rejected day ", day, " of ", year, "-", Int(month).pad(2, '0'));
        return TkStatusCarry;
    }

    if (hour > 23 || minute > 59) {
        UtcLog.dbgf("Rejected time ", hour, ":", minute);
        return TkStatusCarry;
    }

    if (second > GetMaxSecond(year, month, day, hour, minute)) {
        UtcLog.dbgf("Rejected second ", second, " on ", year, "-", Int(month).pad(2, '0'), "-", Int(day).pad(2, '0'));
        return TkStatusCarry;
    }

    if (nanos >= kNanosPerSecond) {
        UtcLog.dbgf("Rejected nanoseconds ", nanos);
        return TkStatusCarry;
    }

    *result = Utc(year, month, day, hour, minute, second, nanos);
    return TkStatusSuccess;
}

tk::Instant tk::Utc::asInstant() const {
    int64_t days = DaysBeforeYear(mYear) + DaysBeforeMonth(mYear, mMonth) + (mDay - 1);
    int64_t seconds = days * kSecondsPerDay
                    + mHour * kSecondsPerHour
                    + mMinute * kSecondsPerMinute
                    + mSecond;

    seconds += int64_t(LeapSecondTable::get().countBefore(mYear, mMonth));

    return Instant::fromEpoch(Duration(seconds, mNanos));
}

tk::Utc tk::Utc::fromInstant(Instant instant) {
    Duration elapsed = instant.sinceEpoch();
    int64_t seconds = elapsed.seconds();

    TK_CHECK(seconds >= kMinCalendarSeconds, "instant is outside of the calendar range");

    std::span<const int64_t> starts = GetLeapSecondStarts();
    auto it = std::ranges::lower_bound(starts, seconds);
    int64_t inserted = it - starts.begin();

    TK_CHECK(seconds - inserted <= kMaxCalendarSeconds, "instant is outside of the calendar range");

    if (it != starts.end() && *it == seconds) {
        CalendarFields fields = DecomposeSeconds(seconds - inserted - 1);
        return CreateFromFields(fields, 60, elapsed.nanos());
    }

    CalendarFields fields = DecomposeSeconds(seconds - inserted);
    return CreateFromFields(fields, fields.second, elapsed.nanos());
}

std::strong_ordering tk::CompareElapsed(const Utc& lhs, const Utc& rhs) {
    return lhs.asInstant() <=> rhs.asInstant();
}

void tk::Format<tk::Utc>::format(IOutStream& out, const Utc& value) {
    out.format(
        Int(value.year()).pad(4, '0'), '-', Int(value.month()).pad(2, '0'), '-', Int(value.day()).pad(2, '0'),
        'T',
        Int(value.hour()).pad(2, '0'), ':', Int(value.minute()).pad(2, '0'), ':', Int(value.second()).pad(2, '0'),
        "+00:00"
    );
}
