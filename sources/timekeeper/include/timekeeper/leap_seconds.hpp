#pragma once

#include <absl/container/btree_set.h>

#include <array>
#include <span>
#include <vector>

#include <stddef.h>
#include <stdint.h>

namespace tk {
    /// @brief IERS Bulletin C issue that the leap second tables are current to.
    ///
    /// Leap seconds cannot be predicted, update the tables below and this number
    /// together when a new bulletin announces an insertion.
    /// https://www.ietf.org/timezones/data/leap-seconds.list
    static constexpr int kLeapSecondBulletin = 52;

    /// @brief Years with a leap second inserted after 23:59:59 on June 30th.
    static constexpr std::array<int32_t, 11> kJuneLeapYears = {
        1972, 1981, 1982, 1983, 1985, 1992, 1993, 1994, 1997, 2012, 2015,
    };

    /// @brief Years with a leap second inserted after 23:59:59 on December 31st of the previous year.
    ///
    /// Listed by the year of the following January, the year of the insertion is one less.
    static constexpr std::array<int32_t, 17> kJanuaryLeapYears = {
        1972, 1973, 1974, 1975, 1976, 1977, 1978, 1979, 1980,
        1988, 1990, 1991, 1996, 1999, 2006, 2009, 2017,
    };

    /// @brief A leap second inserted as 23:59:60 on the last day of @a month.
    struct LeapSecond {
        int32_t year;
        uint8_t month;

        constexpr auto operator<=>(const LeapSecond&) const = default;
    };

    class LeapSecondTable {
        absl::btree_set<int32_t> mJuneYears;
        absl::btree_set<int32_t> mJanuaryYears;
        std::vector<LeapSecond> mEvents;

    public:
        LeapSecondTable(std::span<const int32_t> june, std::span<const int32_t> january);

        /// @brief Is there a leap second at the end of June 30th of @p year.
        bool hasJuneLeapSecond(int32_t year) const;

        /// @brief Is there a leap second at the end of December 31st of @p year.
        bool hasDecemberLeapSecond(int32_t year) const;

        /// @brief Is there a leap second at the end of the last day of @p month in @p year.
        bool hasLeapSecond(int32_t year, uint8_t month) const;

        /// @brief The number of leap seconds inserted before the first day of @p month in @p year.
        ///
        /// Insertions only happen at the end of a month, so this is also the count for
        /// every day of that month before its own 23:59:60.
        size_t countBefore(int32_t year, uint8_t month) const;

        /// @brief All leap seconds in chronological order.
        std::span<const LeapSecond> events() const { return mEvents; }

        size_t count() const { return mEvents.size(); }

        /// @brief The compiled in table, built on first use and never modified.
        static const LeapSecondTable& get();
    };
}
