#pragma once

#include "timekeeper/format.hpp"

#include <compare>

#include <stdint.h>

namespace tk {
    static constexpr uint32_t kNanosPerSecond = 1'000'000'000;

    /// @brief Direction of an instant relative to the epoch (1900-01-01T00:00:00).
    enum class Era : uint8_t {
        /// @brief Strictly before the epoch.
        ePast = 0,

        /// @brief At or after the epoch.
        ePresent = 1,
    };

    /// @brief A signed span of elapsed time.
    ///
    /// The value is @a seconds + @a nanos / 1e9 with @a nanos always in [0, 1e9),
    /// so negative durations carry a positive nanosecond part.
    class Duration {
        int64_t mSeconds;
        uint32_t mNanos;

    public:
        constexpr Duration()
            : Duration(0, 0)
        { }

        /// @pre @p nanos < 1e9
        constexpr Duration(int64_t seconds, uint32_t nanos)
            : mSeconds(seconds)
            , mNanos(nanos)
        {
            if (nanos >= kNanosPerSecond) {
                InvalidNanos();
            }
        }

        static constexpr Duration ofSeconds(int64_t seconds) {
            Duration result;
            result.mSeconds = seconds;
            return result;
        }

        constexpr int64_t seconds() const { return mSeconds; }
        constexpr uint32_t nanos() const { return mNanos; }

        Duration operator-() const;
        Duration operator+(Duration other) const;
        Duration operator-(Duration other) const;

        constexpr auto operator<=>(const Duration&) const = default;

    private:
        [[noreturn]]
        static void InvalidNanos();
    };

    /// @brief Elapsed time since the epoch on a uniform timescale.
    ///
    /// Stored as a magnitude and an @ref Era rather than a signed value. An instant
    /// has no notion of calendars or leap seconds, it only counts elapsed time.
    /// The zero instant compares equal in both eras.
    class Instant {
        uint64_t mSeconds;
        uint32_t mNanos;
        Era mEra;

    public:
        constexpr Instant()
            : Instant(0, 0, Era::ePresent)
        { }

        /// @pre @p nanos < 1e9
        constexpr Instant(uint64_t seconds, uint32_t nanos, Era era)
            : mSeconds(seconds)
            , mNanos(nanos)
            , mEra(era)
        {
            if (nanos >= kNanosPerSecond) {
                InvalidNanos();
            }
        }

        constexpr uint64_t seconds() const { return mSeconds; }
        constexpr uint32_t nanos() const { return mNanos; }
        constexpr Era era() const { return mEra; }

        /// @brief Is this instant the epoch itself, in either era.
        constexpr bool isEpoch() const { return mSeconds == 0 && mNanos == 0; }

        /// @brief Signed distance from the epoch.
        Duration sinceEpoch() const;

        /// @brief The instant a signed @p offset away from the epoch.
        static Instant fromEpoch(Duration offset);

        Instant operator+(Duration duration) const;
        Instant operator-(Duration duration) const;
        Duration operator-(Instant other) const;

        Instant& operator+=(Duration duration) { return *this = *this + duration; }
        Instant& operator-=(Duration duration) { return *this = *this - duration; }

        /// @brief Elapsed time ordering, earlier instants compare less.
        std::strong_ordering operator<=>(const Instant& other) const;
        bool operator==(const Instant& other) const;

    private:
        [[noreturn]]
        static void InvalidNanos();
    };

    /// @brief Fixed offset of a time zone from UTC.
    struct Offset {
        uint8_t hours;
        uint8_t minutes;
        Era era;

        /// @brief Signed duration of the offset, @ref Era::ePast offsets are behind UTC.
        Duration asDuration() const;

        constexpr bool operator==(const Offset&) const = default;
    };

    template<>
    struct Format<Era> {
        static constexpr std::string_view toString(Era era) {
            return era == Era::ePast ? "past" : "present";
        }
    };

    template<>
    struct Format<Instant> {
        static constexpr size_t kStringSize = 20 + 1 + 9 + 1 + 7;

        static void format(IOutStream& out, Instant value);
    };

    template<>
    struct Format<Duration> {
        static constexpr size_t kStringSize = 1 + 20 + 1 + 9 + 1;

        static void format(IOutStream& out, Duration value);
    };
}
