#include <gtest/gtest.h>

#include "timekeeper/time_system.hpp"

#include "utc_test.hpp"

using namespace tk;

namespace {
    /// @brief Whole seconds since the epoch, leap seconds included.
    struct EpochSeconds {
        int64_t value;

        static EpochSeconds fromInstant(Instant instant) {
            return EpochSeconds { instant.sinceEpoch().seconds() };
        }

        Instant asInstant() const {
            return Instant::fromEpoch(Duration::ofSeconds(value));
        }
    };

    /// @brief A fixed offset zone five and a half hours ahead of UTC.
    struct IndiaTime {
        Utc local;

        static IndiaTime fromInstant(Instant instant) {
            return IndiaTime { Utc::fromInstant(instant + utcOffset().asDuration()) };
        }

        static constexpr Offset utcOffset() {
            return Offset { .hours = 5, .minutes = 30, .era = Era::ePresent };
        }

        Instant asInstant() const {
            return local.asInstant() - utcOffset().asDuration();
        }
    };
}

static_assert(IsTimeSystem<Utc>);
static_assert(IsTimeZone<Utc>);
static_assert(IsTimeSystem<EpochSeconds>);
static_assert(!IsTimeZone<EpochSeconds>);
static_assert(IsTimeZone<IndiaTime>);
static_assert(!IsTimeSystem<Instant>);

TEST(TimeSystemTest, CounterToUtc) {
    EXPECT_EQ(Convert<Utc>(EpochSeconds { 0 }), Utc());
    EXPECT_EQ(Convert<Utc>(EpochSeconds { -1 }), NewUtc(1899, 12, 31, 23, 59, 59));
    EXPECT_EQ(Convert<Utc>(EpochSeconds { 2272060800 }), NewUtc(1971, 12, 31, 23, 59, 60));
}

TEST(TimeSystemTest, UtcToCounter) {
    EXPECT_EQ(Convert<EpochSeconds>(NewUtc(1972, 1, 1)).value, 2272060801);
    EXPECT_EQ(Convert<EpochSeconds>(NewUtc(1899, 12, 31)).value, -86400);
}

TEST(TimeSystemTest, FixedOffsetZone) {
    IndiaTime local = Convert<IndiaTime>(NewUtc(2017, 12, 25, 1, 2, 14));
    EXPECT_EQ(local.local, NewUtc(2017, 12, 25, 6, 32, 14));

    EXPECT_EQ(Convert<Utc>(local), NewUtc(2017, 12, 25, 1, 2, 14));
}
