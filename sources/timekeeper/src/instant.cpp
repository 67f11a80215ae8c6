#include "timekeeper/instant.hpp"

#include "timekeeper/panic.hpp"

#include <tuple>

namespace {
    struct Magnitude {
        uint64_t seconds;
        uint32_t nanos;
    };

    /// @brief Split a signed duration into its absolute value.
    Magnitude GetMagnitude(tk::Duration duration) {
        if (duration.seconds() >= 0) {
            return Magnitude { uint64_t(duration.seconds()), duration.nanos() };
        }

        if (duration.nanos() == 0) {
            return Magnitude { uint64_t(0) - uint64_t(duration.seconds()), 0 };
        }

        return Magnitude { uint64_t(-(duration.seconds() + 1)), tk::kNanosPerSecond - duration.nanos() };
    }
}

void tk::Duration::InvalidNanos() {
    TK_PANIC("duration nanoseconds must be less than one second");
}

tk::Duration tk::Duration::operator-() const {
    if (mNanos == 0) {
        TK_CHECK(mSeconds != INT64_MIN, "duration negation overflow");
        return Duration(-mSeconds, 0);
    }

    // ~x is -x - 1 without overflow at either end of the range
    return Duration(~mSeconds, kNanosPerSecond - mNanos);
}

tk::Duration tk::Duration::operator+(Duration other) const {
    int64_t seconds;
    if (__builtin_add_overflow(mSeconds, other.mSeconds, &seconds)) {
        TK_PANIC("duration addition overflow");
    }

    uint32_t nanos = mNanos + other.mNanos;
    if (nanos >= kNanosPerSecond) {
        nanos -= kNanosPerSecond;

        if (__builtin_add_overflow(seconds, 1, &seconds)) {
            TK_PANIC("duration addition overflow");
        }
    }

    return Duration(seconds, nanos);
}

tk::Duration tk::Duration::operator-(Duration other) const {
    return *this + -other;
}

void tk::Instant::InvalidNanos() {
    TK_PANIC("instant nanoseconds must be less than one second");
}

tk::Duration tk::Instant::sinceEpoch() const {
    TK_CHECK(mSeconds <= uint64_t(INT64_MAX), "instant is too far from the epoch");

    Duration magnitude(int64_t(mSeconds), mNanos);
    if (mEra == Era::ePast) {
        return -magnitude;
    }

    return magnitude;
}

tk::Instant tk::Instant::fromEpoch(Duration offset) {
    Magnitude magnitude = GetMagnitude(offset);
    Era era = (offset.seconds() < 0) ? Era::ePast : Era::ePresent;

    return Instant(magnitude.seconds, magnitude.nanos, era);
}

tk::Instant tk::Instant::operator+(Duration duration) const {
    return fromEpoch(sinceEpoch() + duration);
}

tk::Instant tk::Instant::operator-(Duration duration) const {
    return fromEpoch(sinceEpoch() - duration);
}

tk::Duration tk::Instant::operator-(Instant other) const {
    return sinceEpoch() - other.sinceEpoch();
}

std::strong_ordering tk::Instant::operator<=>(const Instant& other) const {
    // the epoch is in both eras, normalize it before comparing eras
    bool lhsPast = (mEra == Era::ePast) && !isEpoch();
    bool rhsPast = (other.mEra == Era::ePast) && !other.isEpoch();

    if (lhsPast != rhsPast) {
        return lhsPast ? std::strong_ordering::less : std::strong_ordering::greater;
    }

    auto lhs = std::tie(mSeconds, mNanos);
    auto rhs = std::tie(other.mSeconds, other.mNanos);

    // larger magnitudes are further in the past
    if (lhsPast) {
        return rhs <=> lhs;
    }

    return lhs <=> rhs;
}

bool tk::Instant::operator==(const Instant& other) const {
    return (*this <=> other) == std::strong_ordering::equal;
}

tk::Duration tk::Offset::asDuration() const {
    Duration duration = Duration::ofSeconds((int64_t(hours) * 60 + minutes) * 60);
    if (era == Era::ePast) {
        return -duration;
    }

    return duration;
}

void tk::Format<tk::Instant>::format(IOutStream& out, Instant value) {
    out.format(Int(value.seconds()), '.', Int(value.nanos()).pad(9, '0'), ' ', value.era());
}

void tk::Format<tk::Duration>::format(IOutStream& out, Duration value) {
    Magnitude magnitude = GetMagnitude(value);
    if (value.seconds() < 0) {
        out.write('-');
    }

    out.format(Int(magnitude.seconds), '.', Int(magnitude.nanos).pad(9, '0'), 's');
}
