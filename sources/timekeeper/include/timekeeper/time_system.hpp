#pragma once

#include "timekeeper/instant.hpp"

#include <concepts>

namespace tk {
    /// @brief A calendar or counter that can be converted to and from an @ref Instant.
    template<typename T>
    concept IsTimeSystem = requires(const T& value, Instant instant) {
        { T::fromInstant(instant) } -> std::same_as<T>;
        { value.asInstant() } -> std::same_as<Instant>;
    };

    /// @brief A time system that is also a fixed offset from UTC.
    template<typename T>
    concept IsTimeZone = IsTimeSystem<T> && requires {
        { T::utcOffset() } -> std::same_as<Offset>;
    };

    /// @brief Convert between two time systems through the instant they share.
    template<IsTimeSystem To, IsTimeSystem From>
    To Convert(const From& from) {
        return To::fromInstant(from.asInstant());
    }
}
