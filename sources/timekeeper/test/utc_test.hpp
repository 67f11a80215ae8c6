#pragma once

#include <gtest/gtest.h>

#include "timekeeper/utc.hpp"

/// @brief Create a date that is expected to be valid.
inline tk::Utc NewUtc(int32_t year, uint8_t month, uint8_t day, uint8_t hour = 0, uint8_t minute = 0, uint8_t second = 0, uint32_t nanos = 0) {
    tk::Utc result;
    TkStatus status = tk::Utc::create(year, month, day, hour, minute, second, nanos, &result);
    EXPECT_EQ(status, TkStatusSuccess)
        << year << "-" << int(month) << "-" << int(day) << " "
        << int(hour) << ":" << int(minute) << ":" << int(second) << "." << nanos;
    return result;
}

namespace tk {
    inline void PrintTo(const Utc& value, std::ostream *os) {
        *os << std::string_view(tk::format(value)) << " +" << value.nanos() << "ns";
    }

    inline void PrintTo(const Instant& value, std::ostream *os) {
        *os << std::string_view(tk::format(value));
    }

    inline void PrintTo(const Duration& value, std::ostream *os) {
        *os << std::string_view(tk::format(value));
    }
}
