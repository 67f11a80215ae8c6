#include "timekeeper/leap_seconds.hpp"

#include "timekeeper/log.hpp"
#include "timekeeper/panic.hpp"

#include <algorithm>

tk::LeapSecondTable::LeapSecondTable(std::span<const int32_t> june, std::span<const int32_t> january)
    : mJuneYears(june.begin(), june.end())
    , mJanuaryYears(january.begin(), january.end())
{
    TK_CHECK(std::ranges::is_sorted(june), "june leap second years must be ascending");
    TK_CHECK(std::ranges::is_sorted(january), "january leap second years must be ascending");

    mEvents.reserve(mJuneYears.size() + mJanuaryYears.size());

    for (int32_t year : mJuneYears) {
        mEvents.push_back(LeapSecond { .year = year, .month = 6 });
    }

    for (int32_t year : mJanuaryYears) {
        mEvents.push_back(LeapSecond { .year = year - 1, .month = 12 });
    }

    std::ranges::sort(mEvents);

    LeapLog.dbgf("Loaded ", mEvents.size(), " leap seconds");
}

bool tk::LeapSecondTable::hasJuneLeapSecond(int32_t year) const {
    return mJuneYears.contains(year);
}

bool tk::LeapSecondTable::hasDecemberLeapSecond(int32_t year) const {
    // a year past the end of the range can never be a january entry
    if (year == INT32_MAX) {
        return false;
    }

    return mJanuaryYears.contains(year + 1);
}

bool tk::LeapSecondTable::hasLeapSecond(int32_t year, uint8_t month) const {
    switch (month) {
    case 6:
        return hasJuneLeapSecond(year);
    case 12:
        return hasDecemberLeapSecond(year);
    default:
        return false;
    }
}

size_t tk::LeapSecondTable::countBefore(int32_t year, uint8_t month) const {
    auto before = [&](const LeapSecond& leap) {
        if (leap.year != year) {
            return leap.year < year;
        }

        return leap.month < month;
    };

    return size_t(std::ranges::count_if(mEvents, before));
}

const tk::LeapSecondTable& tk::LeapSecondTable::get() {
    static const LeapSecondTable sTable { kJuneLeapYears, kJanuaryLeapYears };
    return sTable;
}
