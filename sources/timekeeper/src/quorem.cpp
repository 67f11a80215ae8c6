#include "timekeeper/quorem.hpp"

#include "timekeeper/panic.hpp"

tk::QuoremResult tk::Quorem(int64_t numerator, int64_t denominator) {
    TK_CHECK(numerator >= 0 && denominator >= 0, "quorem only supports positive numbers");
    TK_CHECK(denominator != 0, "cannot divide by zero");

    return QuoremResult { numerator / denominator, numerator % denominator };
}
