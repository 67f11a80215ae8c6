#pragma once

#include <stdint.h>

namespace tk {
    struct QuoremResult {
        int64_t quotient;
        int64_t remainder;

        constexpr bool operator==(const QuoremResult&) const = default;
    };

    /// @brief Divide @p numerator by @p denominator, returning both the quotient and the remainder.
    ///
    /// @pre @p numerator >= 0
    /// @pre @p denominator > 0
    QuoremResult Quorem(int64_t numerator, int64_t denominator);
}
