#pragma once

#include <source_location>
#include <string_view>

namespace tk {
    /// @brief Report an internal invariant violation and terminate the process.
    ///
    /// Never used for bad user input, that is reported through @ref TkStatus.
    [[noreturn]]
    void BugCheck(std::string_view message, std::source_location where = std::source_location::current()) noexcept;
}

#define TK_PANIC(msg) tk::BugCheck(msg)
#define TK_CHECK(expr, msg) do { if (!(expr)) { tk::BugCheck(msg); } } while (0)
#define TK_ASSERT(expr) do { if (!(expr)) { tk::BugCheck(#expr); } } while (0)
