#pragma once

#include <stdint.h>

typedef uint32_t TkStatus;

enum TkStatusId {
    /// @brief The operation was successful.
    TkStatusSuccess = 0x0000,

    /// @brief The calendar fields would need to carry into the next unit.
    ///
    /// Returned when a date or time field is out of bounds for its unit, including
    /// a 60th second outside of a recorded leap second. Out of bounds values are
    /// never normalized into the next unit.
    TkStatusCarry = 0x0001,

    /// @brief The resource already exists.
    TkStatusAlreadyExists = 0x0002,

    /// @brief The requested resource could not be found.
    TkStatusNotFound = 0x0003,

    /// @brief The input to the operation was invalid.
    TkStatusInvalidInput = 0x0004,
};

#define TK_SUCCESS(status) ((status) == TkStatusSuccess)
#define TK_ERROR(status) ((status) != TkStatusSuccess)
