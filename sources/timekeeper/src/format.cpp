#include "timekeeper/format.hpp"

using TkStatusFormat = tk::Format<TkStatusId>;

void TkStatusFormat::format(IOutStream& out, TkStatusId value) {
    auto result = [&](std::string_view message) {
        out.format(message, " (", tk::Hex(TkStatus(value)).pad(8, '0'), ")");
    };

    switch (value) {
    case TkStatusSuccess:
        result("Success");
        break;
    case TkStatusCarry:
        result("Carry");
        break;
    case TkStatusAlreadyExists:
        result("Already exists");
        break;
    case TkStatusNotFound:
        result("Not found");
        break;
    case TkStatusInvalidInput:
        result("Invalid input");
        break;
    default:
        result("Unknown");
        break;
    }
}
