#include "timekeeper/panic.hpp"

#include "timekeeper/log.hpp"

#include <string>

#include <stdlib.h>

void tk::BugCheck(std::string_view message, std::source_location where) noexcept {
    PanicLog.fatalf("Assertion failed '", message, "'");
    std::string_view fn(where.function_name(), std::char_traits<char>::length(where.function_name()));
    std::string_view file(where.file_name(), std::char_traits<char>::length(where.file_name()));
    PanicLog.fatalf(fn, " (", file, ":", where.line(), ")");
    abort();
}
