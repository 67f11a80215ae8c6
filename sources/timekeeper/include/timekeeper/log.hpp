#pragma once

#include "timekeeper/logger.hpp"

constinit inline tk::Logger UtcLog { "UTC" };
constinit inline tk::Logger LeapLog { "LEAP" };
constinit inline tk::Logger PanicLog { "PANIC" };
