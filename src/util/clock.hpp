#pragma once

#include <chrono>
#include <string>

namespace snapgate::util {

// Local wall-clock time as ISO-8601 with microseconds, e.g. "2024-05-01T08:30:12.004211".
[[nodiscard]] auto iso8601_now() -> std::string;
[[nodiscard]] auto iso8601(std::chrono::system_clock::time_point tp) -> std::string;

// Local wall-clock time of day, "HH:MM:SS".
[[nodiscard]] auto clock_time_now() -> std::string;

} // namespace snapgate::util
