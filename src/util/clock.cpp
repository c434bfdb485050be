#include "clock.hpp"

#include <ctime>
#include <spdlog/fmt/fmt.h>

namespace snapgate::util {

namespace {

auto local_tm(std::time_t t) -> std::tm {
    std::tm tm{};
    localtime_r(&t, &tm);
    return tm;
}

} // namespace

auto iso8601(std::chrono::system_clock::time_point tp) -> std::string {
    const auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(tp);
    const auto micros =
        std::chrono::duration_cast<std::chrono::microseconds>(tp - seconds).count();
    const std::tm tm = local_tm(std::chrono::system_clock::to_time_t(seconds));
    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:06}", tm.tm_year + 1900,
                       tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, micros);
}

auto iso8601_now() -> std::string {
    return iso8601(std::chrono::system_clock::now());
}

auto clock_time_now() -> std::string {
    const std::tm tm = local_tm(std::time(nullptr));
    return fmt::format("{:02}:{:02}:{:02}", tm.tm_hour, tm.tm_min, tm.tm_sec);
}

} // namespace snapgate::util
