#include "common/time.hpp"

#include <ctime>

#include <fmt/format.h>

namespace zephyrite {

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;

    const auto ms_since_epoch = duration_cast<milliseconds>(tp.time_since_epoch());
    const auto secs = duration_cast<seconds>(ms_since_epoch);
    const auto millis = static_cast<int>((ms_since_epoch - secs).count());

    const std::time_t t = static_cast<std::time_t>(secs.count());
    std::tm utc{};
    ::gmtime_r(&t, &utc);

    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
        utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
        utc.tm_hour, utc.tm_min, utc.tm_sec, millis);
}

std::string current_timestamp() {
    return format_timestamp(std::chrono::system_clock::now());
}

} // namespace zephyrite
