#pragma once

#include <chrono>
#include <string>

namespace zephyrite {

// Formats `tp` as an ISO-8601 UTC timestamp with millisecond precision:
//   YYYY-MM-DDTHH:MM:SS.sssZ
// Timestamps in this format sort lexicographically in time order.
[[nodiscard]] std::string format_timestamp(std::chrono::system_clock::time_point tp);

// Returns the current wall-clock time formatted by format_timestamp().
[[nodiscard]] std::string current_timestamp();

} // namespace zephyrite
