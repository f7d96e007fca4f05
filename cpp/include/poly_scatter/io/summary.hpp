#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>

namespace poly_scatter {

using WallTime = std::chrono::system_clock::time_point;

// HH:MM:SS in local time
[[nodiscard]] std::string format_clock_time(WallTime t);

// "<tag> HH:MM:SS - HH:MM:SS - <elapsed seconds, 1 decimal> - <count>"
// The tag and its separator are left out when the tag is empty.
[[nodiscard]] std::string format_summary(std::string_view tag, WallTime started, WallTime ended, size_t count);

// "<tag>, <count>", or just "<count>" without a tag
[[nodiscard]] std::string format_count_line(std::string_view tag, size_t count);

}  // namespace poly_scatter
