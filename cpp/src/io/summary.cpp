#include "poly_scatter/io/summary.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace poly_scatter {

std::string format_clock_time(WallTime t) {
    const std::time_t tt = std::chrono::system_clock::to_time_t(t);
    std::tm local{};
    localtime_r(&tt, &local);
    char buf[16];
    const size_t n = std::strftime(buf, sizeof(buf), "%H:%M:%S", &local);
    return std::string(buf, n);
}

std::string format_summary(std::string_view tag, WallTime started, WallTime ended, size_t count) {
    const double elapsed = std::chrono::duration<double>(ended - started).count();
    std::ostringstream ss;
    if (!tag.empty()) {
        ss << tag << ' ';
    }
    ss << format_clock_time(started) << " - " << format_clock_time(ended)
       << " - " << std::fixed << std::setprecision(1) << elapsed
       << " - " << count;
    return ss.str();
}

std::string format_count_line(std::string_view tag, size_t count) {
    std::ostringstream ss;
    if (!tag.empty()) {
        ss << tag << ", ";
    }
    ss << count;
    return ss.str();
}

}  // namespace poly_scatter
