#pragma once

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <string>

namespace orfkit {
namespace log_utils {

/**
 * Human-readable duration for verbose output. Sub-minute times keep
 * their precision ("850 ms", "4.2 s"); longer ones show the two most
 * significant units ("3m 12s", "1h 5m", "2d 3h").
 */
inline std::string format_duration_ms(int64_t ms) {
    if (ms < 0) ms = 0;
    if (ms < 1000) return std::to_string(ms) + " ms";
    if (ms < 60000) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(1) << ms / 1000.0 << " s";
        return oss.str();
    }

    static const struct { int64_t seconds; const char* suffix; } units[] = {
        {86400, "d"}, {3600, "h"}, {60, "m"}, {1, "s"}};

    int64_t rest = ms / 1000;
    for (size_t i = 0; i + 1 < std::size(units); ++i) {
        if (rest < units[i].seconds) continue;
        const int64_t major = rest / units[i].seconds;
        const int64_t minor = (rest % units[i].seconds) / units[i + 1].seconds;
        return std::to_string(major) + units[i].suffix + " " +
               std::to_string(minor) + units[i + 1].suffix;
    }
    return std::to_string(rest) + "s";
}

// Items per second over an elapsed time, e.g. "12500 records/s"
inline std::string format_rate(uint64_t count, int64_t ms, const std::string& unit) {
    if (ms <= 0) return std::to_string(count) + " " + unit + " in <1 ms";
    const double per_second = static_cast<double>(count) * 1000.0 / static_cast<double>(ms);
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(per_second < 10.0 ? 1 : 0)
        << per_second << " " << unit << "/s";
    return oss.str();
}

// "1.5 s, 2500 records/s"
inline std::string format_summary(uint64_t count, int64_t ms, const std::string& unit) {
    if (ms <= 0) return format_rate(count, ms, unit);
    return format_duration_ms(ms) + ", " + format_rate(count, ms, unit);
}

// Wall-clock timer started at construction
class Stopwatch {
public:
    using Clock = std::chrono::steady_clock;

    Stopwatch() : start_(Clock::now()) {}

    int64_t elapsed_ms() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start_)
            .count();
    }

    std::string elapsed() const { return format_duration_ms(elapsed_ms()); }

    std::string summary(uint64_t count, const std::string& unit) const {
        return format_summary(count, elapsed_ms(), unit);
    }

private:
    Clock::time_point start_;
};

}  // namespace log_utils
}  // namespace orfkit
