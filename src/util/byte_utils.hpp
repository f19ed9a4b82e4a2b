#pragma once

#include <cstdint>
#include <sstream>
#include <string>

namespace byte_utils {

constexpr std::uint64_t KIB = 1024ULL;
constexpr std::uint64_t MIB = 1024ULL * 1024ULL;

// Scales value by 1024 until it fits below 1024 of the next unit, printing
// 2/1/0 decimals for values under 10/100/1000.
inline std::string format_scaled(double value, const char* const* units, int unit_count) {
    int unit_index = 0;
    while (unit_index < unit_count - 1 && value >= 1024.0) {
        value /= 1024.0;
        ++unit_index;
    }

    std::ostringstream oss;
    oss.setf(std::ios::fixed);
    if (unit_index == 0) {
        oss.precision(0);
    } else {
        oss.precision(value < 10.0 ? 2 : (value < 100.0 ? 1 : 0));
    }
    oss << value << ' ' << units[unit_index];
    return oss.str();
}

inline std::string format_bytes(std::uint64_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB", "PB"};
    return format_scaled(static_cast<double>(bytes), units, 6);
}

inline std::string format_rate(double bytes_per_second) {
    static const char* units[] = {"B/s", "KB/s", "MB/s", "GB/s", "TB/s"};
    return format_scaled(bytes_per_second > 0.0 ? bytes_per_second : 0.0, units, 5);
}

} // namespace byte_utils
