#pragma once

#include <string>
#include <format>
#include <chrono>
#include <cstdint>
#include <algorithm>


namespace lcr {

// Format an integer with thousands separators
// Example: 6436311 -> "6,436,311"
inline std::string format_number_exact(std::uint64_t value) {
    std::string raw = std::to_string(value);
    std::string formatted;
    formatted.reserve(raw.size() + raw.size() / 3);

    int count = 0;
    for (auto it = raw.rbegin(); it != raw.rend(); ++it) {
        if (count == 3) {
            formatted.push_back(',');
            count = 0;
        }
        formatted.push_back(*it);
        ++count;
    }
    std::reverse(formatted.begin(), formatted.end());
    return formatted;
}


// Format bytes as a scaled human-readable value (binary units)
// Example: 1234567 -> "1.18 MB"
inline std::string format_bytes(std::uint64_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double value = static_cast<double>(bytes);
    int unit_index = 0;

    while (value >= 1024.0 && unit_index < 4) {
        value /= 1024.0;
        ++unit_index;
    }

    int precision =
        (value < 10.0)  ? 2 :
        (value < 100.0) ? 1 : 0;

    return std::format("{:.{}f} {}", value, precision, units[unit_index]);
}


// Format a price with a precision that follows its magnitude
// Examples:
//   95012.5   -> "95012.50"
//   171.1234  -> "171.1234"
//   0.000021  -> "0.00002100"
inline std::string format_price(double price) {
    const double magnitude = price < 0.0 ? -price : price;
    int precision =
        (magnitude >= 1000.0) ? 2 :
        (magnitude >= 1.0)    ? 4 : 8;
    return std::format("{:.{}f}", price, precision);
}


// Format a percentage value (already scaled by 100)
// Example: 0.90909 -> "0.909%"
inline std::string format_percent(double pct, int precision = 3) {
    return std::format("{:.{}f}%", pct, precision);
}


// Format a millisecond duration into a human-readable string
// Examples:
//   250    -> "250 ms"
//   3000   -> "3.00 s"
//   90000  -> "1.50 min"
inline std::string format_duration(std::chrono::milliseconds d) {
    const auto ms = d.count();
    if (ms < 1000) {
        return std::format("{} ms", ms);
    }
    const double seconds = static_cast<double>(ms) / 1000.0;
    if (seconds < 60.0) {
        return std::format("{:.2f} s", seconds);
    }
    return std::format("{:.2f} min", seconds / 60.0);
}

} // namespace lcr
