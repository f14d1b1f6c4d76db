#include "format_utils.hpp"
#include <fmt/format.h>
#include <ctime>

namespace procpeek {

std::string format_bytes(int64_t bytes) {
    const char* units[] = {"B", "K", "M", "G", "T", "P"};
    int unit_idx = 0;
    double size = static_cast<double>(bytes);

    while (size >= 1024.0 && unit_idx < 5) {
        size /= 1024.0;
        unit_idx++;
    }

    if (unit_idx == 0) return fmt::format("{}{}", bytes, units[0]);
    if (size >= 100.0) return fmt::format("{:.0f}{}", size, units[unit_idx]);
    if (size >= 10.0) return fmt::format("{:.1f}{}", size, units[unit_idx]);
    return fmt::format("{:.2f}{}", size, units[unit_idx]);
}

std::string format_uptime(int64_t seconds) {
    if (seconds < 0) seconds = 0;
    const int64_t days = seconds / 86400;
    const int64_t hours = (seconds % 86400) / 3600;
    const int64_t minutes = (seconds % 3600) / 60;
    const int64_t secs = seconds % 60;

    if (days > 0) {
        return fmt::format("{}d {:02}:{:02}:{:02}", days, hours, minutes, secs);
    }
    return fmt::format("{:02}:{:02}:{:02}", hours, minutes, secs);
}

std::string format_time(std::chrono::system_clock::time_point tp) {
    const auto time_t_val = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_val{};
    localtime_r(&time_t_val, &tm_val);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_val);
    return buf;
}

std::string truncate_to(const std::string& text, size_t width) {
    if (text.size() <= width) return text;
    if (width == 0) return {};
    return text.substr(0, width - 1) + "~";
}

} // namespace procpeek
