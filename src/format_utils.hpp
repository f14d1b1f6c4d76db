#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace procpeek {

// Compact byte count: "512B", "1.50K", "12.3M", "245G"
std::string format_bytes(int64_t bytes);

// "HH:MM:SS", or "Nd HH:MM:SS" past one day
std::string format_uptime(int64_t seconds);

// Local time as "YYYY-MM-DD HH:MM:SS"
std::string format_time(std::chrono::system_clock::time_point tp);

// Cut to `width` columns, marking the cut with '~'
std::string truncate_to(const std::string& text, size_t width);

} // namespace procpeek
