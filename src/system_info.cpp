#include "system_info.hpp"
#include <fstream>
#include <sstream>
#include <string_view>
#include <unistd.h>
#include <sys/statvfs.h>
#include <charconv>
#include <filesystem>
#include <algorithm>
#include <vector>
#include <thread>

namespace procpeek {

SystemInfo& SystemInfo::instance() {
    static SystemInfo instance;
    return instance;
}

SystemInfo::SystemInfo() {
    processor_count_ = std::thread::hardware_concurrency();
    if (processor_count_ == 0) processor_count_ = 1;

    clock_ticks_ = sysconf(_SC_CLK_TCK);
    if (clock_ticks_ <= 0) clock_ticks_ = 100;

    // Boot time (seconds since epoch) from /proc/stat
    std::ifstream stat("/proc/stat");
    std::string line;
    while (std::getline(stat, line)) {
        if (line.starts_with("btime ")) {
            std::istringstream iss(line);
            std::string key;
            iss >> key >> boot_time_seconds_;
            break;
        }
    }
}

CpuTimes SystemInfo::get_cpu_times() {
    CpuTimes times;
    std::ifstream stat("/proc/stat");
    std::string line;

    if (std::getline(stat, line) && line.starts_with("cpu ")) {
        std::istringstream iss(line);
        std::string cpu;
        iss >> cpu >> times.user >> times.nice >> times.system >> times.idle
            >> times.iowait >> times.irq >> times.softirq >> times.steal;
    }

    return times;
}

MemoryInfo SystemInfo::get_memory_info() {
    MemoryInfo info;
    std::ifstream meminfo("/proc/meminfo");
    std::string line;

    while (std::getline(meminfo, line)) {
        std::istringstream iss(line);
        std::string key;
        int64_t value = 0;
        std::string unit;

        iss >> key >> value >> unit;

        if (key == "MemTotal:") {
            info.total = value * 1024; // Convert from KB to bytes
        } else if (key == "MemAvailable:") {
            info.available = value * 1024;
        }
    }

    info.used = info.total - info.available;
    return info;
}

SwapInfo SystemInfo::get_swap_info() {
    SwapInfo info;
    std::ifstream meminfo("/proc/meminfo");
    std::string line;

    while (std::getline(meminfo, line)) {
        std::istringstream iss(line);
        std::string key;
        int64_t value = 0;
        std::string unit;

        iss >> key >> value >> unit;

        if (key == "SwapTotal:") {
            info.total = value * 1024;
        } else if (key == "SwapFree:") {
            info.free = value * 1024;
        }
    }

    info.used = info.total - info.free;
    return info;
}

LoadAverage SystemInfo::get_load_average() {
    LoadAverage load;

    if (std::ifstream loadavg("/proc/loadavg"); loadavg) {
        std::string running_total;
        loadavg >> load.one_min >> load.five_min >> load.fifteen_min >> running_total;

        // Parse "running/total" format
        if (const size_t slash = running_total.find('/'); slash != std::string::npos) {
            const char* begin = running_total.data();
            const char* end = begin + running_total.size();
            std::from_chars(begin, begin + slash, load.running_tasks);
            std::from_chars(begin + slash + 1, end, load.total_tasks);
        }
    }

    return load;
}

UptimeInfo SystemInfo::get_uptime() {
    UptimeInfo info;
    std::ifstream uptime("/proc/uptime");

    if (uptime) {
        double uptime_sec = 0.0, idle_sec = 0.0;
        uptime >> uptime_sec >> idle_sec;
        info.uptime_seconds = static_cast<uint64_t>(uptime_sec);
        info.idle_seconds = static_cast<uint64_t>(idle_sec);
    }

    return info;
}

bool SystemInfo::get_disk_usage(const std::string& path, DiskUsage& out) {
    struct statvfs vfs {};
    if (statvfs(path.c_str(), &vfs) != 0) {
        return false;
    }

    out.path = path;
    out.total = static_cast<int64_t>(vfs.f_blocks) * static_cast<int64_t>(vfs.f_frsize);
    out.used = out.total - static_cast<int64_t>(vfs.f_bfree) * static_cast<int64_t>(vfs.f_frsize);
    return true;
}

std::optional<double> SystemInfo::get_cpu_temperature(const std::string& thermal_root) {
    namespace fs = std::filesystem;
    constexpr std::string_view kZonePrefix = "thermal_zone";

    std::error_code ec;
    fs::directory_iterator it(thermal_root, ec);
    if (ec) return std::nullopt;

    std::vector<std::pair<int, fs::path>> zones;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        const std::string name = it->path().filename().string();
        if (!name.starts_with(kZonePrefix)) continue;

        int index = 0;
        const char* first = name.data() + kZonePrefix.size();
        const char* last = name.data() + name.size();
        if (auto [ptr, parse_ec] = std::from_chars(first, last, index);
            parse_ec != std::errc{} || ptr != last) {
            continue;
        }
        zones.emplace_back(index, it->path());
    }
    std::ranges::sort(zones, {}, &std::pair<int, fs::path>::first);

    // Millidegrees, one value per file
    for (const auto& [index, path] : zones) {
        std::ifstream file(path / "temp");
        long millidegrees = 0;
        if (file >> millidegrees) {
            return static_cast<double>(millidegrees) / 1000.0;
        }
    }
    return std::nullopt;
}

unsigned int SystemInfo::get_processor_count() const {
    return processor_count_;
}

long SystemInfo::get_clock_ticks_per_second() const {
    return clock_ticks_;
}

uint64_t SystemInfo::get_boot_time_seconds() const {
    return boot_time_seconds_;
}

} // namespace procpeek
