#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace procpeek {

struct CpuTimes {
    uint64_t user = 0;
    uint64_t nice = 0;
    uint64_t system = 0;
    uint64_t idle = 0;
    uint64_t iowait = 0;
    uint64_t irq = 0;
    uint64_t softirq = 0;
    uint64_t steal = 0;

    [[nodiscard]] uint64_t total() const {
        return user + nice + system + idle + iowait + irq + softirq + steal;
    }

    [[nodiscard]] uint64_t active() const {
        return user + nice + system + irq + softirq + steal;
    }
};

struct MemoryInfo {
    int64_t total = 0;
    int64_t available = 0;
    int64_t used = 0;
};

struct SwapInfo {
    int64_t total = 0;
    int64_t free = 0;
    int64_t used = 0;
};

struct LoadAverage {
    double one_min = 0.0;
    double five_min = 0.0;
    double fifteen_min = 0.0;
    int running_tasks = 0;
    int total_tasks = 0;
};

struct UptimeInfo {
    uint64_t uptime_seconds = 0;
    uint64_t idle_seconds = 0;
};

struct DiskUsage {
    std::string path;
    int64_t total = 0;
    int64_t used = 0;

    [[nodiscard]] double percent() const {
        return total > 0 ? static_cast<double>(used) / static_cast<double>(total) * 100.0 : 0.0;
    }
};

// Linux /proc backed readers. Values that cannot be read are left at zero.
class SystemInfo {
public:
    static SystemInfo& instance();

    static CpuTimes get_cpu_times();
    static MemoryInfo get_memory_info();
    static SwapInfo get_swap_info();
    static LoadAverage get_load_average();
    static UptimeInfo get_uptime();
    static bool get_disk_usage(const std::string& path, DiskUsage& out);
    // Degrees Celsius from the lowest-numbered readable thermal_zone*/temp
    // under `thermal_root`, std::nullopt without a sensor
    static std::optional<double> get_cpu_temperature(const std::string& thermal_root);

    [[nodiscard]] unsigned int get_processor_count() const;
    [[nodiscard]] long get_clock_ticks_per_second() const;
    [[nodiscard]] uint64_t get_boot_time_seconds() const;

private:
    SystemInfo();
    unsigned int processor_count_ = 1;
    long clock_ticks_ = 100;
    uint64_t boot_time_seconds_ = 0;
};

} // namespace procpeek
