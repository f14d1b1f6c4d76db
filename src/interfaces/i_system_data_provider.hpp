#pragma once

#include "../system_info.hpp"
#include <optional>
#include <string>

namespace procpeek {

class ISystemDataProvider {
public:
    virtual ~ISystemDataProvider() = default;

    virtual CpuTimes get_cpu_times() = 0;
    virtual MemoryInfo get_memory_info() = 0;
    virtual SwapInfo get_swap_info() = 0;
    virtual LoadAverage get_load_average() = 0;
    virtual UptimeInfo get_uptime() = 0;
    virtual DiskUsage get_disk_usage() = 0;
    // CPU temperature in degrees Celsius, std::nullopt if there is no sensor
    virtual std::optional<double> get_temperature() = 0;

    [[nodiscard]] virtual unsigned int get_processor_count() const = 0;
    [[nodiscard]] virtual std::string get_system_info_string() const = 0;
};

} // namespace procpeek
