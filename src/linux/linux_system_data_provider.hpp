#pragma once

#include "../interfaces/i_system_data_provider.hpp"

namespace procpeek {

class LinuxSystemDataProvider : public ISystemDataProvider {
public:
    explicit LinuxSystemDataProvider(std::string disk_path = "/",
                                     std::string thermal_root = "/sys/class/thermal");
    ~LinuxSystemDataProvider() override = default;

    CpuTimes get_cpu_times() override;
    MemoryInfo get_memory_info() override;
    SwapInfo get_swap_info() override;
    LoadAverage get_load_average() override;
    UptimeInfo get_uptime() override;
    DiskUsage get_disk_usage() override;
    std::optional<double> get_temperature() override;

    [[nodiscard]] unsigned int get_processor_count() const override;
    [[nodiscard]] std::string get_system_info_string() const override;

private:
    // Cached from SystemInfo singleton
    unsigned int processor_count_;
    std::string disk_path_;
    std::string thermal_root_;
};

} // namespace procpeek
