#pragma once

#include "../interfaces/i_process_source.hpp"
#include "../interfaces/i_system_data_provider.hpp"

namespace procpeek {

// Stub implementations for platforms without native support.
// They return a fixed process so the UI can still be exercised.

class StubProcessSource : public IProcessSource {
public:
    std::vector<int> list_pids() override;
    ProcessCounters read_counters(int pid) override;
    std::optional<ProcessDetails> get_process_details(int pid) override;
    std::vector<ParseError> get_recent_errors() override;
    void clear_errors() override;
};

class StubSystemDataProvider : public ISystemDataProvider {
public:
    CpuTimes get_cpu_times() override;
    MemoryInfo get_memory_info() override;
    SwapInfo get_swap_info() override;
    LoadAverage get_load_average() override;
    UptimeInfo get_uptime() override;
    DiskUsage get_disk_usage() override;
    std::optional<double> get_temperature() override;
    [[nodiscard]] unsigned int get_processor_count() const override;
    [[nodiscard]] std::string get_system_info_string() const override;
};

} // namespace procpeek
