#pragma once

#include "process_info.hpp"
#include "system_info.hpp"
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <optional>
#include <vector>

namespace procpeek {

// Machine-wide figures captured alongside the process table
struct SystemSummary {
    double cpu_usage = 0.0;          // Overall (100% = all cores)
    unsigned int processor_count = 1;
    MemoryInfo memory;
    SwapInfo swap;
    LoadAverage load_average;
    UptimeInfo uptime;
    DiskUsage disk;
    std::optional<double> cpu_temperature;  // Celsius, when a sensor exists
};

// One point-in-time capture of all readable processes.
// Published as std::shared_ptr<const Snapshot> and never mutated after that.
struct Snapshot {
    std::vector<ProcessRecord> processes;

    // Processes listed by the OS that could not be read this pass
    int omitted_count = 0;

    SystemSummary system;

    uint64_t sequence = 0;
    std::chrono::steady_clock::time_point timestamp;

    [[nodiscard]] const ProcessRecord* find(int pid) const {
        auto it = std::ranges::find(processes, pid, &ProcessRecord::pid);
        return it != processes.end() ? &*it : nullptr;
    }

    [[nodiscard]] bool contains(int pid) const {
        return find(pid) != nullptr;
    }
};

} // namespace procpeek
