#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace procpeek {

// Process state characters (platform-neutral meanings):
// 'R' = Running/Runnable
// 'S' = Sleeping (interruptible)
// 'D' = Disk sleep (uninterruptible)
// 'Z' = Zombie
// 'T' = Stopped (signal or debugger)
// 'I' = Idle
// '?' = Unknown

// Raw per-process counters as read from the OS. CPU time is cumulative,
// only the delta between two reads is meaningful.
struct ProcessCounters {
    int pid = 0;
    std::string name;
    char state_char = '?';
    std::string user_name;
    int thread_count = 0;

    // Linux: jiffies (clock ticks)
    uint64_t user_time = 0;
    uint64_t kernel_time = 0;

    int64_t resident_memory = 0;     // RSS in bytes
};

// One row of a snapshot. Built by the Sampler, never modified afterwards.
struct ProcessRecord {
    int pid = 0;
    std::string name;
    double cpu_percent = 0.0;        // Per-core (100% = 1 core)
    int64_t memory_bytes = 0;        // Resident set size

    double memory_percent = 0.0;     // Percentage of total system memory
    char state_char = '?';
    std::string user_name;
    int thread_count = 0;
};

// Extra attributes fetched on demand for the detail view.
// Empty optionals mean the OS refused or the value does not exist.
struct ProcessDetails {
    int pid = 0;
    int parent_pid = 0;
    std::optional<std::string> command_line;
    std::optional<std::string> executable_path;
    int64_t virtual_memory = 0;
    std::optional<std::chrono::system_clock::time_point> start_time;
    std::optional<int64_t> io_read_bytes;
    std::optional<int64_t> io_write_bytes;
};

} // namespace procpeek
