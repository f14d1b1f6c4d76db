#pragma once

#include "snapshot.hpp"
#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace procpeek {

enum class SortKey {
    Cpu,
    Memory,
    Name,
    Pid
};

// CLI spelling: "cpu", "memory", "name", "pid"
[[nodiscard]] std::optional<SortKey> parse_sort_key(std::string_view text);
[[nodiscard]] const char* sort_key_name(SortKey key);
[[nodiscard]] SortKey next_sort_key(SortKey key);

// Strict weak ordering used by rank(). Total for records with distinct PIDs.
[[nodiscard]] bool ranks_before(const ProcessRecord& a, const ProcessRecord& b, SortKey key);

// Order the records by key and keep at most `limit` of them.
//   cpu, memory: descending, ties by ascending PID
//   name:        case-insensitive ascending, ties by ascending PID
//   pid:         ascending
[[nodiscard]] std::vector<ProcessRecord> rank(const std::vector<ProcessRecord>& records,
                                              SortKey key, size_t limit);
[[nodiscard]] std::vector<ProcessRecord> rank(const Snapshot& snapshot, SortKey key, size_t limit);

} // namespace procpeek
