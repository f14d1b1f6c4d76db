#pragma once

#include "../process_info.hpp"
#include "../errors.hpp"
#include <vector>
#include <optional>

namespace procpeek {

// Platform seam for reading the OS process table.
class IProcessSource {
public:
    virtual ~IProcessSource() = default;

    // PIDs of all live processes. Throws SamplingError if the process
    // table cannot be listed at all.
    virtual std::vector<int> list_pids() = 0;

    // Current counters for one process. Throws ProcessAccessError when the
    // process has exited or cannot be read.
    virtual ProcessCounters read_counters(int pid) = 0;

    // Detail-view attributes, std::nullopt if the process is gone.
    virtual std::optional<ProcessDetails> get_process_details(int pid) = 0;

    virtual std::vector<ParseError> get_recent_errors() = 0;
    virtual void clear_errors() = 0;
};

} // namespace procpeek
