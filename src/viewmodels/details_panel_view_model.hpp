#pragma once

#include "../process_info.hpp"
#include <chrono>
#include <optional>

namespace procpeek {

// On-demand attributes for the detail view, re-fetched at most once per interval
struct DetailsPanelViewModel {
    int details_pid = -1;
    std::optional<ProcessDetails> details;
    std::chrono::steady_clock::time_point fetched_at;

    void clear() {
        details_pid = -1;
        details.reset();
    }
};

} // namespace procpeek
