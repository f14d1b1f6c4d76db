#pragma once

#include "../snapshot.hpp"

namespace procpeek {

struct SystemPanelViewModel {
    SystemSummary summary;

    // Process counts
    int process_count = 0;
    int thread_count = 0;
    int running_count = 0;

    void update_from_snapshot(const Snapshot& snapshot) {
        summary = snapshot.system;
        process_count = static_cast<int>(snapshot.processes.size());
        thread_count = 0;
        running_count = 0;
        for (const auto& proc : snapshot.processes) {
            thread_count += proc.thread_count;
            if (proc.state_char == 'R') {
                ++running_count;
            }
        }
    }
};

} // namespace procpeek
