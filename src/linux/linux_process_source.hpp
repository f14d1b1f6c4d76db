#pragma once

#include "../interfaces/i_process_source.hpp"
#include "../procfs_reader.hpp"

namespace procpeek {

class LinuxProcessSource : public IProcessSource {
public:
    LinuxProcessSource();
    ~LinuxProcessSource() override = default;

    std::vector<int> list_pids() override;
    ProcessCounters read_counters(int pid) override;
    std::optional<ProcessDetails> get_process_details(int pid) override;

    std::vector<ParseError> get_recent_errors() override;
    void clear_errors() override;

private:
    ProcfsReader reader_;
};

} // namespace procpeek
