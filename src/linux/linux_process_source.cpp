#include "linux_process_source.hpp"

namespace procpeek {

LinuxProcessSource::LinuxProcessSource() = default;

std::vector<int> LinuxProcessSource::list_pids() {
    return reader_.list_pids();
}

ProcessCounters LinuxProcessSource::read_counters(int pid) {
    return reader_.read_counters(pid);
}

std::optional<ProcessDetails> LinuxProcessSource::get_process_details(int pid) {
    return reader_.get_process_details(pid);
}

std::vector<ParseError> LinuxProcessSource::get_recent_errors() {
    return reader_.get_recent_errors();
}

void LinuxProcessSource::clear_errors() {
    reader_.clear_errors();
}

} // namespace procpeek
