#include "stub_providers.hpp"

namespace procpeek {

namespace {
constexpr int kStubPid = 1;
}

// StubProcessSource - one dummy process

std::vector<int> StubProcessSource::list_pids() {
    return {kStubPid};
}

ProcessCounters StubProcessSource::read_counters(int pid) {
    if (pid != kStubPid) {
        throw ProcessAccessError(pid, "no such process");
    }

    ProcessCounters counters;
    counters.pid = kStubPid;
    counters.name = "stub_init";
    counters.state_char = 'S';
    counters.user_name = "root";
    counters.thread_count = 1;
    counters.resident_memory = 1024 * 1024;
    return counters;
}

std::optional<ProcessDetails> StubProcessSource::get_process_details(int pid) {
    if (pid != kStubPid) return std::nullopt;

    ProcessDetails details;
    details.pid = kStubPid;
    details.parent_pid = 0;
    details.command_line = "/sbin/stub_init";
    details.executable_path = "/sbin/stub_init";
    details.virtual_memory = 4 * 1024 * 1024;
    return details;
}

std::vector<ParseError> StubProcessSource::get_recent_errors() {
    return {};
}

void StubProcessSource::clear_errors() {
    // Nothing to clear
}

// StubSystemDataProvider - returns minimal system data

CpuTimes StubSystemDataProvider::get_cpu_times() {
    return CpuTimes{};
}

MemoryInfo StubSystemDataProvider::get_memory_info() {
    MemoryInfo info;
    info.total = 8LL * 1024 * 1024 * 1024;  // 8 GB
    info.used = 1LL * 1024 * 1024 * 1024;   // 1 GB
    info.available = info.total - info.used;
    return info;
}

SwapInfo StubSystemDataProvider::get_swap_info() {
    SwapInfo info;
    info.total = 2LL * 1024 * 1024 * 1024;
    info.used = 0;
    info.free = info.total;
    return info;
}

LoadAverage StubSystemDataProvider::get_load_average() {
    return LoadAverage{};
}

UptimeInfo StubSystemDataProvider::get_uptime() {
    return UptimeInfo{};
}

DiskUsage StubSystemDataProvider::get_disk_usage() {
    return DiskUsage{"/", 0, 0};
}

std::optional<double> StubSystemDataProvider::get_temperature() {
    return std::nullopt;
}

unsigned int StubSystemDataProvider::get_processor_count() const {
    return 1;
}

std::string StubSystemDataProvider::get_system_info_string() const {
    return "stub platform";
}

} // namespace procpeek
