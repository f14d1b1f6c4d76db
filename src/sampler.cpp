#include "sampler.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace procpeek {

Sampler::Sampler(IProcessSource* source, ISystemDataProvider* system_provider)
    : source_(source)
    , system_provider_(system_provider)
{
    if (!source_ || !system_provider_) {
        throw std::invalid_argument("Sampler requires a process source and a system provider");
    }
}

void Sampler::prime() {
    run_pass(nullptr);
}

Snapshot Sampler::sample() {
    // Without a budget the pass always runs to completion
    return *run_pass(nullptr);
}

std::optional<Snapshot> Sampler::sample_within(const SampleBudget& budget) {
    return run_pass(&budget);
}

std::optional<Snapshot> Sampler::run_pass(const SampleBudget* budget) {
    const auto pids = source_->list_pids();

    const CpuTimes cpu_now = system_provider_->get_cpu_times();
    uint64_t total_cpu_delta = 0;
    if (baseline_.valid && cpu_now.total() > baseline_.system.total()) {
        total_cpu_delta = cpu_now.total() - baseline_.system.total();
    }

    const MemoryInfo mem_info = system_provider_->get_memory_info();
    const unsigned int proc_count = std::max(1u, system_provider_->get_processor_count());

    Snapshot snapshot;
    snapshot.processes.reserve(pids.size());
    std::map<int, uint64_t> next_ticks;

    for (int pid : pids) {
        if (budget && budget->exhausted()) {
            spdlog::debug("sampling pass abandoned after {} of {} processes",
                          snapshot.processes.size(), pids.size());
            return std::nullopt;
        }

        ProcessCounters counters;
        try {
            counters = source_->read_counters(pid);
        } catch (const ProcessAccessError& e) {
            ++snapshot.omitted_count;
            spdlog::trace("omitting PID {}: {}", pid, e.what());
            continue;
        }

        ProcessRecord record;
        record.pid = counters.pid;
        record.name = std::move(counters.name);
        record.memory_bytes = counters.resident_memory;
        record.state_char = counters.state_char;
        record.user_name = std::move(counters.user_name);
        record.thread_count = counters.thread_count;

        if (mem_info.total > 0) {
            record.memory_percent = static_cast<double>(record.memory_bytes)
                                    / static_cast<double>(mem_info.total) * 100.0;
        }

        const uint64_t ticks = counters.user_time + counters.kernel_time;
        if (total_cpu_delta > 0) {
            if (auto it = baseline_.process_ticks.find(pid); it != baseline_.process_ticks.end() && ticks >= it->second) {
                const uint64_t process_delta = ticks - it->second;
                record.cpu_percent = static_cast<double>(process_delta) / static_cast<double>(total_cpu_delta)
                                     * 100.0 * proc_count;
            }
        }
        next_ticks[pid] = ticks;

        snapshot.processes.push_back(std::move(record));
    }

    snapshot.system = collect_system_summary(cpu_now);
    snapshot.system.memory = mem_info;
    snapshot.system.processor_count = proc_count;

    // Commit only now: an abandoned pass must not disturb the baseline
    baseline_.valid = true;
    baseline_.system = cpu_now;
    baseline_.process_ticks = std::move(next_ticks);

    snapshot.sequence = ++samples_taken_;
    snapshot.timestamp = std::chrono::steady_clock::now();

    if (snapshot.omitted_count > 0) {
        spdlog::debug("sample {}: {} processes, {} omitted",
                      snapshot.sequence, snapshot.processes.size(), snapshot.omitted_count);
    }
    return snapshot;
}

SystemSummary Sampler::collect_system_summary(const CpuTimes& cpu_now) const {
    SystemSummary summary;

    if (baseline_.valid && cpu_now.total() > baseline_.system.total()) {
        const uint64_t total_delta = cpu_now.total() - baseline_.system.total();
        const uint64_t active_delta = cpu_now.active() >= baseline_.system.active()
                                          ? cpu_now.active() - baseline_.system.active()
                                          : 0;
        summary.cpu_usage = static_cast<double>(active_delta) / static_cast<double>(total_delta) * 100.0;
    }

    summary.swap = system_provider_->get_swap_info();
    summary.load_average = system_provider_->get_load_average();
    summary.uptime = system_provider_->get_uptime();
    summary.disk = system_provider_->get_disk_usage();
    summary.cpu_temperature = system_provider_->get_temperature();
    return summary;
}

} // namespace procpeek
