#pragma once

#include "snapshot.hpp"
#include "interfaces/i_process_source.hpp"
#include "interfaces/i_system_data_provider.hpp"
#include <atomic>
#include <chrono>
#include <map>
#include <optional>

namespace procpeek {

// Limits for one bounded sampling pass. Checked between processes.
struct SampleBudget {
    std::chrono::steady_clock::time_point deadline = std::chrono::steady_clock::time_point::max();
    const std::atomic<bool>* cancelled = nullptr;

    [[nodiscard]] bool exhausted() const {
        if (cancelled && cancelled->load()) return true;
        return std::chrono::steady_clock::now() >= deadline;
    }
};

// Builds Snapshots from a process source. CPU% needs two passes, so the
// sampler keeps the previous pass's counters as its baseline.
class Sampler {
public:
    // Non-owning: both providers must outlive the sampler.
    Sampler(IProcessSource* source, ISystemDataProvider* system_provider);

    // Record a CPU baseline without producing a snapshot.
    void prime();

    // Full pass. Throws SamplingError if the process table cannot be listed.
    Snapshot sample();

    // Bounded pass; std::nullopt if the budget ran out before the pass finished.
    // An abandoned pass leaves the baseline untouched.
    std::optional<Snapshot> sample_within(const SampleBudget& budget);

    [[nodiscard]] bool has_baseline() const { return baseline_.valid; }
    [[nodiscard]] uint64_t samples_taken() const { return samples_taken_; }

private:
    struct CpuBaseline {
        bool valid = false;
        CpuTimes system;
        std::map<int, uint64_t> process_ticks;  // pid -> user + kernel ticks
    };

    std::optional<Snapshot> run_pass(const SampleBudget* budget);
    SystemSummary collect_system_summary(const CpuTimes& cpu_now) const;

    IProcessSource* source_ = nullptr;
    ISystemDataProvider* system_provider_ = nullptr;

    CpuBaseline baseline_;
    uint64_t samples_taken_ = 0;
};

} // namespace procpeek
