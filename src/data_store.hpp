#pragma once

#include "sampler.hpp"
#include "snapshot.hpp"
#include "errors.hpp"
#include <vector>
#include <memory>
#include <thread>
#include <mutex>
#include <atomic>
#include <condition_variable>
#include <optional>

namespace procpeek {

// Drives the Sampler on the refresh timer and publishes the latest snapshot.
// A pass that runs past the sample timeout is abandoned and the previous
// snapshot stays published.
class DataStore {
public:
    // Non-owning: sampler and source must outlive the DataStore.
    // `source` is only consulted for its recent parse errors.
    DataStore(Sampler* sampler, IProcessSource* source);
    ~DataStore();

    DataStore(const DataStore&) = delete;
    DataStore& operator=(const DataStore&) = delete;

    // Start/stop the background collection thread
    void start();
    void stop();

    // Refresh interval and per-pass timeout in milliseconds
    void set_refresh_interval(int ms);
    [[nodiscard]] int get_refresh_interval() const;
    void set_sample_timeout(int ms);
    [[nodiscard]] int get_sample_timeout() const;

    // Latest published snapshot (thread-safe). Never null.
    [[nodiscard]] std::shared_ptr<const Snapshot> get_snapshot() const;

    // Wake the collector for an immediate pass
    void refresh_now();

    // Run one bounded pass on the calling thread.
    // Returns true if a new snapshot was published.
    bool tick();

    // Errors from the last 10 seconds, collector and source combined
    [[nodiscard]] std::vector<ParseError> get_recent_errors();
    // Drops collector and source errors, dismissing the banner
    void clear_errors();

    [[nodiscard]] uint64_t skipped_ticks() const { return skipped_ticks_; }
    [[nodiscard]] uint64_t failed_ticks() const { return failed_ticks_; }

private:
    void collection_thread_func();
    // One sampling pass under the timeout and stop flag; failures are recorded
    std::optional<Snapshot> run_bounded_pass();
    void add_error(const std::string& message);
    // Wait for `ms` or until stop/refresh is requested
    void wait_for_next_tick(int ms);

    Sampler* sampler_ = nullptr;
    IProcessSource* source_ = nullptr;

    // Background thread
    std::thread collection_thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};   // cancels an in-flight pass
    std::atomic<int> refresh_interval_ms_{1000};
    std::atomic<int> sample_timeout_ms_{1000};
    std::condition_variable cv_;
    std::mutex cv_mutex_;
    bool refresh_requested_ = false;            // guarded by cv_mutex_

    std::atomic<uint64_t> skipped_ticks_{0};
    std::atomic<uint64_t> failed_ticks_{0};

    // Data storage with mutex protection
    mutable std::mutex data_mutex_;
    std::shared_ptr<const Snapshot> current_snapshot_;

    // Error tracking
    std::mutex errors_mutex_;
    std::vector<ParseError> recent_errors_;
    static constexpr size_t kMaxErrors = 10;

    // CPU% needs a baseline: the first pass is primed and taken after this window
    static constexpr int kPrimeWindowMs = 100;
};

} // namespace procpeek
