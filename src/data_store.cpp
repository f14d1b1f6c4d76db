#include "data_store.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace procpeek {

DataStore::DataStore(Sampler* sampler, IProcessSource* source)
    : sampler_(sampler)
    , source_(source)
{
    if (!sampler_ || !source_) {
        throw std::invalid_argument("DataStore requires a sampler and a process source");
    }

    // Create initial empty snapshot
    auto initial = std::make_shared<Snapshot>();
    initial->timestamp = std::chrono::steady_clock::now();
    current_snapshot_ = std::move(initial);
}

DataStore::~DataStore() {
    stop();
}

void DataStore::start() {
    if (running_) return;

    stop_requested_ = false;
    running_ = true;
    collection_thread_ = std::thread(&DataStore::collection_thread_func, this);
    spdlog::debug("collector started, interval {} ms, timeout {} ms",
                  refresh_interval_ms_.load(), sample_timeout_ms_.load());
}

void DataStore::stop() {
    if (!running_) return;

    {
        // Under cv_mutex_ so the collector cannot miss the wakeup between
        // checking its predicate and blocking
        std::lock_guard lock(cv_mutex_);
        stop_requested_ = true;
        running_ = false;
    }
    cv_.notify_all();

    if (collection_thread_.joinable()) {
        collection_thread_.join();
    }
    spdlog::debug("collector stopped");
}

void DataStore::set_refresh_interval(const int ms) {
    refresh_interval_ms_ = ms;
    cv_.notify_all(); // Wake up thread to adjust timing
}

int DataStore::get_refresh_interval() const {
    return refresh_interval_ms_;
}

void DataStore::set_sample_timeout(const int ms) {
    sample_timeout_ms_ = ms;
}

int DataStore::get_sample_timeout() const {
    return sample_timeout_ms_;
}

std::shared_ptr<const Snapshot> DataStore::get_snapshot() const {
    std::lock_guard lock(data_mutex_);
    return current_snapshot_;
}

void DataStore::refresh_now() {
    {
        std::lock_guard lock(cv_mutex_);
        refresh_requested_ = true;
    }
    cv_.notify_all();
}

void DataStore::wait_for_next_tick(const int ms) {
    std::unique_lock lock(cv_mutex_);
    cv_.wait_for(lock, std::chrono::milliseconds(ms), [this] {
        return !running_ || refresh_requested_;
    });
    refresh_requested_ = false;
}

void DataStore::collection_thread_func() {
    // Take a CPU baseline so the first published snapshot has real CPU%
    if (!sampler_->has_baseline()) {
        run_bounded_pass();
        if (running_) wait_for_next_tick(kPrimeWindowMs);
    }

    while (running_) {
        tick();
        if (!running_) break;
        wait_for_next_tick(refresh_interval_ms_);
    }
}

std::optional<Snapshot> DataStore::run_bounded_pass() {
    const int timeout_ms = sample_timeout_ms_;

    SampleBudget budget;
    budget.deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    budget.cancelled = &stop_requested_;

    std::optional<Snapshot> result;
    try {
        result = sampler_->sample_within(budget);
    } catch (const SamplingError& e) {
        // Whole-snapshot failure: keep showing the previous snapshot
        ++failed_ticks_;
        spdlog::warn("sampling failed: {}", e.what());
        add_error(fmt::format("Sampling failed: {}", e.what()));
        return std::nullopt;
    }

    if (!result && !stop_requested_) {
        ++skipped_ticks_;
        spdlog::warn("sampling exceeded {} ms, tick skipped", timeout_ms);
        add_error(fmt::format("Sampling took longer than {} ms; showing previous data", timeout_ms));
    }
    return result;
}

bool DataStore::tick() {
    auto result = run_bounded_pass();
    if (!result) return false;

    auto snapshot = std::make_shared<const Snapshot>(std::move(*result));
    {
        std::lock_guard lock(data_mutex_);
        current_snapshot_ = std::move(snapshot);
    }
    return true;
}

void DataStore::add_error(const std::string& message) {
    std::lock_guard lock(errors_mutex_);
    recent_errors_.push_back({std::chrono::steady_clock::now(), message});
    if (recent_errors_.size() > kMaxErrors) {
        recent_errors_.erase(recent_errors_.begin());
    }
}

void DataStore::clear_errors() {
    {
        std::lock_guard lock(errors_mutex_);
        recent_errors_.clear();
    }
    source_->clear_errors();
}

std::vector<ParseError> DataStore::get_recent_errors() {
    std::vector<ParseError> result;
    {
        std::lock_guard lock(errors_mutex_);
        auto cutoff = std::chrono::steady_clock::now() - std::chrono::seconds(10);
        for (const auto& err : recent_errors_) {
            if (err.timestamp > cutoff) {
                result.push_back(err);
            }
        }
    }

    auto source_errors = source_->get_recent_errors();
    result.insert(result.end(), source_errors.begin(), source_errors.end());

    std::ranges::sort(result, {}, &ParseError::timestamp);
    return result;
}

} // namespace procpeek
