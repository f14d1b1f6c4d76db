#pragma once

#include "cli_options.hpp"
#include <functional>
#include <string>
#include <vector>

namespace procpeek {

// Settings after merging compiled defaults, PROC_PEEK_* environment
// variables and command-line flags (in that order of precedence).
struct RuntimeConfig {
    int refresh_interval_ms = 1000;
    int sample_timeout_ms = 1000;
    std::string log_file;            // empty: no file sink
    std::string log_level = "warn";
    bool no_color = false;

    // Ignored environment values, reported once logging is up
    std::vector<std::string> warnings;
};

constexpr int kMinRefreshIntervalMs = 100;
constexpr int kMaxRefreshIntervalMs = 60000;
constexpr int kMinSampleTimeoutMs = 50;
constexpr int kMaxSampleTimeoutMs = 60000;

using EnvLookup = std::function<const char*(const char*)>;

// Throws UsageError when a flag value is out of range. Bad environment
// values fall back to the default and add a warning instead.
RuntimeConfig load_runtime_config(const CommandLine& cmd);
RuntimeConfig load_runtime_config(const CommandLine& cmd, const EnvLookup& getenv_fn);

[[nodiscard]] bool is_valid_log_level(const std::string& level);

} // namespace procpeek
