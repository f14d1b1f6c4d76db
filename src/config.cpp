#include "config.hpp"
#include "errors.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <array>
#include <charconv>
#include <cstdlib>
#include <optional>
#include <string_view>

namespace procpeek {

namespace {

const char* getenv_nonempty(const EnvLookup& getenv_fn, const char* name) {
    const char* v = getenv_fn(name);
    if (v && *v) return v;
    return nullptr;
}

std::optional<int> parse_int(const char* text) {
    const std::string_view sv(text);
    int value = 0;
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
    if (ec != std::errc{} || ptr != sv.data() + sv.size()) return std::nullopt;
    return value;
}

// Range-checked integer from the environment; nullopt (with a warning) if unusable
std::optional<int> getenv_ms(const EnvLookup& getenv_fn, const char* name, int lo, int hi,
                             std::vector<std::string>& warnings) {
    const char* v = getenv_nonempty(getenv_fn, name);
    if (!v) return std::nullopt;

    auto value = parse_int(v);
    if (!value || *value < lo || *value > hi) {
        warnings.push_back(fmt::format("ignoring {}='{}': expected milliseconds in [{}, {}]", name, v, lo, hi));
        return std::nullopt;
    }
    return value;
}

void check_flag_range(const char* flag, int ms, int lo, int hi) {
    if (ms < lo || ms > hi) {
        throw UsageError(fmt::format("{} must be between {:g} and {:g} seconds", flag, lo / 1000.0, hi / 1000.0));
    }
}

} // namespace

bool is_valid_log_level(const std::string& level) {
    static constexpr std::array<std::string_view, 7> kLevels = {
        "trace", "debug", "info", "warn", "error", "critical", "off"};
    return std::ranges::find(kLevels, std::string_view(level)) != kLevels.end();
}

RuntimeConfig load_runtime_config(const CommandLine& cmd) {
    return load_runtime_config(cmd, [](const char* name) { return std::getenv(name); });
}

RuntimeConfig load_runtime_config(const CommandLine& cmd, const EnvLookup& getenv_fn) {
    RuntimeConfig config;

    // Environment
    const auto env_interval = getenv_ms(getenv_fn, "PROC_PEEK_INTERVAL_MS",
                                        kMinRefreshIntervalMs, kMaxRefreshIntervalMs, config.warnings);
    const auto env_timeout = getenv_ms(getenv_fn, "PROC_PEEK_TIMEOUT_MS",
                                       kMinSampleTimeoutMs, kMaxSampleTimeoutMs, config.warnings);
    if (const char* v = getenv_nonempty(getenv_fn, "PROC_PEEK_LOG_FILE")) {
        config.log_file = v;
    }
    if (const char* v = getenv_nonempty(getenv_fn, "PROC_PEEK_LOG_LEVEL")) {
        if (is_valid_log_level(v)) {
            config.log_level = v;
        } else {
            config.warnings.push_back(fmt::format("ignoring PROC_PEEK_LOG_LEVEL='{}': unknown level", v));
        }
    }
    // Any value, even empty, disables colour (no-color.org)
    config.no_color = getenv_fn("NO_COLOR") != nullptr;

    // Command line
    if (cmd.refresh_interval_ms) {
        check_flag_range("--interval", *cmd.refresh_interval_ms, kMinRefreshIntervalMs, kMaxRefreshIntervalMs);
    }
    if (cmd.sample_timeout_ms) {
        check_flag_range("--timeout", *cmd.sample_timeout_ms, kMinSampleTimeoutMs, kMaxSampleTimeoutMs);
    }
    if (cmd.log_level && !is_valid_log_level(*cmd.log_level)) {
        throw UsageError(fmt::format("invalid log level '{}': expected trace, debug, info, warn, error, critical or off",
                                     *cmd.log_level));
    }

    config.refresh_interval_ms = cmd.refresh_interval_ms.value_or(env_interval.value_or(config.refresh_interval_ms));
    // The timeout follows the interval unless set on its own
    config.sample_timeout_ms = cmd.sample_timeout_ms.value_or(env_timeout.value_or(config.refresh_interval_ms));
    if (cmd.log_file) config.log_file = *cmd.log_file;
    if (cmd.log_level) config.log_level = *cmd.log_level;

    return config;
}

} // namespace procpeek
