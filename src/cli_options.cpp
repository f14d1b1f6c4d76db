#include "cli_options.hpp"
#include "errors.hpp"
#include <fmt/format.h>
#include <charconv>
#include <cmath>
#include <string_view>

#ifndef PROC_PEEK_VERSION
#define PROC_PEEK_VERSION "0.1.0"
#endif

namespace procpeek {

namespace {

// Walks the argument list, splitting "--opt=value" into name and inline value
class ArgCursor {
public:
    explicit ArgCursor(const std::vector<std::string>& args) : args_(args) {}

    [[nodiscard]] bool done() const { return pos_ >= args_.size(); }

    // Advance to the next argument; returns the option name part
    std::string_view next() {
        current_ = args_[pos_++];
        inline_value_.reset();
        if (current_.starts_with("--")) {
            if (const auto eq = current_.find('='); eq != std::string_view::npos) {
                inline_value_ = current_.substr(eq + 1);
                return current_.substr(0, eq);
            }
        }
        return current_;
    }

    [[nodiscard]] bool has_inline_value() const { return inline_value_.has_value(); }

    // Value for the option just returned by next()
    std::string value(std::string_view option) {
        if (inline_value_) return std::string(*inline_value_);
        if (done()) {
            throw UsageError(fmt::format("option '{}' requires a value", option));
        }
        return args_[pos_++];
    }

private:
    const std::vector<std::string>& args_;
    size_t pos_ = 0;
    std::string_view current_;
    std::optional<std::string_view> inline_value_;
};

int parse_count(const std::string& text) {
    int value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (text.empty() || ec != std::errc{} || ptr != last || value < 1) {
        throw UsageError(fmt::format("invalid count '{}': must be a positive integer", text));
    }
    return value;
}

// Seconds (fractions allowed) to milliseconds
int parse_seconds(std::string_view option, const std::string& text) {
    double seconds = 0.0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, seconds);
    if (text.empty() || ec != std::errc{} || ptr != last || !std::isfinite(seconds) || seconds <= 0.0
        || seconds > 86400.0) {
        throw UsageError(fmt::format("invalid value '{}' for {}: expected a number of seconds", text, option));
    }
    return static_cast<int>(std::lround(seconds * 1000.0));
}

} // namespace

CommandLine parse_command_line(const std::vector<std::string>& args) {
    CommandLine cmd;
    bool saw_subcommand = false;
    ArgCursor cursor(args);

    while (!cursor.done()) {
        const std::string_view opt = cursor.next();

        if (opt == "-h" || opt == "--help") {
            cmd.command = Command::Help;
            return cmd;
        }
        if (opt == "-V" || opt == "--version") {
            cmd.command = Command::Version;
            return cmd;
        }

        if (opt == "--log-file") {
            cmd.log_file = cursor.value(opt);
        } else if (opt == "--log-level") {
            cmd.log_level = cursor.value(opt);
        } else if (opt == "--interval" || opt == "--timeout") {
            if (cmd.command == Command::List) {
                throw UsageError(fmt::format("option '{}' only applies to interactive mode", opt));
            }
            const int ms = parse_seconds(opt, cursor.value(opt));
            if (opt == "--interval") {
                cmd.refresh_interval_ms = ms;
            } else {
                cmd.sample_timeout_ms = ms;
            }
        } else if (opt == "-s" || opt == "--sort") {
            if (cmd.command != Command::List) {
                throw UsageError(fmt::format("option '{}' is only valid after 'list'", opt));
            }
            const std::string value = cursor.value(opt);
            auto key = parse_sort_key(value);
            if (!key) {
                throw UsageError(fmt::format("invalid sort key '{}': expected cpu, memory, name or pid", value));
            }
            cmd.sort_key = *key;
        } else if (opt == "-n" || opt == "--count") {
            if (cmd.command != Command::List) {
                throw UsageError(fmt::format("option '{}' is only valid after 'list'", opt));
            }
            cmd.count = parse_count(cursor.value(opt));
        } else if (opt == "list" && !saw_subcommand) {
            if (cmd.refresh_interval_ms || cmd.sample_timeout_ms) {
                throw UsageError("--interval and --timeout only apply to interactive mode");
            }
            cmd.command = Command::List;
            saw_subcommand = true;
        } else if (opt.starts_with("-")) {
            throw UsageError(fmt::format("unknown option '{}'", opt));
        } else {
            throw UsageError(fmt::format("unexpected argument '{}'", opt));
        }
    }

    return cmd;
}

std::string usage_text() {
    return "proc-peek - mini process monitor.\n"
           "Run without a subcommand to launch the interactive dashboard.\n"
           "\n"
           "Usage:\n"
           "  proc-peek [--interval SECONDS] [--timeout SECONDS] [--log-file PATH] [--log-level LEVEL]\n"
           "  proc-peek list [--sort|-s cpu|memory|name|pid] [--count|-n N]\n"
           "  proc-peek --help | --version\n"
           "\n"
           "Options:\n"
           "  --interval SECONDS   Refresh interval (0.1 - 60, default 1)\n"
           "  --timeout SECONDS    Give up on a sample after this long (default: the interval)\n"
           "  --log-file PATH      Write diagnostics to PATH\n"
           "  --log-level LEVEL    trace, debug, info, warn, error, critical or off (default warn)\n"
           "  -s, --sort KEY       Sort the listing by cpu, memory, name or pid (default cpu)\n"
           "  -n, --count N        Number of processes to list (default 10)\n"
           "  -h, --help           Show this help\n"
           "  -V, --version        Show the version\n"
           "\n"
           "Environment:\n"
           "  PROC_PEEK_INTERVAL_MS, PROC_PEEK_TIMEOUT_MS, PROC_PEEK_LOG_FILE, PROC_PEEK_LOG_LEVEL, NO_COLOR\n";
}

std::string version_text() {
    return fmt::format("proc-peek {}\n", PROC_PEEK_VERSION);
}

} // namespace procpeek
