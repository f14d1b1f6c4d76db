#pragma once

#include "ranking.hpp"
#include <optional>
#include <string>
#include <vector>

namespace procpeek {

enum class Command {
    Interactive,
    List,
    Help,
    Version
};

// Parsed command line. Optional fields are only set when the flag was given,
// so environment defaults can fill the rest.
struct CommandLine {
    Command command = Command::Interactive;

    // Interactive mode
    std::optional<int> refresh_interval_ms;
    std::optional<int> sample_timeout_ms;

    // Any mode
    std::optional<std::string> log_file;
    std::optional<std::string> log_level;

    // list subcommand
    SortKey sort_key = SortKey::Cpu;
    int count = 10;
};

// Parse arguments (without argv[0]). Throws UsageError on bad input.
CommandLine parse_command_line(const std::vector<std::string>& args);

std::string usage_text();
std::string version_text();

} // namespace procpeek
