#pragma once

#include "config.hpp"

namespace procpeek {

enum class LogMode {
    Interactive,   // terminal is owned by ncurses
    Listing
};

// Install the "proc-peek" logger as spdlog's default.
// Throws spdlog::spdlog_ex if the log file cannot be opened.
void setup_logging(const RuntimeConfig& config, LogMode mode);

} // namespace procpeek
