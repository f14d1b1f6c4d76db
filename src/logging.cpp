#include "logging.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>

namespace procpeek {

void setup_logging(const RuntimeConfig& config, const LogMode mode) {
    spdlog::sink_ptr sink;
    if (!config.log_file.empty()) {
        sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file);
        sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
    } else if (mode == LogMode::Interactive) {
        // Anything written to the terminal would tear the ncurses screen
        sink = std::make_shared<spdlog::sinks::null_sink_mt>();
    } else {
        auto stderr_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        if (config.no_color) {
            stderr_sink->set_color_mode(spdlog::color_mode::never);
        }
        stderr_sink->set_pattern("proc-peek: [%^%l%$] %v");
        sink = std::move(stderr_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("proc-peek", std::move(sink));
    logger->set_level(spdlog::level::from_str(config.log_level));
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(std::move(logger));

    for (const auto& warning : config.warnings) {
        spdlog::warn("{}", warning);
    }
    spdlog::debug("logging at level {}", config.log_level);
}

} // namespace procpeek
