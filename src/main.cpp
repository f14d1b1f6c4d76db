#include "platform_factory.hpp"
#include "cli_options.hpp"
#include "config.hpp"
#include "logging.hpp"
#include "sampler.hpp"
#include "data_store.hpp"
#include "listing.hpp"
#include "errors.hpp"
#include "tui/tui_app.hpp"
#include <spdlog/spdlog.h>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <unistd.h>

namespace {

int run_list_mode(const procpeek::CommandLine& cmd, const procpeek::RuntimeConfig& config) {
    auto process_source = procpeek::make_process_source();
    auto system_provider = procpeek::make_system_data_provider();
    procpeek::Sampler sampler(process_source.get(), system_provider.get());

    procpeek::ListingOptions options;
    options.sort_key = cmd.sort_key;
    options.count = static_cast<size_t>(cmd.count);
    options.use_color = isatty(STDOUT_FILENO) && !config.no_color;

    return procpeek::run_listing(sampler, options, std::cout, std::cerr);
}

int run_interactive_mode(const procpeek::RuntimeConfig& config) {
    // Create platform-specific providers (owned here in main)
    auto process_source = procpeek::make_process_source();
    auto details_source = procpeek::make_details_source();
    auto system_provider = procpeek::make_system_data_provider();

    procpeek::Sampler sampler(process_source.get(), system_provider.get());

    procpeek::DataStore data_store(&sampler, process_source.get());
    data_store.set_refresh_interval(config.refresh_interval_ms);
    data_store.set_sample_timeout(config.sample_timeout_ms);

    // TuiApp does not own these resources - they're managed here
    procpeek::TuiApp app(&data_store, system_provider.get(), details_source.get());
    app.set_use_color(!config.no_color);
    app.run();
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    const std::vector<std::string> args(argv + 1, argv + argc);

    procpeek::CommandLine cmd;
    procpeek::RuntimeConfig config;
    try {
        cmd = procpeek::parse_command_line(args);
        if (cmd.command == procpeek::Command::Help) {
            std::cout << procpeek::usage_text();
            return 0;
        }
        if (cmd.command == procpeek::Command::Version) {
            std::cout << procpeek::version_text();
            return 0;
        }
        config = procpeek::load_runtime_config(cmd);
    } catch (const procpeek::UsageError& e) {
        std::cerr << "proc-peek: " << e.what() << "\n"
                  << "Try 'proc-peek --help' for more information.\n";
        return 2;
    }

    try {
        if (cmd.command == procpeek::Command::List) {
            procpeek::setup_logging(config, procpeek::LogMode::Listing);
            return run_list_mode(cmd, config);
        }

        procpeek::setup_logging(config, procpeek::LogMode::Interactive);
        const int status = run_interactive_mode(config);
        spdlog::shutdown();
        return status;
    } catch (const procpeek::RenderError& e) {
        // TuiApp has restored the terminal by the time we get here
        std::cerr << "proc-peek: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
