#include "listing.hpp"
#include "errors.hpp"
#include "format_utils.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <thread>

namespace procpeek {

namespace {

constexpr const char* kBold = "\033[1m";
constexpr const char* kReset = "\033[0m";
constexpr size_t kRuleWidth = 64;

} // namespace

void print_listing(std::ostream& out, const Snapshot& snapshot, const ListingOptions& options) {
    const auto rows = rank(snapshot, options.sort_key, options.count);

    const std::string title = fmt::format("Top {} processes sorted by {}", options.count,
                                          sort_key_name(options.sort_key));
    const std::string header = fmt::format("{:>7} {:>7} {:>7} {:>9}  {}", "PID", "CPU%", "MEM%", "MEMORY", "NAME");

    if (options.use_color) {
        out << kBold << title << kReset << '\n' << kBold << header << kReset << '\n';
    } else {
        out << title << '\n' << header << '\n';
    }
    out << std::string(kRuleWidth, '-') << '\n';

    for (const auto& proc : rows) {
        out << fmt::format("{:>7} {:>6.1f}% {:>6.1f}% {:>9}  {}\n",
                           proc.pid, proc.cpu_percent, proc.memory_percent,
                           format_bytes(proc.memory_bytes), proc.name);
    }

    if (snapshot.omitted_count > 0) {
        out << fmt::format("({} process{} could not be read and {} omitted)\n",
                           snapshot.omitted_count,
                           snapshot.omitted_count == 1 ? "" : "es",
                           snapshot.omitted_count == 1 ? "was" : "were");
    }
    out.flush();
}

int run_listing(Sampler& sampler, const ListingOptions& options, std::ostream& out, std::ostream& err) {
    try {
        sampler.prime();
        if (options.cpu_window.count() > 0) {
            std::this_thread::sleep_for(options.cpu_window);
        }
        const Snapshot snapshot = sampler.sample();
        spdlog::debug("listing {} of {} processes", std::min(options.count, snapshot.processes.size()),
                      snapshot.processes.size());
        print_listing(out, snapshot, options);
        return 0;
    } catch (const SamplingError& e) {
        err << "proc-peek: cannot sample processes: " << e.what() << '\n';
        return 1;
    }
}

} // namespace procpeek
