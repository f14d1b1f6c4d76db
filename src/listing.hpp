#pragma once

#include "ranking.hpp"
#include "sampler.hpp"
#include <chrono>
#include <ostream>

namespace procpeek {

struct ListingOptions {
    SortKey sort_key = SortKey::Cpu;
    size_t count = 10;
    bool use_color = false;                             // bold header
    std::chrono::milliseconds cpu_window{100};          // between prime and sample
};

// Print one ranked snapshot as a table
void print_listing(std::ostream& out, const Snapshot& snapshot, const ListingOptions& options);

// One-shot listing mode: sample once, print, return the exit status.
// A whole-snapshot SamplingError is reported on `err` and yields 1.
int run_listing(Sampler& sampler, const ListingOptions& options, std::ostream& out, std::ostream& err);

} // namespace procpeek
