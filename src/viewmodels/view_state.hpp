#pragma once

#include "../ranking.hpp"
#include <cstddef>
#include <limits>
#include <optional>

namespace procpeek {

constexpr size_t kUnlimitedRows = std::numeric_limits<size_t>::max();

// User-controlled view settings. Survives snapshot refreshes.
struct ViewState {
    SortKey sort_key = SortKey::Cpu;
    size_t row_limit = kUnlimitedRows;   // always >= 1
    std::optional<int> selected_pid;
};

} // namespace procpeek
