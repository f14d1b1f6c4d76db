#include "ranking.hpp"
#include <algorithm>
#include <cctype>

namespace procpeek {

namespace {

// <0, 0, >0 like strcasecmp, ASCII only
int compare_ignore_case(const std::string& a, const std::string& b) {
    const size_t n = std::min(a.size(), b.size());
    for (size_t i = 0; i < n; ++i) {
        const int ca = std::tolower(static_cast<unsigned char>(a[i]));
        const int cb = std::tolower(static_cast<unsigned char>(b[i]));
        if (ca != cb) return ca - cb;
    }
    if (a.size() == b.size()) return 0;
    return a.size() < b.size() ? -1 : 1;
}

} // namespace

std::optional<SortKey> parse_sort_key(std::string_view text) {
    if (text == "cpu") return SortKey::Cpu;
    if (text == "memory") return SortKey::Memory;
    if (text == "name") return SortKey::Name;
    if (text == "pid") return SortKey::Pid;
    return std::nullopt;
}

const char* sort_key_name(SortKey key) {
    switch (key) {
        case SortKey::Cpu:
            return "cpu";
        case SortKey::Memory:
            return "memory";
        case SortKey::Name:
            return "name";
        case SortKey::Pid:
            return "pid";
    }
    return "cpu";
}

SortKey next_sort_key(SortKey key) {
    switch (key) {
        case SortKey::Cpu:
            return SortKey::Memory;
        case SortKey::Memory:
            return SortKey::Name;
        case SortKey::Name:
            return SortKey::Pid;
        case SortKey::Pid:
            return SortKey::Cpu;
    }
    return SortKey::Cpu;
}

bool ranks_before(const ProcessRecord& a, const ProcessRecord& b, SortKey key) {
    switch (key) {
        case SortKey::Cpu:
            if (a.cpu_percent != b.cpu_percent) return a.cpu_percent > b.cpu_percent;
            break;
        case SortKey::Memory:
            if (a.memory_bytes != b.memory_bytes) return a.memory_bytes > b.memory_bytes;
            break;
        case SortKey::Name:
            if (const int cmp = compare_ignore_case(a.name, b.name); cmp != 0) return cmp < 0;
            break;
        case SortKey::Pid:
            break;
    }
    return a.pid < b.pid;
}

std::vector<ProcessRecord> rank(const std::vector<ProcessRecord>& records, SortKey key, size_t limit) {
    std::vector<ProcessRecord> ranked = records;
    const size_t keep = std::min(limit, ranked.size());
    auto less = [key](const ProcessRecord& a, const ProcessRecord& b) { return ranks_before(a, b, key); };

    // Stable so that the result stays deterministic even for duplicate PIDs.
    // Truncating after a full sort keeps rank(S, k, n) a prefix of rank(S, k, |S|).
    std::ranges::stable_sort(ranked, less);
    ranked.resize(keep);
    return ranked;
}

std::vector<ProcessRecord> rank(const Snapshot& snapshot, SortKey key, size_t limit) {
    return rank(snapshot.processes, key, limit);
}

} // namespace procpeek
