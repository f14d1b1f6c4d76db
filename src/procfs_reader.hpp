#pragma once

#include "process_info.hpp"
#include "errors.hpp"
#include <vector>
#include <map>
#include <optional>
#include <string>
#include <mutex>

namespace procpeek {

class ProcfsReader {
public:
    explicit ProcfsReader(std::string proc_root = "/proc");

    // Throws SamplingError if the proc root cannot be iterated.
    std::vector<int> list_pids();

    // Throws ProcessAccessError if stat/statm are missing or malformed.
    ProcessCounters read_counters(int pid);

    std::optional<ProcessDetails> get_process_details(int pid);

    // Error reporting
    std::vector<ParseError> get_recent_errors();
    void clear_errors();

private:
    static std::string read_file(const std::string& path);
    static std::optional<std::string> read_symlink(const std::string& path);
    [[nodiscard]] std::string pid_path(int pid) const;

    std::string get_username(int uid);
    std::map<int, std::string> uid_cache_;

    std::string proc_root_;

    // Error tracking
    void add_error(const std::string& message);
    mutable std::mutex errors_mutex_;
    std::vector<ParseError> recent_errors_;
    static constexpr size_t kMaxErrors = 10;
};

} // namespace procpeek
