#include "procfs_reader.hpp"
#include "system_info.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>
#include <pwd.h>
#include <algorithm>
#include <charconv>
#include <fmt/format.h>

namespace fs = std::filesystem;

namespace procpeek {

namespace {

// Fields of /proc/<pid>/stat that follow "pid (comm)"
struct StatFields {
    char state = '?';
    int ppid = 0;
    uint64_t utime = 0;
    uint64_t stime = 0;
    int64_t num_threads = 1;
    uint64_t starttime = 0;
};

// comm can contain spaces and parentheses, so find the last ')'
bool split_stat(const std::string& content, std::string& comm, std::string& rest) {
    const size_t comm_start = content.find('(');
    const size_t comm_end = content.rfind(')');
    if (comm_start == std::string::npos || comm_end == std::string::npos || comm_end <= comm_start) {
        return false;
    }
    comm = content.substr(comm_start + 1, comm_end - comm_start - 1);
    if (comm_end + 2 >= content.size()) {
        return false;
    }
    rest = content.substr(comm_end + 2);
    return true;
}

bool parse_stat_fields(const std::string& rest, StatFields& out) {
    std::istringstream iss(rest);
    std::string state;
    int pgrp = 0, session = 0, tty_nr = 0, tpgid = 0;
    unsigned int flags = 0;
    uint64_t minflt = 0, cminflt = 0, majflt = 0, cmajflt = 0;
    int64_t cutime = 0, cstime = 0, priority = 0, nice = 0, itrealvalue = 0;

    iss >> state >> out.ppid >> pgrp >> session >> tty_nr >> tpgid >> flags
        >> minflt >> cminflt >> majflt >> cmajflt >> out.utime >> out.stime
        >> cutime >> cstime >> priority >> nice >> out.num_threads >> itrealvalue >> out.starttime;

    if (iss.fail() || state.empty()) {
        return false;
    }
    out.state = state[0];
    return true;
}

} // namespace

ProcfsReader::ProcfsReader(std::string proc_root)
    : proc_root_(std::move(proc_root)) {}

// Error tracking methods
void ProcfsReader::add_error(const std::string& message) {
    std::lock_guard lock(errors_mutex_);
    recent_errors_.push_back({std::chrono::steady_clock::now(), message});
    if (recent_errors_.size() > kMaxErrors) {
        recent_errors_.erase(recent_errors_.begin());
    }
}

std::vector<ParseError> ProcfsReader::get_recent_errors() {
    std::lock_guard lock(errors_mutex_);
    // Return errors from the last 10 seconds
    auto cutoff = std::chrono::steady_clock::now() - std::chrono::seconds(10);
    std::vector<ParseError> result;
    for (const auto& err : recent_errors_) {
        if (err.timestamp > cutoff) {
            result.push_back(err);
        }
    }
    return result;
}

void ProcfsReader::clear_errors() {
    std::lock_guard lock(errors_mutex_);
    recent_errors_.clear();
}

std::string ProcfsReader::read_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) return {};
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

std::optional<std::string> ProcfsReader::read_symlink(const std::string& path) {
    char buf[4096];
    const ssize_t len = readlink(path.c_str(), buf, sizeof(buf) - 1);
    if (len == -1) return std::nullopt;
    buf[len] = '\0';
    return std::string(buf);
}

std::string ProcfsReader::pid_path(int pid) const {
    return fmt::format("{}/{}", proc_root_, pid);
}

std::string ProcfsReader::get_username(const int uid) {
    if (const auto it = uid_cache_.find(uid); it != uid_cache_.end()) {
        return it->second;
    }

    const passwd* pw = getpwuid(uid);
    std::string name = pw ? pw->pw_name : std::to_string(uid);
    uid_cache_[uid] = name;
    return name;
}

std::vector<int> ProcfsReader::list_pids() {
    std::vector<int> pids;

    std::error_code ec;
    fs::directory_iterator it(proc_root_, ec);
    if (ec) {
        throw SamplingError(fmt::format("cannot list {}: {}", proc_root_, ec.message()));
    }

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            throw SamplingError(fmt::format("error while listing {}: {}", proc_root_, ec.message()));
        }

        const auto name = it->path().filename().string();
        int pid = 0;
        if (auto [ptr, parse_ec] = std::from_chars(name.data(), name.data() + name.size(), pid);
            parse_ec != std::errc{} || ptr != name.data() + name.size()) {
            continue;
        }
        pids.push_back(pid);
    }

    return pids;
}

ProcessCounters ProcfsReader::read_counters(int pid) {
    const std::string proc_path = pid_path(pid);

    // An empty read means the process exited or /proc denied us
    const std::string stat_content = read_file(proc_path + "/stat");
    if (stat_content.empty()) {
        throw ProcessAccessError(pid, fmt::format("PID {}: stat not readable", pid));
    }

    ProcessCounters counters;
    counters.pid = pid;

    std::string rest;
    if (!split_stat(stat_content, counters.name, rest)) {
        add_error(fmt::format("PID {}: malformed stat (missing comm)", pid));
        throw ProcessAccessError(pid, fmt::format("PID {}: malformed stat", pid));
    }

    StatFields fields;
    if (!parse_stat_fields(rest, fields)) {
        add_error(fmt::format("PID {}: failed to parse stat fields", pid));
        throw ProcessAccessError(pid, fmt::format("PID {}: malformed stat", pid));
    }

    counters.state_char = fields.state;
    counters.user_time = fields.utime;
    counters.kernel_time = fields.stime;
    counters.thread_count = static_cast<int>(fields.num_threads);

    // statm: size resident shared ... (in pages)
    const std::string statm = read_file(proc_path + "/statm");
    if (statm.empty()) {
        throw ProcessAccessError(pid, fmt::format("PID {}: statm not readable", pid));
    }
    std::istringstream statm_iss(statm);
    uint64_t size = 0, resident = 0;
    statm_iss >> size >> resident;
    if (statm_iss.fail()) {
        add_error(fmt::format("PID {}: failed to parse statm", pid));
        throw ProcessAccessError(pid, fmt::format("PID {}: malformed statm", pid));
    }
    const long page_size = sysconf(_SC_PAGESIZE);
    counters.resident_memory = static_cast<int64_t>(resident * page_size);

    // Owner from status; a missing status file is not worth dropping the row for
    const std::string status = read_file(proc_path + "/status");
    std::istringstream status_iss(status);
    std::string line;
    while (std::getline(status_iss, line)) {
        if (line.starts_with("Uid:")) {
            std::istringstream uid_iss(line);
            std::string key;
            int uid = 0;
            uid_iss >> key >> uid;
            counters.user_name = get_username(uid);
            break;
        }
    }
    if (counters.user_name.empty()) {
        counters.user_name = "?";
    }

    return counters;
}

std::optional<ProcessDetails> ProcfsReader::get_process_details(int pid) {
    const std::string proc_path = pid_path(pid);

    const std::string stat_content = read_file(proc_path + "/stat");
    if (stat_content.empty()) return std::nullopt;

    std::string comm, rest;
    StatFields fields;
    if (!split_stat(stat_content, comm, rest) || !parse_stat_fields(rest, fields)) {
        add_error(fmt::format("PID {}: malformed stat", pid));
        return std::nullopt;
    }

    ProcessDetails details;
    details.pid = pid;
    details.parent_pid = fields.ppid;

    auto& sys = SystemInfo::instance();
    if (const long ticks = sys.get_clock_ticks_per_second(); ticks > 0 && sys.get_boot_time_seconds() > 0) {
        const uint64_t start_seconds = sys.get_boot_time_seconds() + fields.starttime / static_cast<uint64_t>(ticks);
        details.start_time = std::chrono::system_clock::from_time_t(static_cast<time_t>(start_seconds));
    }

    if (std::string statm = read_file(proc_path + "/statm"); !statm.empty()) {
        std::istringstream statm_iss(statm);
        uint64_t size = 0;
        statm_iss >> size;
        if (!statm_iss.fail()) {
            details.virtual_memory = static_cast<int64_t>(size * sysconf(_SC_PAGESIZE));
        }
    }

    // Kernel threads have an empty cmdline; permission problems read as empty too
    std::string cmdline = read_file(proc_path + "/cmdline");
    std::ranges::replace(cmdline, '\0', ' ');
    if (!cmdline.empty() && cmdline.back() == ' ') {
        cmdline.pop_back();
    }
    if (!cmdline.empty()) {
        details.command_line = cmdline;
    }

    details.executable_path = read_symlink(proc_path + "/exe");

    // /proc/<pid>/io needs ptrace access to the target
    const std::string io = read_file(proc_path + "/io");
    std::istringstream io_iss(io);
    std::string line;
    while (std::getline(io_iss, line)) {
        std::istringstream line_iss(line);
        std::string key;
        int64_t value = 0;
        line_iss >> key >> value;
        if (line_iss.fail()) continue;
        if (key == "read_bytes:") {
            details.io_read_bytes = value;
        } else if (key == "write_bytes:") {
            details.io_write_bytes = value;
        }
    }

    return details;
}

} // namespace procpeek
