#include "linux_system_data_provider.hpp"
#include "../system_info.hpp"

#include <spdlog/spdlog.h>
#include <sys/utsname.h>
#include <fstream>

namespace procpeek {

// Helper to parse /etc/os-release for distribution name
static std::string get_distro_name() {
    std::ifstream file("/etc/os-release");
    if (!file) {
        // Try fallback
        file.open("/usr/lib/os-release");
    }
    if (!file) {
        return "";
    }

    std::string line;
    std::string pretty_name;
    while (std::getline(file, line)) {
        if (line.rfind("PRETTY_NAME=", 0) == 0) {
            pretty_name = line.substr(12);
            // Remove quotes if present
            if (pretty_name.size() >= 2 && pretty_name.front() == '"' && pretty_name.back() == '"') {
                pretty_name = pretty_name.substr(1, pretty_name.size() - 2);
            }
            break;
        }
    }
    return pretty_name;
}

LinuxSystemDataProvider::LinuxSystemDataProvider(std::string disk_path, std::string thermal_root)
    : processor_count_(SystemInfo::instance().get_processor_count())
    , disk_path_(std::move(disk_path))
    , thermal_root_(std::move(thermal_root)) {}

CpuTimes LinuxSystemDataProvider::get_cpu_times() {
    return SystemInfo::get_cpu_times();
}

MemoryInfo LinuxSystemDataProvider::get_memory_info() {
    return SystemInfo::get_memory_info();
}

SwapInfo LinuxSystemDataProvider::get_swap_info() {
    return SystemInfo::get_swap_info();
}

LoadAverage LinuxSystemDataProvider::get_load_average() {
    return SystemInfo::get_load_average();
}

UptimeInfo LinuxSystemDataProvider::get_uptime() {
    return SystemInfo::get_uptime();
}

DiskUsage LinuxSystemDataProvider::get_disk_usage() {
    DiskUsage usage;
    usage.path = disk_path_;
    if (!SystemInfo::get_disk_usage(disk_path_, usage)) {
        spdlog::debug("statvfs({}) failed, disk usage unavailable", disk_path_);
    }
    return usage;
}

std::optional<double> LinuxSystemDataProvider::get_temperature() {
    return SystemInfo::get_cpu_temperature(thermal_root_);
}

unsigned int LinuxSystemDataProvider::get_processor_count() const {
    return processor_count_;
}

std::string LinuxSystemDataProvider::get_system_info_string() const {
    struct utsname uts;
    if (uname(&uts) != 0) {
        return "Linux";
    }

    // Format: "Linux <kernel> <arch> [(<distro>)]"
    std::string result = std::string(uts.sysname) + " " + uts.release + " " + uts.machine;
    if (std::string distro = get_distro_name(); !distro.empty()) {
        result += " (" + distro + ")";
    }
    return result;
}

} // namespace procpeek
