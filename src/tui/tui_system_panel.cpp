#include "tui_app.hpp"
#include "tui_colors.hpp"
#include "../format_utils.hpp"
#include <fmt/format.h>

namespace procpeek {

void TuiApp::render_system_panel() {
    if (!system_win_) return;

    const auto& sp = system_panel_;
    const auto& sys = sp.summary;
    const int max_x = getmaxx(system_win_);

    // Row 0: CPU, memory, swap
    int row = 0;
    const std::string cpu_label = fmt::format("CPU({})", sys.processor_count);
    mvwprintw(system_win_, row, 1, "%s", cpu_label.c_str());
    draw_progress_bar(system_win_, row, 9, 20, sys.cpu_usage, COLOR_PAIR_CPU_BAR,
                      fmt::format("{:3.0f}%", sys.cpu_usage));

    const double mem_pct = sys.memory.total > 0
        ? static_cast<double>(sys.memory.used) / static_cast<double>(sys.memory.total) * 100.0 : 0.0;
    const std::string mem_label = format_bytes(sys.memory.used) + "/" + format_bytes(sys.memory.total);
    mvwprintw(system_win_, row, 36, "Mem");
    draw_progress_bar(system_win_, row, 40, 20, mem_pct, COLOR_PAIR_MEM_BAR, mem_label);

    int x = 40 + 20 + static_cast<int>(mem_label.length()) + 3;
    if (sys.swap.total > 0 && x + 25 < max_x) {
        const double swap_pct = static_cast<double>(sys.swap.used) / static_cast<double>(sys.swap.total) * 100.0;
        const std::string swap_label = format_bytes(sys.swap.used) + "/" + format_bytes(sys.swap.total);
        mvwprintw(system_win_, row, x, "Swap");
        draw_progress_bar(system_win_, row, x + 5, 15, swap_pct, COLOR_PAIR_SWAP_BAR, swap_label);
    }

    // Row 1: tasks, load, uptime, disk
    row = 1;
    const std::string tasks = fmt::format("Tasks: {}, {} thr; {} running",
                                          sp.process_count, sp.thread_count, sp.running_count);
    mvwprintw(system_win_, row, 1, "%s", tasks.c_str());

    const std::string load = fmt::format("Load: {:.2f} {:.2f} {:.2f}",
                                         sys.load_average.one_min,
                                         sys.load_average.five_min,
                                         sys.load_average.fifteen_min);
    const int load_x = static_cast<int>(tasks.length()) + 4;
    mvwprintw(system_win_, row, load_x, "%s", load.c_str());

    const std::string uptime = "Uptime: " + format_uptime(static_cast<int64_t>(sys.uptime.uptime_seconds));
    const int uptime_x = load_x + static_cast<int>(load.length()) + 4;
    mvwprintw(system_win_, row, uptime_x, "%s", uptime.c_str());

    int next_x = uptime_x + static_cast<int>(uptime.length()) + 4;
    if (sys.cpu_temperature) {
        const std::string temp = fmt::format("Temp: {:.1f}C", *sys.cpu_temperature);
        if (next_x + static_cast<int>(temp.length()) < max_x) {
            mvwprintw(system_win_, row, next_x, "%s", temp.c_str());
        }
        next_x += static_cast<int>(temp.length()) + 4;
    }

    if (sys.disk.total > 0) {
        const std::string disk = fmt::format("Disk {}: {}/{} ({:.0f}%)", sys.disk.path,
                                             format_bytes(sys.disk.used), format_bytes(sys.disk.total),
                                             sys.disk.percent());
        const int disk_x = next_x;
        if (disk_x + static_cast<int>(disk.length()) < max_x) {
            mvwprintw(system_win_, row, disk_x, "%s", disk.c_str());
        }
    }
}

} // namespace procpeek
