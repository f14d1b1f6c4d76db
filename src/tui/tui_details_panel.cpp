#include "tui_app.hpp"
#include "tui_colors.hpp"
#include "../format_utils.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace procpeek {

void TuiApp::refresh_selected_details() {
    const auto& selected = dashboard_.view().selected_pid;
    if (!selected) {
        details_panel_.clear();
        return;
    }

    // Re-read at most once per refresh interval
    const auto now = std::chrono::steady_clock::now();
    const auto max_age = std::chrono::milliseconds(data_store_->get_refresh_interval());
    if (details_panel_.details_pid == *selected && now - details_panel_.fetched_at < max_age) {
        return;
    }

    details_panel_.details_pid = *selected;
    details_panel_.details = details_source_->get_process_details(*selected);
    details_panel_.fetched_at = now;
}

void TuiApp::render_details_panel() {
    const ProcessRecord* record = dashboard_.detail_record();
    if (!record) return;

    int max_y, max_x;
    getmaxyx(stdscr, max_y, max_x);

    std::vector<std::pair<std::string, std::string>> fields = {
        {"PID", std::to_string(record->pid)},
        {"Name", record->name},
        {"User", record->user_name},
        {"State", std::string(1, record->state_char)},
        {"CPU", fmt::format("{:.1f}%", record->cpu_percent)},
        {"Memory", fmt::format("{} ({:.1f}%)", format_bytes(record->memory_bytes), record->memory_percent)},
        {"Threads", std::to_string(record->thread_count)},
    };

    const auto& details = details_panel_.details;
    if (details && details->pid == record->pid) {
        fields.emplace_back("Parent PID", std::to_string(details->parent_pid));
        fields.emplace_back("Virtual", format_bytes(details->virtual_memory));
        if (details->start_time) {
            fields.emplace_back("Started", format_time(*details->start_time));
        }
        if (details->io_read_bytes && details->io_write_bytes) {
            fields.emplace_back("Disk I/O", fmt::format("{} read, {} written",
                                                        format_bytes(*details->io_read_bytes),
                                                        format_bytes(*details->io_write_bytes)));
        }
        fields.emplace_back("Executable", details->executable_path.value_or("(not accessible)"));
        fields.emplace_back("Command", details->command_line.value_or("(not accessible)"));
    } else {
        fields.emplace_back("Details", "(not available)");
    }

    // Dialog dimensions
    const int width = std::min(max_x - 2, 78);
    const int height = std::min(max_y - 2, static_cast<int>(fields.size()) + 4);
    if (width < 20 || height < 5) return;
    const int win_x = (max_x - width) / 2;
    const int win_y = (max_y - height) / 2;

    WINDOW* win = newwin(height, width, win_y, win_x);
    if (!win) return;

    wbkgd(win, COLOR_PAIR(COLOR_PAIR_DIALOG));
    box(win, 0, 0);

    const std::string title = fmt::format(" Process {} ", record->pid);
    wattron(win, A_BOLD);
    mvwprintw(win, 0, (width - static_cast<int>(title.length())) / 2, "%s", title.c_str());
    wattroff(win, A_BOLD);

    constexpr int kLabelWidth = 12;
    const size_t value_width = static_cast<size_t>(std::max(1, width - kLabelWidth - 4));
    int row = 1;
    for (const auto& [label, value] : fields) {
        if (row >= height - 2) break;
        wattron(win, COLOR_PAIR(COLOR_PAIR_HELP_KEY) | A_BOLD);
        mvwprintw(win, row, 2, "%-*s", kLabelWidth, label.c_str());
        wattroff(win, COLOR_PAIR(COLOR_PAIR_HELP_KEY) | A_BOLD);
        mvwprintw(win, row, 2 + kLabelWidth, "%s", truncate_to(value, value_width).c_str());
        row++;
    }

    wattron(win, COLOR_PAIR(COLOR_PAIR_DIALOG_BUTTON));
    mvwprintw(win, height - 2, (width - 22) / 2, " Enter/Esc to return ");
    wattroff(win, COLOR_PAIR(COLOR_PAIR_DIALOG_BUTTON));

    wnoutrefresh(win);
    delwin(win);
}

} // namespace procpeek
