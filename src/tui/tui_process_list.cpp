#include "tui_app.hpp"
#include "tui_colors.hpp"
#include "../format_utils.hpp"
#include <fmt/format.h>
#include <optional>

namespace procpeek {

namespace {

struct Column {
    const char* label;
    int width;                      // negative: left-aligned
    std::optional<SortKey> sort_key;
};

constexpr int kNameColumnX = 52;

const Column kColumns[] = {
    {"PID", 7, SortKey::Pid},
    {"USER", -9, std::nullopt},
    {"S", 1, std::nullopt},
    {"CPU%", 6, SortKey::Cpu},
    {"MEM%", 6, SortKey::Memory},
    {"MEMORY", 9, SortKey::Memory},
    {"THR", 5, std::nullopt},
};

} // namespace

void TuiApp::render_process_list() {
    if (!process_win_) return;

    int max_y, max_x;
    getmaxyx(process_win_, max_y, max_x);

    const auto& rows = dashboard_.rows();
    const auto& view = dashboard_.view();
    const size_t total = current_data_ ? current_data_->processes.size() : 0;

    std::string title = fmt::format("Processes ({} of {})", rows.size(), total);
    draw_box_title(process_win_, title);

    // Column headers, sort column highlighted
    int x = 2;
    for (const auto& col : kColumns) {
        const bool sorted = col.sort_key == view.sort_key;
        const int attr = sorted ? COLOR_PAIR(COLOR_PAIR_SORT_COLUMN) | A_BOLD
                                : COLOR_PAIR(COLOR_PAIR_HEADER) | A_BOLD;
        const int width = col.width < 0 ? -col.width : col.width;
        wattron(process_win_, attr);
        if (col.width < 0) {
            mvwprintw(process_win_, 1, x, "%-*s", width, col.label);
        } else {
            mvwprintw(process_win_, 1, x, "%*s", width, col.label);
        }
        wattroff(process_win_, attr);
        x += width + 1;
    }
    {
        const int attr = view.sort_key == SortKey::Name ? COLOR_PAIR(COLOR_PAIR_SORT_COLUMN) | A_BOLD
                                                        : COLOR_PAIR(COLOR_PAIR_HEADER) | A_BOLD;
        wattron(process_win_, attr);
        mvwprintw(process_win_, 1, kNameColumnX, "NAME");
        wattroff(process_win_, attr);
    }

    if (rows.empty()) {
        wattron(process_win_, A_DIM);
        mvwprintw(process_win_, 2, 2, "%s", current_data_ && current_data_->sequence > 0
                                                ? "No readable processes"
                                                : "Sampling...");
        wattroff(process_win_, A_DIM);
        return;
    }

    scroll_to_selection();
    const auto selected = dashboard_.selected_index();
    const int name_width = std::max(0, max_x - kNameColumnX - 1);

    int row = 2;
    for (size_t i = static_cast<size_t>(process_scroll_offset_);
         i < rows.size() && row < max_y - 1;
         ++i, ++row) {

        const auto& proc = rows[i];
        const bool is_selected = selected && *selected == i;

        int attr;
        if (is_selected) {
            attr = use_color_ ? COLOR_PAIR(COLOR_PAIR_SELECTED) : A_REVERSE;
            wattron(process_win_, attr);
            mvwhline(process_win_, row, 1, ' ', max_x - 2);
        } else {
            attr = COLOR_PAIR(get_state_color(proc.state_char));
            wattron(process_win_, attr);
        }

        mvwprintw(process_win_, row, 2, "%7d %-9s %c %5.1f%% %5.1f%% %9s %5d",
                  proc.pid,
                  truncate_to(proc.user_name, 9).c_str(),
                  proc.state_char,
                  proc.cpu_percent,
                  proc.memory_percent,
                  format_bytes(proc.memory_bytes).c_str(),
                  proc.thread_count);

        if (name_width > 0) {
            mvwprintw(process_win_, row, kNameColumnX, "%s",
                      truncate_to(proc.name, static_cast<size_t>(name_width)).c_str());
        }

        wattroff(process_win_, attr);
    }
}

} // namespace procpeek
