#include "tui_app.hpp"
#include "tui_colors.hpp"
#include "../format_utils.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <iterator>
#include <string>

namespace procpeek {

void TuiApp::render_help_overlay() {
    int max_y, max_x;
    getmaxyx(stdscr, max_y, max_x);

    // Help dialog dimensions
    const char* help_lines[] = {
        "Navigation:",
        "  Up/k, Down/j    Move selection up/down",
        "  PgUp, PgDn      Page up/down",
        "  Home/g, End/G   Jump to first/last",
        "  Enter           Show process details",
        "  Esc             Clear selection / close details",
        "",
        "Sorting:",
        "  c m n p         Sort by CPU, memory, name, PID",
        "  s               Cycle sort key",
        "  + / -           Show more / fewer rows",
        "",
        "Actions:",
        "  r/F5            Refresh now, dismiss error",
        "  ?/F1            This help",
        "  q               Quit"
    };

    const int help_width = std::min(max_x, 56);
    const int help_height = std::min(max_y, static_cast<int>(std::size(help_lines)) + 5);
    const int help_x = (max_x - help_width) / 2;
    const int help_y = (max_y - help_height) / 2;

    WINDOW* help_win = newwin(help_height, help_width, help_y, help_x);
    if (!help_win) return;

    wbkgd(help_win, COLOR_PAIR(COLOR_PAIR_DIALOG));
    box(help_win, 0, 0);

    // Title
    wattron(help_win, A_BOLD);
    mvwprintw(help_win, 0, (help_width - 6) / 2, " Help ");
    wattroff(help_win, A_BOLD);

    int row = 2;
    for (const char* line : help_lines) {
        if (row >= help_height - 2) break;

        if (line[0] == ' ' && line[1] == ' ') {
            // Key binding line
            std::string key(line, 2, 16);
            std::string desc(line + 18);

            wattron(help_win, COLOR_PAIR(COLOR_PAIR_HELP_KEY));
            mvwprintw(help_win, row, 2, "%s", key.c_str());
            wattroff(help_win, COLOR_PAIR(COLOR_PAIR_HELP_KEY));
            mvwprintw(help_win, row, 18, "%s", desc.c_str());
        } else {
            wattron(help_win, A_BOLD);
            mvwprintw(help_win, row, 2, "%s", line);
            wattroff(help_win, A_BOLD);
        }
        row++;
    }

    // Close instruction
    wattron(help_win, COLOR_PAIR(COLOR_PAIR_DIALOG_BUTTON));
    mvwprintw(help_win, help_height - 2, (help_width - 24) / 2, " Press any key to close ");
    wattroff(help_win, COLOR_PAIR(COLOR_PAIR_DIALOG_BUTTON));

    wnoutrefresh(help_win);
    delwin(help_win);
}

void TuiApp::render_status_bar() {
    if (!status_win_) return;

    const int max_x = getmaxx(status_win_);
    const auto& view = dashboard_.view();

    // Right side: sort, rows, interval, omissions
    std::string info = fmt::format("Sort: {}  Rows: {}  Every {:.1f}s",
                                   sort_key_name(view.sort_key),
                                   view.row_limit == kUnlimitedRows ? std::string("all")
                                                                    : std::to_string(view.row_limit),
                                   data_store_->get_refresh_interval() / 1000.0);
    if (current_data_ && current_data_->omitted_count > 0) {
        info += fmt::format("  {} unreadable", current_data_->omitted_count);
    }

    // Left side: the error banner while one is active, key hints otherwise
    const int left_width = std::max(0, max_x - static_cast<int>(info.length()) - 3);
    if (!banner_.empty()) {
        wbkgd(status_win_, COLOR_PAIR(COLOR_PAIR_ERROR));
        mvwprintw(status_win_, 0, 1, "%s", truncate_to(banner_, static_cast<size_t>(left_width)).c_str());
    } else {
        wbkgd(status_win_, COLOR_PAIR(COLOR_PAIR_STATUS));
        const std::string hints = "q:Quit  ?:Help  s:Sort  +/-:Rows  Enter:Details  r:Refresh";
        mvwprintw(status_win_, 0, 1, "%s", truncate_to(hints, static_cast<size_t>(left_width)).c_str());
    }

    const int info_x = max_x - static_cast<int>(info.length()) - 1;
    if (info_x > 0) {
        mvwprintw(status_win_, 0, info_x, "%s", info.c_str());
    }
}

} // namespace procpeek
