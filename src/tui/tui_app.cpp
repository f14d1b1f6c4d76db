#include "tui_app.hpp"
#include "tui_colors.hpp"
#include "../errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <stdexcept>
#include <thread>
#include <unistd.h>

namespace procpeek {

// Signal handler for terminal resize
static std::atomic<bool> g_resize_requested{false};

static void handle_resize([[maybe_unused]] int sig) {
    g_resize_requested.store(true);
}

TuiApp::TuiApp(DataStore* data_store,
               ISystemDataProvider* system_provider,
               IProcessSource* details_source,
               ViewState initial_view)
    : data_store_(data_store)
    , system_provider_(system_provider)
    , details_source_(details_source)
    , dashboard_(initial_view)
{
    if (!data_store_ || !system_provider_ || !details_source_) {
        throw std::invalid_argument("TuiApp requires a data store, a system provider and a details source");
    }
}

TuiApp::~TuiApp() {
    shutdown_terminal();
}

void TuiApp::init_terminal() {
    if (!isatty(STDIN_FILENO) || !isatty(STDOUT_FILENO)) {
        throw RenderError("interactive mode needs a terminal (try 'proc-peek list')");
    }

    screen_ = newterm(nullptr, stdout, stdin);
    if (!screen_) {
        throw RenderError("cannot initialise the terminal; check TERM");
    }
    set_term(screen_);

    cbreak();
    noecho();
    keypad(stdscr, TRUE);
    curs_set(0);  // Hide cursor
    nodelay(stdscr, TRUE);  // Non-blocking input
    set_escdelay(25);

    init_colors(use_color_);

    // Terminal title: "proc-peek: <uname>"
    const std::string title = "proc-peek: " + system_provider_->get_system_info_string();
    std::printf("\033]0;%s\007", title.c_str());
    std::fflush(stdout);

    // Resize handler, restored in shutdown_terminal()
    resize_guard_.emplace(SIGWINCH, handle_resize);
    if (!resize_guard_->active()) {
        spdlog::warn("cannot install SIGWINCH handler");
    }

    create_windows();
    spdlog::debug("terminal initialised, {}x{}", COLS, LINES);
}

void TuiApp::shutdown_terminal() {
    if (!screen_) return;

    resize_guard_.reset();
    cleanup_windows();
    endwin();
    delscreen(screen_);
    screen_ = nullptr;

    // Reset terminal title
    std::printf("\033]0;\007");
    std::fflush(stdout);
}

void TuiApp::run() {
    init_terminal();

    // Start data collection
    data_store_->start();
    poll_data_store();

    running_ = true;
    auto last_update = std::chrono::steady_clock::now();
    constexpr auto update_interval = std::chrono::milliseconds(100);

    while (running_) {
        // Handle terminal resize
        if (g_resize_requested.exchange(false)) {
            endwin();
            refresh();
            resize_windows();
        }

        // Handle input
        int ch = getch();
        while (ch != ERR && running_) {
            handle_input(ch);
            ch = getch();
        }
        if (!running_) break;

        // Pick up new snapshots
        auto now = std::chrono::steady_clock::now();
        if (now - last_update >= update_interval) {
            poll_data_store();
            last_update = now;
        }

        render();

        // Small sleep to reduce CPU usage
        std::this_thread::sleep_for(std::chrono::milliseconds(16));
    }

    // Cancels any in-flight sampling pass
    data_store_->stop();
    shutdown_terminal();
}

void TuiApp::poll_data_store() {
    auto new_data = data_store_->get_snapshot();
    if (new_data && (!current_data_ || new_data->sequence != current_data_->sequence)) {
        current_data_ = new_data;
        dashboard_.apply_snapshot(current_data_);
        system_panel_.update_from_snapshot(*current_data_);
    }

    // Most recent error becomes the banner; it expires with the error ring
    const auto errors = data_store_->get_recent_errors();
    banner_ = errors.empty() ? std::string() : errors.back().message;

    if (dashboard_.screen() == Screen::DetailView) {
        refresh_selected_details();
    } else if (details_panel_.details_pid != -1) {
        details_panel_.clear();
    }
}

void TuiApp::create_windows() {
    int max_y, max_x;
    getmaxyx(stdscr, max_y, max_x);

    const int process_height = std::max(kMinProcessHeight, max_y - kSystemPanelHeight - kStatusBarHeight);

    int y = 0;
    system_win_ = newwin(kSystemPanelHeight, max_x, y, 0);
    y += kSystemPanelHeight;

    process_win_ = newwin(process_height, max_x, y, 0);
    y += process_height;
    visible_process_rows_ = std::max(1, process_height - 3);  // Border and header

    status_win_ = newwin(kStatusBarHeight, max_x, y, 0);

    if (!system_win_ || !process_win_ || !status_win_) {
        cleanup_windows();
        throw RenderError("cannot create terminal windows");
    }
}

void TuiApp::resize_windows() {
    cleanup_windows();
    create_windows();
    scroll_to_selection();
}

void TuiApp::cleanup_windows() {
    if (system_win_) {
        delwin(system_win_);
        system_win_ = nullptr;
    }
    if (process_win_) {
        delwin(process_win_);
        process_win_ = nullptr;
    }
    if (status_win_) {
        delwin(status_win_);
        status_win_ = nullptr;
    }
}

void TuiApp::render() {
    werase(system_win_);
    werase(process_win_);
    werase(status_win_);

    render_system_panel();
    render_process_list();
    render_status_bar();

    wnoutrefresh(system_win_);
    wnoutrefresh(process_win_);
    wnoutrefresh(status_win_);

    // Overlays draw on top of the refreshed panels
    switch (dashboard_.screen()) {
        case Screen::HelpOverlay:
            render_help_overlay();
            break;
        case Screen::DetailView:
            render_details_panel();
            break;
        case Screen::Running:
        case Screen::Exiting:
            break;
    }
    doupdate();
}

void TuiApp::scroll_to_selection() {
    const int total = static_cast<int>(dashboard_.rows().size());
    if (const auto selected = dashboard_.selected_index()) {
        const int idx = static_cast<int>(*selected);
        if (idx < process_scroll_offset_) {
            process_scroll_offset_ = idx;
        } else if (idx >= process_scroll_offset_ + visible_process_rows_) {
            process_scroll_offset_ = idx - visible_process_rows_ + 1;
        }
    }
    process_scroll_offset_ = std::clamp(process_scroll_offset_, 0, std::max(0, total - visible_process_rows_));
}

void TuiApp::draw_box_title(WINDOW* win, const std::string& title) {
    box(win, 0, 0);
    if (!title.empty()) {
        wattron(win, COLOR_PAIR(COLOR_PAIR_TITLE) | A_BOLD);
        mvwprintw(win, 0, 2, " %s ", title.c_str());
        wattroff(win, COLOR_PAIR(COLOR_PAIR_TITLE) | A_BOLD);
    }
}

void TuiApp::draw_progress_bar(WINDOW* win, int y, int x, int width,
                               double percent, int color_pair, const std::string& label) {
    if (width < 3) return;

    int bar_width = width - 2;  // Account for brackets
    int filled = static_cast<int>(bar_width * std::clamp(percent, 0.0, 100.0) / 100.0);

    mvwaddch(win, y, x, '[');

    wattron(win, COLOR_PAIR(color_pair));
    for (int i = 0; i < filled; ++i) {
        waddch(win, '|');
    }
    wattroff(win, COLOR_PAIR(color_pair));

    for (int i = filled; i < bar_width; ++i) {
        waddch(win, ' ');
    }
    waddch(win, ']');

    if (!label.empty()) {
        mvwprintw(win, y, x + width + 1, "%s", label.c_str());
    }
}

} // namespace procpeek
