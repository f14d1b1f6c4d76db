#pragma once

#include "../interfaces/i_process_source.hpp"
#include "../interfaces/i_system_data_provider.hpp"
#include "../data_store.hpp"
#include "../dashboard.hpp"
#include "../viewmodels/system_panel_view_model.hpp"
#include "../viewmodels/details_panel_view_model.hpp"
#include "../signal_guard.hpp"
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <ncurses.h>

namespace procpeek {

class TuiApp {
public:
    // Non-owning constructor: TuiApp uses but does not own the data layer.
    // All pointers must be non-null and must outlive the TuiApp instance.
    TuiApp(DataStore* data_store,
           ISystemDataProvider* system_provider,
           IProcessSource* details_source,
           ViewState initial_view = {});
    ~TuiApp();

    TuiApp(const TuiApp&) = delete;
    TuiApp& operator=(const TuiApp&) = delete;

    // Honour NO_COLOR; must be called before run()
    void set_use_color(bool enabled) { use_color_ = enabled; }

    // Runs until the user quits. Throws RenderError without a usable terminal.
    void run();

private:
    // Terminal lifetime
    void init_terminal();
    void shutdown_terminal();

    // Rendering
    void render();
    void render_system_panel();
    void render_process_list();
    void render_status_bar();
    void render_help_overlay();
    void render_details_panel();

    // Input handling
    void handle_input(int ch);
    static Key translate_key(int ch);

    // Data
    void poll_data_store();
    void refresh_selected_details();
    void scroll_to_selection();

    // Window management
    void create_windows();
    void resize_windows();
    void cleanup_windows();

    // Drawing helpers
    static void draw_progress_bar(WINDOW* win, int y, int x, int width,
                                  double percent, int color_pair, const std::string& label = "");
    static void draw_box_title(WINDOW* win, const std::string& title);

    // Non-owned references to data layer
    DataStore* data_store_ = nullptr;
    ISystemDataProvider* system_provider_ = nullptr;
    IProcessSource* details_source_ = nullptr;

    // UI state
    Dashboard dashboard_;
    std::shared_ptr<const Snapshot> current_data_;
    SystemPanelViewModel system_panel_;
    DetailsPanelViewModel details_panel_;
    std::string banner_;
    std::atomic<bool> running_{false};
    bool use_color_ = true;

    // ncurses
    SCREEN* screen_ = nullptr;
    std::optional<SignalHandlerGuard> resize_guard_;
    WINDOW* system_win_ = nullptr;
    WINDOW* process_win_ = nullptr;
    WINDOW* status_win_ = nullptr;

    // Scroll position
    int process_scroll_offset_ = 0;
    int visible_process_rows_ = 0;

    // Layout constants
    static constexpr int kSystemPanelHeight = 2;
    static constexpr int kStatusBarHeight = 1;
    static constexpr int kMinProcessHeight = 4;
};

} // namespace procpeek
