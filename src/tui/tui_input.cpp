#include "tui_app.hpp"

namespace procpeek {

Key TuiApp::translate_key(int ch) {
    switch (ch) {
        case ERR:
            return Key::None;

        case KEY_UP:
        case 'k':
            return Key::Up;
        case KEY_DOWN:
        case 'j':
            return Key::Down;
        case KEY_PPAGE:
            return Key::PageUp;
        case KEY_NPAGE:
            return Key::PageDown;
        case KEY_HOME:
        case 'g':
            return Key::Home;
        case KEY_END:
        case 'G':
            return Key::End;

        case '\n':
        case '\r':
        case KEY_ENTER:
            return Key::Enter;
        case 27:  // Escape
            return Key::Escape;

        case '?':
        case KEY_F(1):
            return Key::Help;
        case 'q':
        case 'Q':
            return Key::Quit;

        case 'c':
            return Key::SortCpu;
        case 'm':
            return Key::SortMemory;
        case 'n':
            return Key::SortName;
        case 'p':
            return Key::SortPid;
        case 's':
            return Key::CycleSort;

        case '+':
        case '=':
            return Key::MoreRows;
        case '-':
            return Key::FewerRows;

        case 'r':
        case KEY_F(5):
            return Key::Refresh;

        case KEY_RESIZE:
            return Key::Resize;

        default:
            return Key::Other;
    }
}

void TuiApp::handle_input(int ch) {
    const Key key = translate_key(ch);
    const Screen before = dashboard_.screen();
    const Effect effect = dashboard_.handle_key(key, visible_process_rows_);

    switch (effect) {
        case Effect::Exit:
            running_ = false;
            return;
        case Effect::RefreshNow:
            data_store_->clear_errors();
            banner_.clear();
            data_store_->refresh_now();
            return;
        case Effect::Redraw:
            if (before == Screen::Running && dashboard_.screen() == Screen::HelpOverlay) {
                flushinp();  // Clear any pending input
            }
            if (dashboard_.screen() == Screen::DetailView && before != Screen::DetailView) {
                refresh_selected_details();
            }
            if (key == Key::Resize) {
                resize_windows();
            }
            scroll_to_selection();
            return;
        case Effect::None:
            return;
    }
}

} // namespace procpeek
