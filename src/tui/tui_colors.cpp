#include "tui_colors.hpp"

namespace procpeek {

void init_colors(const bool enabled) {
    if (!enabled || !has_colors()) {
        return;
    }

    start_color();
    use_default_colors();

    init_pair(COLOR_PAIR_DEFAULT, -1, -1);
    init_pair(COLOR_PAIR_TITLE, COLOR_CYAN, -1);
    init_pair(COLOR_PAIR_SELECTED, COLOR_BLACK, COLOR_CYAN);
    init_pair(COLOR_PAIR_HEADER, COLOR_YELLOW, -1);
    init_pair(COLOR_PAIR_SORT_COLUMN, COLOR_BLACK, COLOR_YELLOW);

    // Bars
    init_pair(COLOR_PAIR_CPU_BAR, COLOR_GREEN, -1);
    init_pair(COLOR_PAIR_MEM_BAR, COLOR_CYAN, -1);
    init_pair(COLOR_PAIR_SWAP_BAR, COLOR_YELLOW, -1);

    // Status
    init_pair(COLOR_PAIR_STATUS, COLOR_WHITE, COLOR_BLUE);
    init_pair(COLOR_PAIR_ERROR, COLOR_WHITE, COLOR_RED);
    init_pair(COLOR_PAIR_WARNING, COLOR_YELLOW, -1);

    // Process states
    init_pair(COLOR_PAIR_PROCESS_RUNNING, COLOR_GREEN, -1);
    init_pair(COLOR_PAIR_PROCESS_SLEEPING, -1, -1);
    init_pair(COLOR_PAIR_PROCESS_ZOMBIE, COLOR_RED, -1);
    init_pair(COLOR_PAIR_PROCESS_STOPPED, COLOR_YELLOW, -1);

    // Dialogs
    init_pair(COLOR_PAIR_DIALOG, COLOR_WHITE, COLOR_BLUE);
    init_pair(COLOR_PAIR_DIALOG_BUTTON, COLOR_BLACK, COLOR_WHITE);
    init_pair(COLOR_PAIR_HELP_KEY, COLOR_CYAN, COLOR_BLUE);
}

int get_state_color(char state) {
    switch (state) {
        case 'R':
            return COLOR_PAIR_PROCESS_RUNNING;
        case 'S':
        case 'I':
            return COLOR_PAIR_PROCESS_SLEEPING;
        case 'Z':
            return COLOR_PAIR_PROCESS_ZOMBIE;
        case 'T':
        case 't':
            return COLOR_PAIR_PROCESS_STOPPED;
        case 'D':
            return COLOR_PAIR_WARNING;
        default:
            return COLOR_PAIR_DEFAULT;
    }
}

} // namespace procpeek
