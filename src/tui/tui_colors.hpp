#pragma once

#include <ncurses.h>

namespace procpeek {

// Color pair indices
enum ColorPair {
    COLOR_PAIR_DEFAULT = 1,
    COLOR_PAIR_TITLE,
    COLOR_PAIR_SELECTED,
    COLOR_PAIR_HEADER,
    COLOR_PAIR_SORT_COLUMN,
    COLOR_PAIR_CPU_BAR,
    COLOR_PAIR_MEM_BAR,
    COLOR_PAIR_SWAP_BAR,
    COLOR_PAIR_STATUS,
    COLOR_PAIR_ERROR,
    COLOR_PAIR_WARNING,
    COLOR_PAIR_PROCESS_RUNNING,
    COLOR_PAIR_PROCESS_SLEEPING,
    COLOR_PAIR_PROCESS_ZOMBIE,
    COLOR_PAIR_PROCESS_STOPPED,
    COLOR_PAIR_DIALOG,
    COLOR_PAIR_DIALOG_BUTTON,
    COLOR_PAIR_HELP_KEY,
};

// Initialize ncurses color pairs. With colors disabled every pair stays
// unset and the UI falls back to bold/reverse attributes.
void init_colors(bool enabled);

// Get color pair for process state
int get_state_color(char state);

} // namespace procpeek
