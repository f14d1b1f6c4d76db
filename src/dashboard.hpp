#pragma once

#include "snapshot.hpp"
#include "viewmodels/view_state.hpp"
#include <memory>
#include <optional>
#include <vector>

namespace procpeek {

enum class Screen {
    Running,
    HelpOverlay,
    DetailView,
    Exiting
};

// Terminal-independent input events
enum class Key {
    None,
    Up,
    Down,
    PageUp,
    PageDown,
    Home,
    End,
    Enter,
    Escape,
    Help,
    Quit,
    SortCpu,
    SortMemory,
    SortName,
    SortPid,
    CycleSort,
    MoreRows,
    FewerRows,
    Refresh,
    Resize,
    Other
};

// What the front end should do after a key
enum class Effect {
    None,
    Redraw,
    RefreshNow,
    Exit
};

// Interactive-mode state machine: the current screen, the ViewState, and the
// ranked rows derived from the latest snapshot. Knows nothing about ncurses.
class Dashboard {
public:
    explicit Dashboard(ViewState initial = {});

    // Adopt a newer snapshot. Drops the selection if its PID is gone and
    // leaves the detail view in that case.
    void apply_snapshot(std::shared_ptr<const Snapshot> snapshot);

    // `page_rows` is the number of table rows on screen, for PgUp/PgDn
    Effect handle_key(Key key, int page_rows);

    [[nodiscard]] Screen screen() const { return screen_; }
    [[nodiscard]] const ViewState& view() const { return view_; }
    [[nodiscard]] const std::vector<ProcessRecord>& rows() const { return rows_; }
    [[nodiscard]] const Snapshot* snapshot() const { return snapshot_.get(); }

    // Row index of the selection, if the selected process is on screen
    [[nodiscard]] std::optional<size_t> selected_index() const;

    // Selected record from the current snapshot while in DetailView
    [[nodiscard]] const ProcessRecord* detail_record() const;

    static constexpr size_t kRowLimitStep = 5;

private:
    Effect handle_running_key(Key key, int page_rows);
    void set_sort_key(SortKey key);
    void change_row_limit(bool grow);
    void move_selection(long delta);
    void select_index(size_t index);
    void rerank();
    [[nodiscard]] const ProcessRecord* detail_record_candidate() const;

    Screen screen_ = Screen::Running;
    ViewState view_;
    std::shared_ptr<const Snapshot> snapshot_;
    std::vector<ProcessRecord> rows_;
};

} // namespace procpeek
