#include "dashboard.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace procpeek {

Dashboard::Dashboard(ViewState initial)
    : view_(initial)
{
    if (view_.row_limit == 0) {
        view_.row_limit = 1;
    }
}

void Dashboard::apply_snapshot(std::shared_ptr<const Snapshot> snapshot) {
    if (!snapshot) return;
    snapshot_ = std::move(snapshot);

    // Selection follows the PID, not the row
    if (view_.selected_pid && !snapshot_->contains(*view_.selected_pid)) {
        spdlog::debug("selected PID {} exited, clearing selection", *view_.selected_pid);
        view_.selected_pid.reset();
        if (screen_ == Screen::DetailView) {
            screen_ = Screen::Running;
        }
    }
    rerank();
}

Effect Dashboard::handle_key(const Key key, const int page_rows) {
    if (key == Key::None) return Effect::None;

    if (key == Key::Quit) {
        screen_ = Screen::Exiting;
        return Effect::Exit;
    }

    switch (screen_) {
        case Screen::Running:
            return handle_running_key(key, page_rows);

        case Screen::HelpOverlay:
            if (key == Key::Resize) return Effect::Redraw;
            screen_ = Screen::Running;
            return Effect::Redraw;

        case Screen::DetailView:
            if (key == Key::Escape || key == Key::Enter) {
                screen_ = Screen::Running;
                return Effect::Redraw;
            }
            return key == Key::Resize ? Effect::Redraw : Effect::None;

        case Screen::Exiting:
            return Effect::Exit;
    }
    return Effect::None;
}

Effect Dashboard::handle_running_key(const Key key, const int page_rows) {
    const long page = std::max(1, page_rows - 1);

    switch (key) {
        case Key::Up:
            move_selection(-1);
            break;
        case Key::Down:
            move_selection(1);
            break;
        case Key::PageUp:
            move_selection(-page);
            break;
        case Key::PageDown:
            move_selection(page);
            break;
        case Key::Home:
            select_index(0);
            break;
        case Key::End:
            if (!rows_.empty()) select_index(rows_.size() - 1);
            break;
        case Key::Enter:
            if (!detail_record_candidate()) return Effect::None;
            screen_ = Screen::DetailView;
            break;
        case Key::Escape:
            view_.selected_pid.reset();
            break;
        case Key::Help:
            screen_ = Screen::HelpOverlay;
            break;
        case Key::SortCpu:
            set_sort_key(SortKey::Cpu);
            break;
        case Key::SortMemory:
            set_sort_key(SortKey::Memory);
            break;
        case Key::SortName:
            set_sort_key(SortKey::Name);
            break;
        case Key::SortPid:
            set_sort_key(SortKey::Pid);
            break;
        case Key::CycleSort:
            set_sort_key(next_sort_key(view_.sort_key));
            break;
        case Key::MoreRows:
            change_row_limit(true);
            break;
        case Key::FewerRows:
            change_row_limit(false);
            break;
        case Key::Refresh:
            return Effect::RefreshNow;
        case Key::Resize:
            break;
        case Key::None:
        case Key::Quit:
        case Key::Other:
            return Effect::None;
    }
    return Effect::Redraw;
}

const ProcessRecord* Dashboard::detail_record_candidate() const {
    if (!snapshot_ || !view_.selected_pid) return nullptr;
    return snapshot_->find(*view_.selected_pid);
}

const ProcessRecord* Dashboard::detail_record() const {
    if (screen_ != Screen::DetailView) return nullptr;
    return detail_record_candidate();
}

std::optional<size_t> Dashboard::selected_index() const {
    if (!view_.selected_pid) return std::nullopt;
    auto it = std::ranges::find(rows_, *view_.selected_pid, &ProcessRecord::pid);
    if (it == rows_.end()) return std::nullopt;
    return static_cast<size_t>(it - rows_.begin());
}

void Dashboard::set_sort_key(const SortKey key) {
    if (view_.sort_key == key) return;
    view_.sort_key = key;
    spdlog::debug("sort key changed to {}", sort_key_name(key));
    rerank();
}

void Dashboard::change_row_limit(const bool grow) {
    const size_t total = snapshot_ ? snapshot_->processes.size() : 0;

    if (grow) {
        if (view_.row_limit == kUnlimitedRows) return;
        view_.row_limit += kRowLimitStep;
        if (total > 0 && view_.row_limit >= total) {
            view_.row_limit = kUnlimitedRows;
        }
    } else {
        size_t current = view_.row_limit;
        if (current == kUnlimitedRows) {
            current = std::max(total, kRowLimitStep + 1);
        }
        view_.row_limit = current > kRowLimitStep ? current - kRowLimitStep : 1;
    }
    rerank();
}

void Dashboard::move_selection(const long delta) {
    if (rows_.empty()) return;

    const auto current = selected_index();
    if (!current) {
        // Nothing visible selected yet: start at the top
        select_index(0);
        return;
    }

    const long last = static_cast<long>(rows_.size()) - 1;
    const long target = std::clamp(static_cast<long>(*current) + delta, 0L, last);
    select_index(static_cast<size_t>(target));
}

void Dashboard::select_index(const size_t index) {
    if (index >= rows_.size()) return;
    view_.selected_pid = rows_[index].pid;
}

void Dashboard::rerank() {
    if (!snapshot_) {
        rows_.clear();
        return;
    }
    rows_ = rank(*snapshot_, view_.sort_key, view_.row_limit);
}

} // namespace procpeek
