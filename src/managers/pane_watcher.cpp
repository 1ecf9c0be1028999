#include "pane_watcher.hpp"
#include <core/log.hpp>
#include <chrono>

// ── Construction / Destruction ──────────────────────────────

PaneWatcher::PaneWatcher(std::shared_ptr<TmuxManager> tmux, int interval_ms)
    : tmux_(std::move(tmux)), interval_ms_(interval_ms) {}

PaneWatcher::~PaneWatcher() {
    stop();
}

// ── Lifecycle ───────────────────────────────────────────────

void PaneWatcher::start() {
    if (running_) return;
    running_ = true;
    thread_ = std::thread(&PaneWatcher::watcher_loop, this);
    crew_log("pane_watcher: started");
}

void PaneWatcher::stop() {
    if (!running_) return;
    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
    }
    crew_log("pane_watcher: stopped");
}

void PaneWatcher::update_targets(std::vector<int> panes) {
    std::lock_guard<std::mutex> lock(targets_mutex_);
    targets_ = std::move(panes);
}

void PaneWatcher::refresh_now() {
    std::vector<int> panes;
    {
        std::lock_guard<std::mutex> lock(targets_mutex_);
        panes = targets_;
    }
    refresh(panes);
}

std::optional<PaneSnapshot> PaneWatcher::snapshot(int pane) const {
    std::lock_guard<std::mutex> lock(snapshots_mutex_);
    auto it = snapshots_.find(pane);
    if (it == snapshots_.end()) return std::nullopt;
    return it->second;
}

// ── Watcher loop ────────────────────────────────────────────

void PaneWatcher::watcher_loop() {
    while (running_) {
        refresh_now();

        // Sleep in 100ms increments for responsive shutdown
        for (int waited = 0; waited < interval_ms_ && running_; waited += 100) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }
}

void PaneWatcher::refresh(const std::vector<int>& panes) {
    for (int pane : panes) {
        PaneSnapshot snap;
        auto screen = tmux_->capture_pane(pane);
        if (screen.is_ok()) {
            auto command = tmux_->pane_command(pane);
            snap = make_snapshot(pane, screen.value, command.is_ok() ? command.value : "");
        } else {
            snap.pane = pane;
            snap.captured_at = std::chrono::steady_clock::now();
            snap.changed_at = snap.captured_at;
        }

        std::lock_guard<std::mutex> lock(snapshots_mutex_);
        auto prev = snapshots_.find(pane);
        if (prev != snapshots_.end() && prev->second.captured == snap.captured &&
            prev->second.lines == snap.lines) {
            snap.changed_at = prev->second.changed_at;
        }
        snapshots_[pane] = std::move(snap);
    }
}
