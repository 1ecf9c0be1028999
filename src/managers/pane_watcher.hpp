#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>
#include "pane_capture.hpp"
#include "tmux_manager.hpp"

// Refreshes pane snapshots off the control loop so the detector can read
// them without touching tmux.
class PaneWatcher {
public:
    PaneWatcher(std::shared_ptr<TmuxManager> tmux, int interval_ms);
    ~PaneWatcher();

    PaneWatcher(const PaneWatcher&) = delete;
    PaneWatcher& operator=(const PaneWatcher&) = delete;

    void start();
    void stop();
    bool running() const { return running_; }

    void update_targets(std::vector<int> panes);

    // One synchronous pass over the current targets
    void refresh_now();

    std::optional<PaneSnapshot> snapshot(int pane) const;

private:
    void watcher_loop();
    void refresh(const std::vector<int>& panes);

    std::shared_ptr<TmuxManager> tmux_;
    int interval_ms_;
    std::atomic<bool> running_{false};
    std::thread thread_;

    std::mutex targets_mutex_;
    std::vector<int> targets_;

    mutable std::mutex snapshots_mutex_;
    std::map<int, PaneSnapshot> snapshots_;
};
