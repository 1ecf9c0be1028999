#pragma once

#include <string>
#include <optional>
#include <functional>
#include <filesystem>
#include <core/types.hpp>
#include "pane_capture.hpp"

namespace fs = std::filesystem;

using SnapshotSource = std::function<std::optional<PaneSnapshot>(int)>;

// Classifies each agent from its readiness marker and the latest cached pane
// snapshot. Stateless: every call looks at current observations only, and
// never blocks on tmux.
class StateDetector {
public:
    StateDetector(fs::path status_dir, SnapshotSource snapshots, int stuck_after_secs);

    AgentStatus classify(int agent_id) const;

    const fs::path& status_dir() const { return status_dir_; }

private:
    fs::path status_dir_;
    SnapshotSource snapshots_;
    int stuck_after_secs_;
};

// True for the foreground command of a pane with no agent running in it.
bool is_shell_command(const std::string& command);

// <status_dir>/expert<N>
fs::path status_marker_path(const fs::path& status_dir, int agent_id);

// queue/status/expert<N> writers, used by the launch sequence
Result<void> write_status_marker(const fs::path& status_dir, int agent_id,
                                 const std::string& content);
Result<void> clear_status_marker(const fs::path& status_dir, int agent_id);
