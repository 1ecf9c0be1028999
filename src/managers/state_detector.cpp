#include "state_detector.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <fstream>
#include <sstream>
#include <chrono>

StateDetector::StateDetector(fs::path status_dir, SnapshotSource snapshots,
                             int stuck_after_secs)
    : status_dir_(std::move(status_dir)), snapshots_(std::move(snapshots)),
      stuck_after_secs_(stuck_after_secs) {}

fs::path status_marker_path(const fs::path& status_dir, int agent_id) {
    return status_dir / fmt::format("expert{}", agent_id);
}

bool is_shell_command(const std::string& command) {
    static const char* shells[] = {"bash", "zsh", "sh", "fish", "dash", "ksh", "tcsh", "csh"};
    if (command.empty()) return true;
    std::string c = command;
    if (!c.empty() && c[0] == '-') c.erase(0, 1);  // login shells show as "-bash"
    for (const char* s : shells) {
        if (c == s) return true;
    }
    return false;
}

AgentStatus StateDetector::classify(int agent_id) const {
    fs::path marker = status_marker_path(status_dir_, agent_id);

    std::optional<PaneSnapshot> snap;
    if (snapshots_) snap = snapshots_(agent_id);
    bool have_pane = snap && snap->captured;
    bool agent_alive = have_pane && !is_shell_command(snap->command);

    std::error_code ec;
    if (!fs::exists(marker, ec)) {
        if (ec) return AgentStatus::Unknown;
        if (!agent_alive) return AgentStatus::Pending;
        switch (snap->activity) {
            case PaneActivity::Idle:      return AgentStatus::Ready;
            case PaneActivity::Thinking:
            case PaneActivity::Executing: return AgentStatus::Busy;
            case PaneActivity::Unknown:   return AgentStatus::Starting;
            case PaneActivity::Error:     return AgentStatus::Unknown;
        }
        return AgentStatus::Unknown;
    }

    std::ifstream in(marker);
    if (!in) return AgentStatus::Unknown;
    std::stringstream ss;
    ss << in.rdbuf();
    std::string content = ss.str();
    trim(content);

    // A launch that timed out leaves the marker behind, so the pane decides
    if (content == MARKER_STARTING) {
        if (have_pane && !agent_alive) return AgentStatus::Pending;
        if (agent_alive) {
            switch (snap->activity) {
                case PaneActivity::Idle:      return AgentStatus::Ready;
                case PaneActivity::Thinking:
                case PaneActivity::Executing: return AgentStatus::Busy;
                case PaneActivity::Unknown:
                case PaneActivity::Error:     break;
            }
        }
        return AgentStatus::Starting;
    }

    if (content == MARKER_PENDING) {
        if (have_pane && !agent_alive) return AgentStatus::Pending;
        if (agent_alive && (snap->activity == PaneActivity::Thinking ||
                            snap->activity == PaneActivity::Executing)) {
            return AgentStatus::Busy;
        }
        return AgentStatus::Ready;
    }

    if (content == MARKER_PROCESSING) {
        // Busy marker over a bare shell: the two observations disagree
        if (have_pane && !agent_alive) return AgentStatus::Unknown;

        auto mtime = fs::last_write_time(marker, ec);
        if (ec || !have_pane) return AgentStatus::Busy;

        auto marker_age = std::chrono::duration_cast<std::chrono::seconds>(
            fs::file_time_type::clock::now() - mtime).count();
        auto quiet_for = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - snap->changed_at).count();
        if (marker_age >= stuck_after_secs_ && quiet_for >= stuck_after_secs_) {
            return AgentStatus::Stuck;
        }
        return AgentStatus::Busy;
    }

    return AgentStatus::Unknown;
}

Result<void> write_status_marker(const fs::path& status_dir, int agent_id,
                                 const std::string& content) {
    std::error_code ec;
    fs::create_directories(status_dir, ec);
    fs::path marker = status_marker_path(status_dir, agent_id);
    std::ofstream out(marker, std::ios::trunc);
    if (!out) {
        return Result<void>::Err("Cannot write " + marker.string(), ErrorKind::Io);
    }
    out << content;
    return Result<void>::Ok();
}

Result<void> clear_status_marker(const fs::path& status_dir, int agent_id) {
    std::error_code ec;
    fs::remove(status_marker_path(status_dir, agent_id), ec);
    if (ec) {
        return Result<void>::Err(fmt::format("Cannot clear marker for agent {}: {}",
                                             agent_id, ec.message()), ErrorKind::Io);
    }
    return Result<void>::Ok();
}
