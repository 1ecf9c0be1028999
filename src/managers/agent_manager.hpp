#pragma once

#include <string>
#include <memory>
#include <optional>
#include <core/types.hpp>
#include <core/config.hpp>
#include <core/constants.hpp>
#include "tmux_manager.hpp"

// Drives the agent CLI inside its pane. The agent is a black box: we type
// into it and read its screen.
class AgentManager {
public:
    AgentManager(std::shared_ptr<TmuxManager> tmux, AgentCommandConfig agent,
                 int ready_poll_ms = READY_POLL_MS);

    // "cd '<dir>' && claude <args> [--settings '<file>'] [--resume '<token>']"
    std::string launch_command(const std::string& working_dir,
                               const std::optional<std::string>& resume_token,
                               const std::optional<std::string>& settings_file = std::nullopt) const;

    Result<void> launch(int agent_id, const std::string& working_dir,
                        const std::optional<std::string>& resume_token,
                        const std::optional<std::string>& settings_file = std::nullopt);

    Result<void> send_exit(int agent_id);

    // Typed in chunks so large instructions survive the pane's input buffer.
    // Empty text sends nothing.
    Result<void> send_instruction(int agent_id, const std::string& text);

    // Polls the pane for the ready marker. Never fails: timeout and capture
    // errors both come back as false.
    bool wait_for_ready(int agent_id, int timeout_secs);

    // Conversation id printed by the agent, used for --resume
    std::optional<std::string> capture_session_id(int agent_id);

private:
    std::shared_ptr<TmuxManager> tmux_;
    AgentCommandConfig agent_;
    int ready_poll_ms_;
};

// Split at UTF-8 character boundaries into pieces of at most max_bytes.
std::vector<std::string> chunk_utf8(const std::string& text, size_t max_bytes);
