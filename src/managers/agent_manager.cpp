#include "agent_manager.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <chrono>
#include <regex>

AgentManager::AgentManager(std::shared_ptr<TmuxManager> tmux, AgentCommandConfig agent,
                           int ready_poll_ms)
    : tmux_(std::move(tmux)), agent_(std::move(agent)), ready_poll_ms_(ready_poll_ms) {}

std::string AgentManager::launch_command(const std::string& working_dir,
                                         const std::optional<std::string>& resume_token,
                                         const std::optional<std::string>& settings_file) const {
    std::string cmd = fmt::format("cd {} && {}", shell_quote(working_dir), agent_.command);
    for (const auto& a : agent_.args) {
        cmd += " " + a;
    }
    if (settings_file && !agent_.settings_flag.empty()) {
        cmd += fmt::format(" {} {}", agent_.settings_flag, shell_quote(*settings_file));
    }
    if (resume_token && !resume_token->empty() && !agent_.resume_flag.empty()) {
        cmd += fmt::format(" {} {}", agent_.resume_flag, shell_quote(*resume_token));
    }
    return cmd;
}

Result<void> AgentManager::launch(int agent_id, const std::string& working_dir,
                                  const std::optional<std::string>& resume_token,
                                  const std::optional<std::string>& settings_file) {
    crew_log(fmt::format("agent {}: launch in {} (resume={})", agent_id, working_dir,
                         resume_token ? *resume_token : "none"));
    return tmux_->exec(agent_id, launch_command(working_dir, resume_token, settings_file));
}

Result<void> AgentManager::send_exit(int agent_id) {
    crew_log(fmt::format("agent {}: exit requested", agent_id));
    return tmux_->exec(agent_id, agent_.exit_command);
}

Result<void> AgentManager::send_instruction(int agent_id, const std::string& text) {
    if (text.empty()) return Result<void>::Ok();

    auto chunks = chunk_utf8(text, INSTRUCTION_CHUNK_SIZE);
    for (size_t i = 0; i < chunks.size(); ++i) {
        auto r = tmux_->send_text(agent_id, chunks[i]);
        if (r.is_err()) return r;
        if (i + 1 < chunks.size()) platform::sleep_ms(INSTRUCTION_CHUNK_DELAY_MS);
    }
    platform::sleep_ms(INSTRUCTION_CHUNK_DELAY_MS);
    return tmux_->send_key(agent_id, "Enter");
}

bool AgentManager::wait_for_ready(int agent_id, int timeout_secs) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_secs);
    while (true) {
        auto screen = tmux_->capture_pane(agent_id);
        if (screen.is_ok()) {
            if (screen.value.find(agent_.ready_marker) != std::string::npos) {
                return true;
            }
        } else {
            crew_log(fmt::format("agent {}: readiness check: {}", agent_id, screen.error));
        }

        if (std::chrono::steady_clock::now() >= deadline) break;
        platform::sleep_ms(ready_poll_ms_);
    }
    crew_log(fmt::format("agent {}: not ready after {}s", agent_id, timeout_secs));
    return false;
}

std::optional<std::string> AgentManager::capture_session_id(int agent_id) {
    auto screen = tmux_->capture_pane(agent_id);
    if (screen.is_err()) return std::nullopt;

    static const std::regex re(R"(Session:\s*([a-zA-Z0-9_-]+))");
    std::smatch m;
    if (std::regex_search(screen.value, m, re)) {
        return m[1].str();
    }
    return std::nullopt;
}

std::vector<std::string> chunk_utf8(const std::string& text, size_t max_bytes) {
    std::vector<std::string> chunks;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t end = std::min(pos + max_bytes, text.size());
        // Back off continuation bytes (10xxxxxx)
        while (end < text.size() && end > pos &&
               (static_cast<unsigned char>(text[end]) & 0xC0) == 0x80) {
            --end;
        }
        if (end == pos) end = std::min(pos + max_bytes, text.size());
        chunks.push_back(text.substr(pos, end - pos));
        pos = end;
    }
    return chunks;
}
