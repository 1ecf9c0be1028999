#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <core/types.hpp>
#include "command_runner.hpp"

struct SessionSummary {
    std::string name;
    std::string project_path;
    int num_experts = 0;
    std::string created_at;
};

// One tmux session, one window, one pane per agent. Every call is a
// synchronous tmux invocation; failures carry tmux's stderr.
class TmuxManager {
public:
    TmuxManager(std::shared_ptr<CommandRunner> runner, std::string session_name);

    const std::string& session_name() const { return session_name_; }

    // "<session>:0.<pane>"
    std::string target(int pane) const;

    // ── Session lifecycle ─────────────────────────────────
    bool session_exists();
    Result<void> create_session(int num_panes, const std::string& working_dir);
    Result<void> kill_session();

    Result<void> set_environment(const std::string& key, const std::string& value);
    std::optional<std::string> get_environment(const std::string& key);

    // Running sessions whose names start with "<prefix>-"
    static Result<std::vector<SessionSummary>> list_sessions(std::shared_ptr<CommandRunner> runner,
                                                             const std::string& prefix);

    // ── Panes ─────────────────────────────────────────────
    Result<void> set_pane_title(int pane, const std::string& title);
    Result<void> change_directory(int pane, const std::string& dir);
    // Clear the prompt line, type command, press Enter
    Result<void> exec(int pane, const std::string& command);

    // Literal text, no Enter
    Result<void> send_text(int pane, const std::string& text);
    // Key names such as "Enter" or "C-u"
    Result<void> send_key(int pane, const std::string& key);

    Result<std::string> capture_pane(int pane);
    // Foreground command name of the pane ("bash", "claude", "node", ...)
    Result<std::string> pane_command(int pane);

private:
    Result<std::string> tmux(const std::string& context, const std::vector<std::string>& args);

    std::shared_ptr<CommandRunner> runner_;
    std::string session_name_;
};
