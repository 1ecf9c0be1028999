#include "tmux_manager.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

TmuxManager::TmuxManager(std::shared_ptr<CommandRunner> runner, std::string session_name)
    : runner_(std::move(runner)), session_name_(std::move(session_name)) {}

std::string TmuxManager::target(int pane) const {
    return fmt::format("{}:0.{}", session_name_, pane);
}

Result<std::string> TmuxManager::tmux(const std::string& context,
                                      const std::vector<std::string>& args) {
    auto r = runner_->run("tmux", args);
    if (r.failed()) {
        return Result<std::string>::Err(describe_failure(context, "tmux", r),
                                        ErrorKind::ExternalCommandFailed);
    }
    return Result<std::string>::Ok(r.stdout_data);
}

// ── Session lifecycle ───────────────────────────────────────

bool TmuxManager::session_exists() {
    auto r = runner_->run("tmux", {"has-session", "-t", session_name_});
    return r.success();
}

Result<void> TmuxManager::create_session(int num_panes, const std::string& working_dir) {
    auto created = tmux("Failed to create tmux session",
                        {"new-session", "-d", "-s", session_name_, "-c", working_dir});
    if (created.is_err()) return Result<void>::Err(created.error, created.kind);

    std::string window = session_name_ + ":0";
    for (int i = 1; i < num_panes; ++i) {
        auto split = tmux(fmt::format("Failed to create pane {}", i),
                          {"split-window", "-t", window, "-c", working_dir});
        if (split.is_err()) return Result<void>::Err(split.error, split.kind);

        // Re-tile after each split so tmux always has room for the next one
        auto layout = tmux("Failed to apply layout", {"select-layout", "-t", window, "tiled"});
        if (layout.is_err()) return Result<void>::Err(layout.error, layout.kind);
    }
    return Result<void>::Ok();
}

Result<void> TmuxManager::kill_session() {
    auto r = tmux("Failed to kill session", {"kill-session", "-t", session_name_});
    if (r.is_err()) return Result<void>::Err(r.error, r.kind);
    return Result<void>::Ok();
}

Result<void> TmuxManager::set_environment(const std::string& key, const std::string& value) {
    auto r = tmux(fmt::format("Failed to set {}", key),
                  {"set-environment", "-t", session_name_, key, value});
    if (r.is_err()) return Result<void>::Err(r.error, r.kind);
    return Result<void>::Ok();
}

std::optional<std::string> TmuxManager::get_environment(const std::string& key) {
    auto r = runner_->run("tmux", {"show-environment", "-t", session_name_, key});
    if (r.failed()) return std::nullopt;

    // "KEY=value" or "-KEY" when unset
    std::string line = r.stdout_data;
    trim(line);
    auto eq = line.find('=');
    if (eq == std::string::npos) return std::nullopt;
    return line.substr(eq + 1);
}

Result<std::vector<SessionSummary>> TmuxManager::list_sessions(std::shared_ptr<CommandRunner> runner,
                                                               const std::string& prefix) {
    std::vector<SessionSummary> out;
    auto r = runner->run("tmux", {"list-sessions", "-F", "#{session_name}"});
    if (r.failed()) {
        // No server means no sessions
        if (r.stderr_data.find("no server running") != std::string::npos ||
            r.stderr_data.find("error connecting") != std::string::npos ||
            r.stderr_data.find("No such file or directory") != std::string::npos) {
            return Result<std::vector<SessionSummary>>::Ok(out);
        }
        return Result<std::vector<SessionSummary>>::Err(
            describe_failure("Failed to list sessions", "tmux", r),
            ErrorKind::ExternalCommandFailed);
    }

    std::string wanted = prefix + "-";
    for (auto& name : split_lines(r.stdout_data)) {
        trim(name);
        if (name.compare(0, wanted.size(), wanted) != 0) continue;

        TmuxManager session(runner, name);
        SessionSummary s;
        s.name = name;
        s.project_path = session.get_environment(ENV_PROJECT_PATH).value_or("");
        s.num_experts = safe_stoi(session.get_environment(ENV_NUM_EXPERTS).value_or(""), 0);
        s.created_at = session.get_environment(ENV_CREATED_AT).value_or("");
        out.push_back(s);
    }
    return Result<std::vector<SessionSummary>>::Ok(out);
}

// ── Panes ───────────────────────────────────────────────────

Result<void> TmuxManager::set_pane_title(int pane, const std::string& title) {
    auto r = tmux(fmt::format("Failed to title pane {}", pane),
                  {"select-pane", "-t", target(pane), "-T", title});
    if (r.is_err()) return Result<void>::Err(r.error, r.kind);
    return Result<void>::Ok();
}

Result<void> TmuxManager::change_directory(int pane, const std::string& dir) {
    return exec(pane, "cd " + shell_quote(dir));
}

Result<void> TmuxManager::exec(int pane, const std::string& command) {
    auto cleared = send_key(pane, "C-u");
    if (cleared.is_err()) return cleared;
    auto typed = send_text(pane, command);
    if (typed.is_err()) return typed;
    return send_key(pane, "Enter");
}

Result<void> TmuxManager::send_text(int pane, const std::string& text) {
    auto r = tmux(fmt::format("Failed to send text to pane {}", pane),
                  {"send-keys", "-t", target(pane), "-l", text});
    if (r.is_err()) return Result<void>::Err(r.error, r.kind);
    return Result<void>::Ok();
}

Result<void> TmuxManager::send_key(int pane, const std::string& key) {
    auto r = tmux(fmt::format("Failed to send {} to pane {}", key, pane),
                  {"send-keys", "-t", target(pane), key});
    if (r.is_err()) return Result<void>::Err(r.error, r.kind);
    return Result<void>::Ok();
}

Result<std::string> TmuxManager::capture_pane(int pane) {
    return tmux(fmt::format("Failed to capture pane {}", pane),
                {"capture-pane", "-p", "-t", target(pane)});
}

Result<std::string> TmuxManager::pane_command(int pane) {
    auto r = tmux(fmt::format("Failed to query pane {}", pane),
                  {"display-message", "-p", "-t", target(pane), "#{pane_current_command}"});
    if (r.is_ok()) trim(r.value);
    return r;
}
