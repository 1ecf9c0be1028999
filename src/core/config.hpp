#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include "types.hpp"
#include "constants.hpp"

namespace fs = std::filesystem;

struct ExpertConfig {
    std::string name;
    std::string role;
};

// How to start and talk to the agent CLI inside a pane
struct AgentCommandConfig {
    std::string command = "claude";
    std::vector<std::string> args = {"--dangerously-skip-permissions"};
    std::string resume_flag = "--resume";
    std::string settings_flag = "--settings";   // empty: no hook settings file
    std::string ready_marker = "bypass permissions";
    std::string exit_command = "/exit";
};

struct TimeoutConfig {
    int agent_ready_secs = AGENT_READY_TIMEOUT_SECS;
    int exit_grace_ms = EXIT_GRACE_MS;
    int stuck_after_secs = STUCK_AFTER_SECS;
    int tick_ms = TICK_MS;
    int capture_interval_ms = CAPTURE_INTERVAL_MS;
};

// Read-only after bootstrap; copied freely into background operations.
class SessionConfig {
public:
    SessionConfig();

    // Load from an explicit file. A missing file yields defaults.
    static Result<SessionConfig> load(const fs::path& path);

    // Load from $CREW_CONFIG or the default location.
    static Result<SessionConfig> load_default();

    // Derived copies
    SessionConfig with_project_path(const fs::path& path) const;
    SessionConfig with_git_root(const fs::path& root) const;
    SessionConfig with_num_experts(int n) const;

    // Accessors
    int num_experts() const { return num_experts_; }
    const std::string& session_prefix() const { return session_prefix_; }
    const std::vector<ExpertConfig>& experts() const { return experts_; }
    const AgentCommandConfig& agent() const { return agent_; }
    const TimeoutConfig& timeouts() const { return timeouts_; }
    const fs::path& project_path() const { return project_path_; }
    const fs::path& git_root() const { return git_root_; }

    // Mutable timing knobs for hosts and tests
    TimeoutConfig& timeouts() { return timeouts_; }
    AgentCommandConfig& agent() { return agent_; }

    // Deterministic from the project path: first 4 bytes of SHA-256, hex.
    std::string session_hash() const;
    std::string session_name() const;

    // ── Layout under <git root>/.crew ──────────────────────
    fs::path data_root() const;
    fs::path queue_path() const;
    fs::path status_dir() const;
    fs::path sessions_dir() const;
    fs::path session_dir() const;
    fs::path reports_dir() const;
    fs::path hooks_dir() const;
    fs::path logs_dir() const;
    fs::path worktrees_dir() const;

    std::vector<ExpertInfo> expert_infos() const;
    std::optional<ExpertInfo> expert(int id) const;
    // Case-insensitive
    std::optional<ExpertInfo> expert_by_name(const std::string& name) const;
    // Accepts a numeric id or a name
    std::optional<ExpertInfo> resolve_expert(const std::string& id_or_name) const;

private:
    int num_experts_ = DEFAULT_NUM_EXPERTS;
    std::string session_prefix_ = DEFAULT_SESSION_PREFIX;
    std::vector<ExpertConfig> experts_;
    AgentCommandConfig agent_;
    TimeoutConfig timeouts_;
    fs::path project_path_;
    fs::path git_root_;

    friend class ConfigParser;
};

// Get paths
fs::path get_config_dir();
fs::path get_config_path();

// Write a commented default config if none exists
Result<void> create_default_config(const fs::path& path = get_config_path());
