#pragma once

#include <memory>
#include <string>
#include <filesystem>
#include <core/types.hpp>
#include <core/config.hpp>
#include <managers/command_runner.hpp>
#include <managers/tmux_manager.hpp>
#include <managers/agent_manager.hpp>
#include <managers/worktree_manager.hpp>
#include <context/context_store.hpp>
#include <context/report_store.hpp>
#include <context/role_instructions.hpp>
#include <coordinator/launch_operation.hpp>

namespace fs = std::filesystem;

// Everything a control loop or host command needs, wired to one session.
struct Session {
    SessionConfig config;
    std::shared_ptr<CommandRunner> runner;
    std::shared_ptr<TmuxManager> tmux;
    std::shared_ptr<AgentManager> agents;
    std::shared_ptr<WorktreeManager> worktrees;
    std::shared_ptr<ContextStore> store;
    std::shared_ptr<ReportStore> reports;
    std::shared_ptr<const RoleInstructions> instructions;
    bool created_tmux_session = false;

    LaunchDeps launch_deps() const;
};

// Resolve the git root, lay out .crew, seed contexts and the role table.
// Does not touch tmux.
Result<Session> open_session(const SessionConfig& config, const fs::path& project_path,
                             std::shared_ptr<CommandRunner> runner);

// open_session, then create the tmux session if it is not running. Any failure is an
// Infrastructure error and nothing has been started in the background.
Result<Session> bootstrap_session(const SessionConfig& config, const fs::path& project_path,
                                  std::shared_ptr<CommandRunner> runner);

// Like bootstrap_session, but the tmux session must already be running.
Result<Session> attach_session(const SessionConfig& config, const fs::path& project_path,
                               std::shared_ptr<CommandRunner> runner);

// Kill the tmux session. With clean, also remove worktrees recorded in the
// contexts, the agents' reports and the session's context directory.
Result<void> teardown_session(Session& session, bool clean);
