#include "session_bootstrap.hpp"
#include <core/constants.hpp>
#include <core/directory_structure.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <managers/state_detector.hpp>
#include <fmt/format.h>
#include <utility>

LaunchDeps Session::launch_deps() const {
    return LaunchDeps{tmux, agents, worktrees, store, instructions, reports};
}

static Result<Session> infra(const std::string& msg) {
    crew_log("bootstrap: " + msg);
    return Result<Session>::Err(msg, ErrorKind::Infrastructure);
}

Result<Session> open_session(const SessionConfig& base, const fs::path& project_path,
                             std::shared_ptr<CommandRunner> runner) {
    std::error_code ec;
    if (!fs::is_directory(project_path, ec)) {
        return infra(fmt::format("Project directory {} does not exist", project_path.string()));
    }

    SessionConfig config = base.with_project_path(project_path);
    auto root = WorktreeManager::resolve_git_root(*runner, config.project_path());
    if (root.is_err()) return infra(root.error);
    config = config.with_git_root(root.value);

    auto dirs = ensure_session_directories(config);
    if (dirs.is_err()) return infra(dirs.error);

    Session s;
    s.config = config;
    s.runner = runner;
    s.tmux = std::make_shared<TmuxManager>(runner, config.session_name());
    s.agents = std::make_shared<AgentManager>(s.tmux, config.agent());
    s.worktrees = std::make_shared<WorktreeManager>(runner, config.git_root());
    s.store = std::make_shared<ContextStore>(config.queue_path());
    s.reports = std::make_shared<ReportStore>(config.reports_dir());
    s.instructions = std::make_shared<const RoleInstructions>(
        RoleInstructions::for_session(config));

    auto excluded = s.worktrees->ensure_excluded();
    if (excluded.is_err()) crew_log("bootstrap: " + excluded.error);

    const std::string hash = config.session_hash();
    auto init = s.store->init_session(hash, config.num_experts());
    if (init.is_err()) return infra(init.error);

    // One context per agent, created empty on first run
    for (const auto& info : config.expert_infos()) {
        auto existing = s.store->load(hash, info.id);
        if (existing.is_ok() && existing.value) continue;
        if (existing.is_err()) {
            crew_log(fmt::format("bootstrap: replacing unreadable context for {}: {}",
                                 info.name, existing.error));
        }
        AgentContext ctx(hash, info.id, info.name, info.role);
        auto saved = s.store->save(ctx);
        if (saved.is_err()) return infra(saved.error);
    }

    auto roles = s.store->load_roles(hash);
    if (roles.is_err() || !roles.value) {
        SessionRoles table = make_session_roles(hash);
        for (const auto& info : config.expert_infos()) {
            table.set_role(info.id, info.role);
        }
        auto saved = s.store->save_roles(table);
        if (saved.is_err()) return infra(saved.error);
    }

    return Result<Session>::Ok(s);
}

Result<Session> bootstrap_session(const SessionConfig& config, const fs::path& project_path,
                                  std::shared_ptr<CommandRunner> runner) {
    auto prepared = open_session(config, project_path, std::move(runner));
    if (prepared.is_err()) return prepared;
    Session s = prepared.value;
    const SessionConfig& cfg = s.config;

    if (s.tmux->session_exists()) {
        crew_log(fmt::format("bootstrap: reusing tmux session {}", cfg.session_name()));
        auto recorded = s.tmux->get_environment(ENV_NUM_EXPERTS);
        if (recorded && safe_stoi(*recorded, cfg.num_experts()) != cfg.num_experts()) {
            return infra(fmt::format(
                "Session {} is running with {} agents, not {}. Run 'crew down' first.",
                cfg.session_name(), *recorded, cfg.num_experts()));
        }
    } else {
        auto created = s.tmux->create_session(cfg.num_experts(), cfg.project_path().string());
        if (created.is_err()) return infra(created.error);
        s.created_tmux_session = true;

        const std::pair<std::string, std::string> env[] = {
            {ENV_PROJECT_PATH, cfg.project_path().string()},
            {ENV_NUM_EXPERTS, std::to_string(cfg.num_experts())},
            {ENV_CREATED_AT, now_iso()},
        };
        for (const auto& [key, value] : env) {
            auto set = s.tmux->set_environment(key, value);
            if (set.is_err()) return infra(set.error);
        }
    }

    for (const auto& info : cfg.expert_infos()) {
        auto titled = s.tmux->set_pane_title(info.id, info.name);
        if (titled.is_err()) return infra(titled.error);
    }

    crew_log(fmt::format("bootstrap: session {} ready ({} agents, git root {})",
                         cfg.session_name(), cfg.num_experts(), cfg.git_root().string()));
    return Result<Session>::Ok(s);
}

Result<Session> attach_session(const SessionConfig& config, const fs::path& project_path,
                               std::shared_ptr<CommandRunner> runner) {
    auto prepared = open_session(config, project_path, std::move(runner));
    if (prepared.is_err()) return prepared;
    Session s = prepared.value;

    if (!s.tmux->session_exists()) {
        return infra(fmt::format("No running session {} for {}. Run 'crew start' first.",
                                 s.config.session_name(), s.config.project_path().string()));
    }
    return Result<Session>::Ok(s);
}

Result<void> teardown_session(Session& session, bool clean) {
    const SessionConfig& cfg = session.config;
    const std::string hash = cfg.session_hash();

    if (session.tmux->session_exists()) {
        auto killed = session.tmux->kill_session();
        if (killed.is_err()) return killed;
    }

    for (const auto& info : cfg.expert_infos()) {
        auto marker = clear_status_marker(cfg.status_dir(), info.id);
        if (marker.is_err()) crew_log("teardown: " + marker.error);
    }
    if (!clean) return Result<void>::Ok();

    for (const auto& info : cfg.expert_infos()) {
        auto report = session.reports->clear(info.id);
        if (report.is_err()) crew_log("teardown: " + report.error);

        auto ctx = session.store->load(hash, info.id);
        if (ctx.is_err() || !ctx.value || !ctx.value->worktree_branch()) continue;
        auto removed = session.worktrees->remove_worktree(*ctx.value->worktree_branch());
        if (removed.is_err()) {
            // Another agent may have shared the branch and removed it already
            crew_log("teardown: " + removed.error);
        }
    }
    return session.store->cleanup_session(hash);
}
