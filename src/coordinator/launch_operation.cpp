#include "launch_operation.hpp"
#include <core/constants.hpp>
#include <core/directory_structure.hpp>
#include <core/log.hpp>
#include <context/hook_settings.hpp>
#include <managers/state_detector.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

std::string LaunchOutcome::summary() const {
    switch (placement.kind) {
        case Placement::Kind::Worktree:
            if (ready) return fmt::format("{} launched in worktree '{}'", agent_name, placement.branch);
            return fmt::format("Worktree '{}' created but {} may still be starting",
                               placement.branch, agent_name);
        case Placement::Kind::ProjectRoot:
            if (ready) return fmt::format("{} returned to the project root", agent_name);
            return fmt::format("{} moved to the project root but may still be starting",
                               agent_name);
        case Placement::Kind::Keep:
            break;
    }
    if (ready) return fmt::format("{} ready{}", agent_name, resumed ? " (resumed)" : "");
    return fmt::format("{} launched but not ready yet", agent_name);
}

std::string compose_instruction(const std::string& role_text, const fs::path& report_file,
                                const std::vector<Decision>& decisions) {
    std::string text = role_text;
    while (!text.empty() && (text.back() == '\n' || text.back() == ' ')) text.pop_back();

    text += fmt::format("\n\nWhen you finish a task, write your report as YAML to {} "
                        "(task_id, expert_id, expert_name, status: done|failed, started_at, "
                        "completed_at, summary, details: findings/recommendations/"
                        "files_modified/files_created, errors).",
                        report_file.string());

    if (!decisions.empty()) {
        text += "\n\nTeam decisions so far:";
        const size_t limit = static_cast<size_t>(MAX_INSTRUCTION_DECISIONS);
        size_t first = decisions.size() > limit ? decisions.size() - limit : 0;
        for (size_t i = first; i < decisions.size(); ++i) {
            text += fmt::format("\n- {}: {}", decisions[i].topic, decisions[i].decision);
        }
    }
    return text;
}

std::string launch_label(const SessionConfig& config, int agent_id, const Placement& placement,
                         bool fresh_context) {
    auto info = config.expert(agent_id);
    std::string name = info ? info->name : fmt::format("expert{}", agent_id);
    if (fresh_context) return "Reset of " + name;
    switch (placement.kind) {
        case Placement::Kind::Worktree:    return "Worktree launch of " + name;
        case Placement::Kind::ProjectRoot: return "Return of " + name;
        case Placement::Kind::Keep:        break;
    }
    return "Launch of " + name;
}

Result<LaunchOutcome> run_launch_sequence(const SessionConfig& config, const LaunchDeps& deps,
                                          int agent_id, const LaunchOptions& options) {
    auto info = config.expert(agent_id);
    if (!info) {
        return Result<LaunchOutcome>::Err(fmt::format("No agent with id {}", agent_id),
                                          ErrorKind::InvalidInput);
    }

    OperationLog log(expert_log_path(config, agent_id), fmt::format("expert{}", agent_id));
    const Placement& placement = options.placement;

    LaunchOutcome outcome;
    outcome.agent_id = agent_id;
    outcome.agent_name = info->name;
    outcome.placement = placement;
    log(fmt::format("{} started",
                    launch_label(config, agent_id, placement, options.fresh_context)));

    // ── 1. Stop whatever is running in the pane ───────────
    bool agent_running = false;
    if (!placement.relocating()) {
        auto cmd = deps.tmux->pane_command(agent_id);
        agent_running = cmd.is_ok() && !is_shell_command(cmd.value);
    }
    if (placement.relocating() || agent_running) {
        auto exited = deps.agents->send_exit(agent_id);
        if (exited.is_err()) log("Exit request failed (continuing): " + exited.error);
        platform::sleep_ms(config.timeouts().exit_grace_ms);
    }

    // ── 2-3. Worktree and alias ───────────────────────────
    std::string working_dir = config.project_path().string();
    if (placement.kind == Placement::Kind::Worktree) {
        auto wt = deps.worktrees->create_worktree(placement.branch);
        if (wt.is_err()) {
            log("Worktree failed: " + wt.error);
            return Result<LaunchOutcome>::Err(wt.error, wt.kind);
        }
        auto alias = deps.worktrees->establish_alias(wt.value);
        if (alias.is_err()) {
            log("Alias failed: " + alias.error);
            return Result<LaunchOutcome>::Err(alias.error, alias.kind);
        }
        working_dir = wt.value.string();
        log("Worktree ready at " + working_dir);
    }

    // ── 4. Context ────────────────────────────────────────
    if (options.fresh_context) {
        auto cleared = deps.store->clear(config.session_hash(), agent_id);
        if (cleared.is_err()) {
            outcome.warnings.push_back("Context not cleared: " + cleared.error);
            log(outcome.warnings.back());
        }
        if (deps.reports) {
            auto report = deps.reports->clear(agent_id);
            if (report.is_err()) log(report.error);
        }
        log("Context cleared");
    }

    AgentContext ctx(config.session_hash(), agent_id, info->name, info->role);
    auto loaded = deps.store->load(config.session_hash(), agent_id);
    if (loaded.is_err()) {
        outcome.warnings.push_back("Context unreadable, starting fresh: " + loaded.error);
        log(outcome.warnings.back());
    } else if (loaded.value) {
        ctx = *loaded.value;
    }

    std::string role = ctx.role().empty() ? info->role : ctx.role();
    auto roles = deps.store->load_roles(config.session_hash());
    if (roles.is_ok() && roles.value) {
        if (auto assigned = roles.value->get_role(agent_id)) role = *assigned;
    }
    if (ctx.role() != role) ctx.set_role(role);

    // ── 5. Record the move ────────────────────────────────
    if (placement.kind == Placement::Kind::Worktree) {
        ctx.set_worktree(placement.branch, working_dir);
    } else if (placement.kind == Placement::Kind::ProjectRoot) {
        ctx.clear_worktree();
    } else if (ctx.in_worktree()) {
        std::error_code ec;
        if (fs::is_directory(*ctx.worktree_path(), ec)) {
            working_dir = *ctx.worktree_path();
        } else {
            outcome.warnings.push_back(fmt::format(
                "Worktree {} is gone; launching at the project root", *ctx.worktree_path()));
            log(outcome.warnings.back());
            ctx.clear_worktree();
        }
    }
    outcome.working_dir = working_dir;
    outcome.branch = ctx.worktree_branch();

    auto saved = deps.store->save(ctx);
    if (saved.is_err()) {
        outcome.warnings.push_back("Context not saved: " + saved.error);
        log(outcome.warnings.back());
    }

    // ── 6. Launch ─────────────────────────────────────────
    auto marker = write_status_marker(config.status_dir(), agent_id, MARKER_STARTING);
    if (marker.is_err()) log(marker.error);
    auto titled = deps.tmux->set_pane_title(agent_id, info->name);
    if (titled.is_err()) log(titled.error);

    std::optional<std::string> settings;
    if (!config.agent().settings_flag.empty()) {
        auto hooks = write_hook_settings(config, agent_id);
        if (hooks.is_err()) {
            outcome.warnings.push_back("Status hooks not written: " + hooks.error);
            log(outcome.warnings.back());
        } else {
            settings = hooks.value.string();
        }
    }

    outcome.resumed = ctx.resume_token().has_value();
    auto launched = deps.agents->launch(agent_id, working_dir, ctx.resume_token(), settings);
    if (launched.is_err()) {
        outcome.warnings.push_back("Launch failed: " + launched.error);
        log(outcome.warnings.back());
        return Result<LaunchOutcome>::Ok(outcome);
    }
    log(fmt::format("Agent launched in {}{}", working_dir, outcome.resumed ? " (resume)" : ""));

    // ── 7. Readiness ──────────────────────────────────────
    outcome.ready = deps.agents->wait_for_ready(agent_id, config.timeouts().agent_ready_secs);
    if (!outcome.ready) {
        log(fmt::format("Not ready after {}s", config.timeouts().agent_ready_secs));
        return Result<LaunchOutcome>::Ok(outcome);
    }
    log("Agent ready");
    marker = write_status_marker(config.status_dir(), agent_id, MARKER_PENDING);
    if (marker.is_err()) log(marker.error);

    // After a move the old conversation's banner can still be on screen
    if (auto token = placement.relocating() ? std::nullopt
                                            : deps.agents->capture_session_id(agent_id)) {
        if (ctx.resume_token() != token) {
            ctx.set_resume_token(*token);
            saved = deps.store->save(ctx);
            if (saved.is_err()) log("Resume token not saved: " + saved.error);
        }
    }

    // ── 8. Role instruction ───────────────────────────────
    if (options.send_role_instruction && deps.instructions) {
        std::string text = deps.instructions->load(role);
        if (!text.empty()) {
            std::vector<Decision> decisions;
            auto shared = deps.store->load_shared(config.session_hash());
            if (shared.is_ok()) decisions = shared.value.decisions_for_expert(agent_id);
            else log(shared.error);
            text = compose_instruction(text, expert_report_path(config, agent_id), decisions);

            auto sent = deps.agents->send_instruction(agent_id, text);
            if (sent.is_err()) {
                outcome.warnings.push_back("Instruction not sent: " + sent.error);
                log(outcome.warnings.back());
            } else {
                outcome.instruction_sent = true;
                log(fmt::format("Sent '{}' instruction ({} bytes)", role, text.size()));
            }
        }
    }

    log("Done: " + outcome.summary());
    return Result<LaunchOutcome>::Ok(outcome);
}
