#include "tower_app.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <sstream>

TowerApp::TowerApp(std::unique_ptr<InputSource> input, std::unique_ptr<Renderer> renderer,
                   TowerOptions options)
    : input_(std::move(input)), renderer_(std::move(renderer)), options_(options) {
    register_commands();
}

TowerApp::~TowerApp() {
    if (watcher_) watcher_->stop();
    size_t running = coordinator_.size() + tasks_.size();
    if (running > 0) {
        crew_log(fmt::format("tower: exiting with {} operation(s) still running", running));
    }
}

// ── Lifecycle ───────────────────────────────────────────────

Result<void> TowerApp::bootstrap(const Bootstrapper& bootstrapper) {
    if (state_ != TowerState::Bootstrapping) {
        return Result<void>::Err("Control loop already bootstrapped", ErrorKind::InvalidInput);
    }

    auto s = bootstrapper();
    if (s.is_err()) {
        state_ = TowerState::Terminated;
        return Result<void>::Err(s.error, s.kind);
    }
    session_ = s.value;

    if (options_.watch_panes) {
        watcher_ = std::make_unique<PaneWatcher>(session_.tmux,
                                                 session_.config.timeouts().capture_interval_ms);
        std::vector<int> panes;
        for (const auto& info : session_.config.expert_infos()) panes.push_back(info.id);
        watcher_->update_targets(panes);
        watcher_->start();
    }

    PaneWatcher* watcher = watcher_.get();
    detector_ = std::make_unique<StateDetector>(
        session_.config.status_dir(),
        [watcher](int pane) -> std::optional<PaneSnapshot> {
            if (!watcher) return std::nullopt;
            return watcher->snapshot(pane);
        },
        session_.config.timeouts().stuck_after_secs);

    for (const auto& info : session_.config.expert_infos()) reload_context(info.id);

    state_ = TowerState::Running;
    crew_log(fmt::format("tower: running on {}", session_.config.session_name()));
    return Result<void>::Ok();
}

bool TowerApp::tick() {
    if (state_ != TowerState::Running) return false;

    InputEvent ev = input_->next(session_.config.timeouts().tick_ms);
    if (ev.kind == InputEvent::Kind::Eof) {
        terminate();
        return false;
    }
    if (ev.kind == InputEvent::Kind::Line) {
        execute_command(ev.text);
        if (state_ != TowerState::Running) return false;
    }

    poll_operations();

    TowerView v = view();
    if (!last_rendered_ || *last_rendered_ != v) {
        renderer_->render(v);
        last_rendered_ = std::move(v);
    }
    return true;
}

void TowerApp::run() {
    while (tick()) {}
}

void TowerApp::terminate() {
    if (state_ == TowerState::Terminated) return;
    state_ = TowerState::Terminated;
    if (watcher_) watcher_->stop();
    crew_log(fmt::format("tower: terminated, {} operation(s) left running",
                         coordinator_.size() + tasks_.size()));
}

// ── Guarded operations ──────────────────────────────────────

Result<void> TowerApp::start_guarded_launch(int agent_id, const LaunchOptions& options) {
    if (state_ != TowerState::Running) {
        return Result<void>::Err("Control loop is not running", ErrorKind::InvalidInput);
    }
    if (!session_.config.expert(agent_id)) {
        return Result<void>::Err(fmt::format("No agent with id {}", agent_id),
                                 ErrorKind::InvalidInput);
    }

    if (auto task = tasks_.label(agent_id)) {
        return Result<void>::Err(fmt::format("{} already in progress", *task),
                                 ErrorKind::GuardRejected);
    }

    // The operation owns copies; the loop may be gone before it finishes
    SessionConfig config = session_.config;
    LaunchDeps deps = session_.launch_deps();
    std::string label = launch_label(config, agent_id, options.placement, options.fresh_context);

    return coordinator_.start(agent_id, label, [config, deps, agent_id, options]() {
        return run_launch_sequence(config, deps, agent_id, options);
    });
}

Result<void> TowerApp::start_guarded_task(int agent_id, const std::string& task) {
    if (state_ != TowerState::Running) {
        return Result<void>::Err("Control loop is not running", ErrorKind::InvalidInput);
    }
    if (!session_.config.expert(agent_id)) {
        return Result<void>::Err(fmt::format("No agent with id {}", agent_id),
                                 ErrorKind::InvalidInput);
    }
    if (auto launch = coordinator_.label(agent_id)) {
        return Result<void>::Err(fmt::format("{} already in progress", *launch),
                                 ErrorKind::GuardRejected);
    }

    SessionConfig config = session_.config;
    LaunchDeps deps = session_.launch_deps();
    return tasks_.start(agent_id, task_label(config, agent_id), [config, deps, agent_id, task]() {
        return run_task_assignment(config, deps, agent_id, task);
    });
}

std::optional<std::string> TowerApp::busy_label(int agent_id) const {
    if (auto launch = coordinator_.label(agent_id)) return launch;
    return tasks_.label(agent_id);
}

void TowerApp::poll_operations() {
    for (int key : coordinator_.keys()) {
        auto polled = coordinator_.poll(key);
        if (polled.state != PollState::Finished) continue;

        const auto& r = *polled.result;
        if (r.is_err()) {
            notice(fmt::format("{} failed: {}", polled.label, r.error));
        } else {
            std::string msg = r.value.summary();
            if (!r.value.warnings.empty()) {
                msg += fmt::format(" ({} warning{}: {})", r.value.warnings.size(),
                                   r.value.warnings.size() == 1 ? "" : "s",
                                   r.value.warnings.front());
            }
            notice(msg);
        }
        reload_context(key);
    }

    for (int key : tasks_.keys()) {
        auto polled = tasks_.poll(key);
        if (polled.state != PollState::Finished) continue;
        const auto& r = *polled.result;
        if (r.is_err()) notice(fmt::format("{} failed: {}", polled.label, r.error));
        else notice(r.value);
    }
}

// ── Observation ─────────────────────────────────────────────

AgentStatus TowerApp::classify(int agent_id) const {
    if (!detector_) return AgentStatus::Unknown;
    return detector_->classify(agent_id);
}

TowerView TowerApp::view() const {
    TowerView v;
    v.session_name = session_.config.session_name();
    v.project_path = session_.config.project_path().string();
    v.messages.assign(messages_.begin(), messages_.end());

    for (const auto& info : session_.config.expert_infos()) {
        AgentRow row;
        row.id = info.id;
        row.name = info.name;
        row.role = info.role;
        row.status = classify(info.id);
        row.operation = busy_label(info.id);

        auto ctx = contexts_.find(info.id);
        if (ctx != contexts_.end()) {
            if (!ctx->second.role().empty()) row.role = ctx->second.role();
            row.branch = ctx->second.worktree_branch();
        }
        if (watcher_) {
            if (auto snap = watcher_->snapshot(info.id); snap && snap->captured) {
                row.activity = snap->last_activity;
            }
        }
        v.agents.push_back(row);
    }
    return v;
}

void TowerApp::reload_context(int agent_id) {
    auto loaded = session_.store->load(session_.config.session_hash(), agent_id);
    if (loaded.is_err()) {
        crew_log("tower: " + loaded.error);
        return;
    }
    if (loaded.value) {
        contexts_[agent_id] = *loaded.value;
    } else {
        contexts_.erase(agent_id);
    }
}

void TowerApp::notice(const std::string& msg) {
    crew_log("tower: " + msg);
    messages_.push_back(msg);
    while (static_cast<int>(messages_.size()) > STATUS_HISTORY_LIMIT) {
        messages_.pop_front();
    }
}

// ── Commands ────────────────────────────────────────────────

void TowerApp::add_command(const std::string& name, CommandHandler handler,
                           const std::string& help) {
    if (!commands_.count(name)) command_order_.push_back(name);
    commands_[name] = {handler, help};
}

void TowerApp::register_commands() {
    add_command("launch", [](TowerApp& app, const std::string& a) { app.cmd_launch(a); },
                "launch <agent>              (re)start an agent where it is");
    add_command("worktree", [](TowerApp& app, const std::string& a) { app.cmd_worktree(a); },
                "worktree <agent> <feature>  move an agent into a feature worktree");
    add_command("return", [](TowerApp& app, const std::string& a) { app.cmd_return(a); },
                "return <agent>              move an agent back to the project root");
    add_command("reset", [](TowerApp& app, const std::string& a) { app.cmd_reset(a); },
                "reset <agent>               forget context and report, relaunch at root");
    add_command("role", [](TowerApp& app, const std::string& a) { app.cmd_role(a); },
                "role <agent> <role>         assign a role for the next launch");
    add_command("assign", [](TowerApp& app, const std::string& a) { app.cmd_assign(a); },
                "assign <agent> <task>       send a task and record it as a decision");
    add_command("decide", [](TowerApp& app, const std::string& a) { app.cmd_decide(a); },
                "decide <topic>: <decision>  record a decision for every agent");
    add_command("decisions", [](TowerApp& app, const std::string& a) { app.cmd_decisions(a); },
                "decisions [topic]           recent shared decisions");
    add_command("reports", [](TowerApp& app, const std::string& a) { app.cmd_reports(a); },
                "reports                     latest report of every agent");
    add_command("report", [](TowerApp& app, const std::string& a) { app.cmd_report(a); },
                "report <agent>              one agent's report in detail");
    add_command("status", [](TowerApp& app, const std::string& a) { app.cmd_status(a); },
                "status                      one line per agent");
    add_command("help", [](TowerApp& app, const std::string& a) { app.cmd_help(a); },
                "help                        list commands");
    add_command("quit", [](TowerApp& app, const std::string&) { app.terminate(); },
                "quit                        leave (agents keep running)");
}

void TowerApp::execute_command(const std::string& line) {
    std::istringstream iss(line);
    std::string command;
    iss >> command;
    if (command.empty()) return;

    std::string args;
    std::getline(iss, args);
    trim(args);

    if (command == "exit" || command == "q") command = "quit";
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        notice(fmt::format("Unknown command: {} (type 'help')", command));
        return;
    }
    it->second.first(*this, args);
}

std::optional<ExpertInfo> TowerApp::agent_arg(const std::string& arg) {
    if (arg.empty()) {
        notice("Missing agent id");
        return std::nullopt;
    }
    auto info = session_.config.resolve_expert(arg);
    if (!info) notice(fmt::format("No agent '{}'", arg));
    return info;
}

static std::pair<std::string, std::string> split_first(const std::string& args) {
    auto sp = args.find_first_of(" \t");
    if (sp == std::string::npos) return {args, ""};
    std::string rest = args.substr(sp + 1);
    trim(rest);
    return {args.substr(0, sp), rest};
}

void TowerApp::report_start(const Result<void>& started, const std::string& ok_msg) {
    if (started.is_ok()) {
        notice(ok_msg);
    } else if (started.kind == ErrorKind::GuardRejected) {
        notice(fmt::format("! {}", started.error));
    } else {
        notice(started.error);
    }
}

void TowerApp::cmd_launch(const std::string& args) {
    auto info = agent_arg(args);
    if (!info) return;
    LaunchOptions opts;
    opts.placement = Placement::keep();
    report_start(start_guarded_launch(info->id, opts),
                 fmt::format("Launching {}...", info->name));
}

void TowerApp::cmd_worktree(const std::string& args) {
    auto [who, feature] = split_first(args);
    auto info = agent_arg(who);
    if (!info) return;

    std::string branch = sanitize_branch_name(feature);
    if (branch.empty()) {
        notice("Usage: worktree <agent> <feature name>");
        return;
    }
    LaunchOptions opts;
    opts.placement = Placement::worktree(branch);
    report_start(start_guarded_launch(info->id, opts),
                 fmt::format("Moving {} to worktree '{}'...", info->name, branch));
}

void TowerApp::cmd_return(const std::string& args) {
    auto info = agent_arg(args);
    if (!info) return;
    LaunchOptions opts;
    opts.placement = Placement::project_root();
    report_start(start_guarded_launch(info->id, opts),
                 fmt::format("Returning {} to the project root...", info->name));
}

void TowerApp::cmd_role(const std::string& args) {
    auto [who, role] = split_first(args);
    auto info = agent_arg(who);
    if (!info) return;
    if (role.empty()) {
        notice("Usage: role <agent> <role>");
        return;
    }

    // The context belongs to whichever operation holds the agent
    if (auto label = busy_label(info->id)) {
        notice(fmt::format("! {} already in progress", *label));
        return;
    }

    const std::string hash = session_.config.session_hash();
    auto roles = session_.store->load_roles(hash);
    SessionRoles table = (roles.is_ok() && roles.value) ? *roles.value : make_session_roles(hash);
    table.set_role(info->id, role);
    auto saved = session_.store->save_roles(table);
    if (saved.is_err()) {
        notice("Role not saved: " + saved.error);
        return;
    }

    auto loaded = session_.store->load(hash, info->id);
    AgentContext ctx = (loaded.is_ok() && loaded.value)
                           ? *loaded.value
                           : AgentContext(hash, info->id, info->name, info->role);
    ctx.set_role(role);
    auto ctx_saved = session_.store->save(ctx);
    if (ctx_saved.is_err()) {
        notice("Role not saved: " + ctx_saved.error);
        return;
    }
    reload_context(info->id);
    notice(fmt::format("{} is now '{}' (applies on next launch)", info->name, role));
}

void TowerApp::cmd_reset(const std::string& args) {
    auto info = agent_arg(args);
    if (!info) return;
    LaunchOptions opts;
    opts.placement = Placement::keep();
    opts.fresh_context = true;
    report_start(start_guarded_launch(info->id, opts),
                 fmt::format("Resetting {}...", info->name));
}

void TowerApp::cmd_assign(const std::string& args) {
    auto [who, task] = split_first(args);
    auto info = agent_arg(who);
    if (!info) return;
    if (task.empty()) {
        notice("Usage: assign <agent> <task>");
        return;
    }
    report_start(start_guarded_task(info->id, task),
                 fmt::format("Sending task to {}...", info->name));
}

void TowerApp::cmd_decide(const std::string& args) {
    auto colon = args.find(':');
    std::string topic = colon == std::string::npos ? "" : args.substr(0, colon);
    std::string decision = colon == std::string::npos ? "" : args.substr(colon + 1);
    trim(topic);
    trim(decision);
    if (topic.empty() || decision.empty()) {
        notice("Usage: decide <topic>: <decision>");
        return;
    }

    Decision d = make_decision(TOWER_DECISION_AUTHOR, topic, decision, "");
    auto added = session_.store->add_decision(session_.config.session_hash(), d);
    if (added.is_err()) {
        notice("Decision not recorded: " + added.error);
        return;
    }
    notice(fmt::format("Recorded {}: {} (sent with the next role instruction)", topic, decision));
}

void TowerApp::cmd_decisions(const std::string& args) {
    std::string topic = args;
    trim(topic);
    auto shared = session_.store->load_shared(session_.config.session_hash());
    if (shared.is_err()) {
        notice("Decisions unreadable: " + shared.error);
        return;
    }
    auto decisions = topic.empty() ? shared.value.decisions
                                   : shared.value.decisions_by_topic(topic);
    if (decisions.empty()) {
        notice(topic.empty() ? "No decisions yet" : fmt::format("No decisions about '{}'", topic));
        return;
    }

    size_t limit = static_cast<size_t>(MAX_LISTED_DECISIONS);
    size_t first = decisions.size() > limit ? decisions.size() - limit : 0;
    for (size_t i = first; i < decisions.size(); ++i) {
        const Decision& d = decisions[i];
        std::string by = "tower";
        if (auto author = session_.config.expert(d.made_by)) by = author->name;
        notice(fmt::format("{} [{}] {}: {}", d.timestamp, by, d.topic, d.decision));
    }
}

void TowerApp::cmd_reports(const std::string&) {
    auto reports = session_.reports->list();
    if (reports.empty()) {
        notice("No reports yet");
        return;
    }
    for (const auto& r : reports) {
        std::string name = r.expert_name.empty() ? fmt::format("expert{}", r.expert_id)
                                                 : r.expert_name;
        notice(fmt::format("{}: {} {}", name, report_status_name(r.status),
                           truncate_str(r.summary, ACTIVITY_PREVIEW_LEN)));
    }
}

void TowerApp::cmd_report(const std::string& args) {
    auto info = agent_arg(args);
    if (!info) return;
    auto read = session_.reports->read(info->id);
    if (read.is_err()) {
        notice(fmt::format("Report of {} unusable: {}", info->name, read.error));
        return;
    }
    if (!read.value) {
        notice(fmt::format("{} has not reported", info->name));
        return;
    }

    const Report& r = *read.value;
    notice(fmt::format("{} task {}: {}", info->name, r.task_id, report_status_name(r.status)));
    if (!r.summary.empty()) notice(r.summary);
    for (const auto& f : r.findings) {
        std::string where;
        if (f.file) where = f.line ? fmt::format(" ({}:{})", *f.file, *f.line)
                                   : fmt::format(" ({})", *f.file);
        notice(fmt::format("- [{}] {}{}", f.severity.empty() ? "info" : f.severity,
                           f.description, where));
    }
    for (const auto& e : r.errors) notice("! " + e);
}

void TowerApp::cmd_status(const std::string&) {
    for (const auto& row : view().agents) {
        std::string where = row.branch ? "worktree " + *row.branch : "project root";
        std::string line = fmt::format("{} {}: {} in {}", row.id, row.name,
                                       agent_status_name(row.status), where);
        if (row.operation) line += fmt::format(" [{}]", *row.operation);
        notice(line);
    }
}

void TowerApp::cmd_help(const std::string&) {
    for (const auto& name : command_order_) {
        notice(commands_.at(name).second);
    }
}
