#include "crew_cli.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <coordinator/background_coordinator.hpp>
#include <coordinator/launch_operation.hpp>
#include <managers/pane_watcher.hpp>
#include <managers/state_detector.hpp>
#include <platform/platform.hpp>
#include <session/session_bootstrap.hpp>
#include <tower/terminal_io.hpp>
#include <tower/tower_app.hpp>
#include <fmt/format.h>
#include <iostream>

Result<HostOptions> parse_host_args(const std::vector<std::string>& args) {
    HostOptions opts;
    std::optional<fs::path> path;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];
        if (a == "-n" || a == "--experts") {
            if (i + 1 >= args.size()) {
                return Result<HostOptions>::Err(a + " needs a number", ErrorKind::InvalidInput);
            }
            int n = safe_stoi(args[++i], 0);
            if (n < 1) {
                return Result<HostOptions>::Err(
                    fmt::format("Invalid agent count '{}'", args[i]), ErrorKind::InvalidInput);
            }
            opts.num_experts = n;
        } else if (a == "-c" || a == "--config") {
            if (i + 1 >= args.size()) {
                return Result<HostOptions>::Err(a + " needs a file", ErrorKind::InvalidInput);
            }
            opts.config_path = fs::path(args[++i]);
        } else if (a == "--clean") {
            opts.clean = true;
        } else if (!a.empty() && a[0] == '-') {
            return Result<HostOptions>::Err("Unknown option: " + a, ErrorKind::InvalidInput);
        } else if (!path) {
            path = fs::path(a);
        } else {
            return Result<HostOptions>::Err("Unexpected argument: " + a, ErrorKind::InvalidInput);
        }
    }

    opts.project_path = path ? *path : fs::current_path();
    return Result<HostOptions>::Ok(opts);
}

CrewCLI::CrewCLI(std::shared_ptr<CommandRunner> runner)
    : runner_(runner ? std::move(runner) : std::make_shared<SystemCommandRunner>()) {}

Result<SessionConfig> CrewCLI::load_config(const HostOptions& opts) const {
    auto loaded = opts.config_path ? SessionConfig::load(*opts.config_path)
                                   : SessionConfig::load_default();
    if (loaded.is_err()) return loaded;
    if (opts.num_experts) {
        return Result<SessionConfig>::Ok(loaded.value.with_num_experts(*opts.num_experts));
    }
    return loaded;
}

static void print_session(const Session& s) {
    std::cout << theme::section("Session");
    std::cout << theme::kv("Name", s.config.session_name());
    std::cout << theme::kv("Project", s.config.project_path().string());
    if (s.config.git_root() != s.config.project_path()) {
        std::cout << theme::kv("Git root", s.config.git_root().string());
    }
    std::cout << theme::kv("Agents", std::to_string(s.config.num_experts()));
}

// ── start ───────────────────────────────────────────────────

int CrewCLI::run_start(const HostOptions& opts) {
    auto config = load_config(opts);
    if (config.is_err()) {
        std::cout << theme::fail(config.error);
        return 1;
    }

    std::cout << theme::banner();
    auto session = bootstrap_session(config.value, opts.project_path, runner_);
    if (session.is_err()) {
        std::cout << theme::fail(session.error);
        return 1;
    }
    const Session& s = session.value;
    print_session(s);
    std::cout << (s.created_tmux_session ? theme::ok("tmux session created")
                                         : theme::info("tmux session already running"));

    // Same guarded sequence the control loop uses, one operation per agent
    std::cout << theme::section("Launching");
    BackgroundCoordinator<int, LaunchOutcome> coordinator;
    for (const auto& info : s.config.expert_infos()) {
        SessionConfig cfg = s.config;
        LaunchDeps deps = s.launch_deps();
        int id = info.id;
        LaunchOptions launch;
        auto started = coordinator.start(id, launch_label(cfg, id, launch.placement),
                                         [cfg, deps, id, launch]() {
                                             return run_launch_sequence(cfg, deps, id, launch);
                                         });
        if (started.is_err()) std::cout << theme::fail(started.error);
        else std::cout << theme::step(info.name + "...");
    }

    int ready = 0;
    int failed = 0;
    while (coordinator.size() > 0) {
        for (int key : coordinator.keys()) {
            auto polled = coordinator.poll(key);
            if (polled.state != PollState::Finished) continue;
            const auto& r = *polled.result;
            if (r.is_err()) {
                std::cout << theme::fail(fmt::format("{} failed: {}", polled.label, r.error));
                ++failed;
                continue;
            }
            if (r.value.ready) {
                std::cout << theme::ok(r.value.summary());
                ++ready;
            } else {
                std::cout << theme::warn(r.value.summary());
            }
            for (const auto& w : r.value.warnings) {
                std::cout << theme::dim("      " + w) << "\n";
            }
        }
        platform::sleep_ms(200);
    }

    std::cout << theme::divider();
    std::cout << theme::kv("Ready", fmt::format("{}/{}", ready, s.config.num_experts()));
    std::cout << theme::step("tmux attach -t " + s.config.session_name());
    std::cout << theme::step("crew tower   (control loop)");
    std::cout << "\n";
    return failed > 0 ? 1 : 0;
}

// ── launch / tower ──────────────────────────────────────────

static int run_control_loop(TowerApp::Bootstrapper bootstrapper, bool launch_all) {
    auto input = std::make_unique<ReadlineInput>(tower_prompt());
    TowerApp app(std::move(input), std::make_unique<TerminalRenderer>());

    auto booted = app.bootstrap(bootstrapper);
    if (booted.is_err()) {
        std::cout << theme::fail(booted.error);
        return 1;
    }

    if (launch_all) {
        for (const auto& info : app.session().config.expert_infos()) {
            auto started = app.start_guarded_launch(info.id, LaunchOptions{});
            if (started.is_err()) std::cout << theme::fail(started.error);
        }
    }

    app.run();

    std::cout << "\n";
    std::cout << theme::dim("    Agents keep running in tmux session "
                            + app.session().config.session_name()) << "\n";
    std::cout << theme::step("crew tower   (reattach)");
    std::cout << "\n";
    return 0;
}

int CrewCLI::run_launch(const HostOptions& opts) {
    auto config = load_config(opts);
    if (config.is_err()) {
        std::cout << theme::fail(config.error);
        return 1;
    }
    auto runner = runner_;
    fs::path project = opts.project_path;
    SessionConfig cfg = config.value;
    return run_control_loop([cfg, project, runner]() {
        return bootstrap_session(cfg, project, runner);
    }, true);
}

int CrewCLI::run_tower(const HostOptions& opts) {
    auto config = load_config(opts);
    if (config.is_err()) {
        std::cout << theme::fail(config.error);
        return 1;
    }
    auto runner = runner_;
    fs::path project = opts.project_path;
    SessionConfig cfg = config.value;
    return run_control_loop([cfg, project, runner]() {
        return attach_session(cfg, project, runner);
    }, false);
}

// ── down ────────────────────────────────────────────────────

int CrewCLI::run_down(const HostOptions& opts) {
    auto config = load_config(opts);
    if (config.is_err()) {
        std::cout << theme::fail(config.error);
        return 1;
    }
    auto session = open_session(config.value, opts.project_path, runner_);
    if (session.is_err()) {
        std::cout << theme::fail(session.error);
        return 1;
    }

    bool was_running = session.value.tmux->session_exists();
    auto down = teardown_session(session.value, opts.clean);
    if (down.is_err()) {
        std::cout << theme::fail(down.error);
        return 1;
    }

    const std::string& name = session.value.config.session_name();
    std::cout << (was_running ? theme::ok("Stopped " + name)
                              : theme::info("No running session " + name));
    if (opts.clean) std::cout << theme::ok("Removed worktrees and session context");
    return 0;
}

// ── sessions / status ───────────────────────────────────────

int CrewCLI::run_sessions(const HostOptions& opts) {
    auto config = load_config(opts);
    if (config.is_err()) {
        std::cout << theme::fail(config.error);
        return 1;
    }

    auto sessions = TmuxManager::list_sessions(runner_, config.value.session_prefix());
    if (sessions.is_err()) {
        std::cout << theme::fail(sessions.error);
        return 1;
    }
    if (sessions.value.empty()) {
        std::cout << theme::dim("    No running sessions.") << "\n";
        return 0;
    }

    std::cout << theme::section("Sessions");
    for (const auto& s : sessions.value) {
        std::cout << "    " << theme::blue(fmt::format("{:<16}", s.name))
                  << fmt::format("{:>2} agents  ", s.num_experts)
                  << theme::dim(s.created_at) << "  " << s.project_path << "\n";
    }
    std::cout << "\n";
    return 0;
}

int CrewCLI::run_status(const HostOptions& opts) {
    auto config = load_config(opts);
    if (config.is_err()) {
        std::cout << theme::fail(config.error);
        return 1;
    }
    auto session = open_session(config.value, opts.project_path, runner_);
    if (session.is_err()) {
        std::cout << theme::fail(session.error);
        return 1;
    }
    const Session& s = session.value;
    print_session(s);

    bool running = s.tmux->session_exists();
    std::cout << theme::kv("tmux", running ? theme::green("running") : theme::dim("stopped"));
    std::cout << theme::section("Agents");

    PaneWatcher watcher(s.tmux, s.config.timeouts().capture_interval_ms);
    std::vector<int> panes;
    for (const auto& info : s.config.expert_infos()) panes.push_back(info.id);
    if (running) {
        watcher.update_targets(panes);
        watcher.refresh_now();
    }
    StateDetector detector(s.config.status_dir(),
                           [&watcher](int pane) { return watcher.snapshot(pane); },
                           s.config.timeouts().stuck_after_secs);

    for (const auto& info : s.config.expert_infos()) {
        auto ctx = s.store->load(s.config.session_hash(), info.id);
        std::string role = info.role;
        std::string where = theme::dim("root");
        if (ctx.is_ok() && ctx.value) {
            if (!ctx.value->role().empty()) role = ctx.value->role();
            if (ctx.value->worktree_branch()) where = theme::brown(*ctx.value->worktree_branch());
        }
        std::cout << fmt::format("    {:>2}  {:<12} ", info.id, info.name)
                  << theme::status(detector.classify(info.id))
                  << fmt::format(" {:<10} ", role) << where << "\n";

        auto snap = watcher.snapshot(info.id);
        if (snap && snap->captured) {
            std::cout << theme::dim(fmt::format("          {} {:<9} {}",
                                                pane_activity_symbol(snap->activity),
                                                pane_activity_name(snap->activity),
                                                snap->last_activity)) << "\n";
        }
    }
    std::cout << "\n";
    return 0;
}

// ── reset ───────────────────────────────────────────────────

int CrewCLI::run_reset(const std::string& agent, const HostOptions& opts) {
    auto config = load_config(opts);
    if (config.is_err()) {
        std::cout << theme::fail(config.error);
        return 1;
    }
    auto session = attach_session(config.value, opts.project_path, runner_);
    if (session.is_err()) {
        std::cout << theme::fail(session.error);
        return 1;
    }
    const Session& s = session.value;
    auto info = s.config.resolve_expert(agent);
    if (!info) {
        std::cout << theme::fail(fmt::format("No agent '{}'", agent));
        return 1;
    }

    LaunchOptions launch;
    launch.fresh_context = true;
    std::cout << theme::step(launch_label(s.config, info->id, launch.placement, true) + "...");
    auto r = run_launch_sequence(s.config, s.launch_deps(), info->id, launch);
    if (r.is_err()) {
        std::cout << theme::fail(r.error);
        return 1;
    }
    std::cout << (r.value.ready ? theme::ok(r.value.summary()) : theme::warn(r.value.summary()));
    for (const auto& w : r.value.warnings) {
        std::cout << theme::dim("      " + w) << "\n";
    }
    return 0;
}

// ── Usage ───────────────────────────────────────────────────

void CrewCLI::print_usage() const {
    auto row = [](const std::string& cmd, const std::string& args, const std::string& what) {
        std::cout << theme::color::BLUE << "    crew " << fmt::format("{:<9}", cmd)
                  << theme::color::RESET << theme::color::BROWN << fmt::format("{:<22}", args)
                  << theme::color::RESET << theme::color::DIM << what
                  << theme::color::RESET << "\n";
    };

    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    row("start", "[path] [-n N] [-c cfg]", "Create the session and launch every agent");
    row("launch", "[path] [-n N] [-c cfg]", "Same, then stay in the control loop");
    row("tower", "[path] [-c cfg]", "Control loop for a running session");
    row("status", "[path]", "Agent status, worktrees and activity");
    row("reset", "<agent> [path]", "Forget an agent's conversation and relaunch it");
    row("sessions", "", "List running crew sessions");
    row("down", "[path] [--clean]", "Stop the session (--clean: remove worktrees)");
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    crew --version        Show version\n"
              << "    crew --help           Show this help"
              << theme::color::RESET << "\n\n";
}

void CrewCLI::print_version() const {
    std::cout << theme::color::BROWN << theme::color::BOLD << "crew"
              << theme::color::RESET << theme::color::DIM
              << " version " << CREW_VERSION << theme::color::RESET << "\n";
}

int CrewCLI::run_command(const std::string& command, const std::vector<std::string>& args) {
    if (command == "--version" || command == "-v") {
        print_version();
        return 0;
    }
    if (command == "--help" || command == "-h" || command == "help") {
        print_usage();
        return 0;
    }

    // reset takes the agent before the host flags
    std::vector<std::string> rest = args;
    std::string agent;
    if (command == "reset") {
        if (rest.empty()) {
            std::cout << theme::fail("Usage: crew reset <agent> [path] [-c cfg]");
            return 1;
        }
        agent = rest.front();
        rest.erase(rest.begin());
    }

    auto opts = parse_host_args(rest);
    if (opts.is_err()) {
        std::cout << theme::fail(opts.error);
        std::cout << theme::step("Run 'crew --help' for usage.");
        return 1;
    }

    if (command == "start")    return run_start(opts.value);
    if (command == "launch")   return run_launch(opts.value);
    if (command == "tower")    return run_tower(opts.value);
    if (command == "down")     return run_down(opts.value);
    if (command == "sessions") return run_sessions(opts.value);
    if (command == "status")   return run_status(opts.value);
    if (command == "reset")    return run_reset(agent, opts.value);

    std::cout << theme::fail("Unknown command: " + command);
    print_usage();
    return 1;
}
