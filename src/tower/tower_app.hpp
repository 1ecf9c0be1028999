#pragma once

#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <core/types.hpp>
#include <coordinator/background_coordinator.hpp>
#include <coordinator/launch_operation.hpp>
#include <coordinator/task_assignment.hpp>
#include <managers/pane_watcher.hpp>
#include <managers/state_detector.hpp>
#include <session/session_bootstrap.hpp>
#include "tower_view.hpp"

enum class TowerState {
    Bootstrapping,
    Running,
    Terminated,
};

struct TowerOptions {
    bool watch_panes = true;    // false: no PaneWatcher thread, detector sees no panes
};

// The foreground control loop. Owns the coordinator and is the only thing
// that reads input or draws. Every slow step runs inside a guarded operation.
class TowerApp {
public:
    using Bootstrapper = std::function<Result<Session>()>;
    using CommandHandler = std::function<void(TowerApp&, const std::string&)>;

    TowerApp(std::unique_ptr<InputSource> input, std::unique_ptr<Renderer> renderer,
             TowerOptions options = {});
    ~TowerApp();

    TowerApp(const TowerApp&) = delete;
    TowerApp& operator=(const TowerApp&) = delete;

    // Bootstrapping -> Running. On failure the state is Terminated.
    Result<void> bootstrap(const Bootstrapper& bootstrapper);

    // One pass: input, dispatch, poll, classify, render. False once terminated.
    bool tick();

    // tick() until terminated
    void run();

    // Leaves in-flight operations running on their own
    void terminate();

    // Launches and task assignments share one guard per agent
    Result<void> start_guarded_launch(int agent_id, const LaunchOptions& options);
    Result<void> start_guarded_task(int agent_id, const std::string& task);

    // Poll every guarded agent and turn finished operations into messages
    void poll_operations();

    void execute_command(const std::string& line);

    TowerState state() const { return state_; }
    const Session& session() const { return session_; }
    const std::deque<std::string>& messages() const { return messages_; }
    bool in_progress(int agent_id) const { return busy_label(agent_id).has_value(); }
    AgentStatus classify(int agent_id) const;
    TowerView view() const;

private:
    void register_commands();
    void add_command(const std::string& name, CommandHandler handler, const std::string& help);
    void notice(const std::string& msg);
    void report_start(const Result<void>& started, const std::string& ok_msg);
    std::optional<std::string> busy_label(int agent_id) const;

    // Parses "<id|name>" and reports bad ids as a notice
    std::optional<ExpertInfo> agent_arg(const std::string& arg);

    void cmd_launch(const std::string& args);
    void cmd_worktree(const std::string& args);
    void cmd_return(const std::string& args);
    void cmd_reset(const std::string& args);
    void cmd_role(const std::string& args);
    void cmd_assign(const std::string& args);
    void cmd_decide(const std::string& args);
    void cmd_decisions(const std::string& args);
    void cmd_reports(const std::string& args);
    void cmd_report(const std::string& args);
    void cmd_status(const std::string& args);
    void cmd_help(const std::string& args);

    void reload_context(int agent_id);

    std::unique_ptr<InputSource> input_;
    std::unique_ptr<Renderer> renderer_;
    TowerOptions options_;
    TowerState state_ = TowerState::Bootstrapping;

    Session session_;
    std::unique_ptr<PaneWatcher> watcher_;
    std::unique_ptr<StateDetector> detector_;
    BackgroundCoordinator<int, LaunchOutcome> coordinator_;
    BackgroundCoordinator<int, std::string> tasks_;

    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;
    std::vector<std::string> command_order_;
    std::deque<std::string> messages_;
    std::map<int, AgentContext> contexts_;     // cached, reloaded after operations
    std::optional<TowerView> last_rendered_;
};
