#include <gtest/gtest.h>
#include <tower/tower_app.hpp>
#include <platform/platform.hpp>
#include "test_helpers.hpp"
#include <algorithm>
#include <chrono>
#include <deque>

// Feeds scripted lines, then ticks forever.
class ScriptedInput : public InputSource {
public:
    explicit ScriptedInput(std::deque<InputEvent> events) : events_(std::move(events)) {}

    InputEvent next(int) override {
        if (events_.empty()) return {};
        InputEvent ev = events_.front();
        events_.pop_front();
        return ev;
    }

private:
    std::deque<InputEvent> events_;
};

struct RenderLog {
    std::vector<TowerView> frames;
};

class RecordingRenderer : public Renderer {
public:
    explicit RecordingRenderer(std::shared_ptr<RenderLog> log) : log_(std::move(log)) {}
    void render(const TowerView& view) override { log_->frames.push_back(view); }

private:
    std::shared_ptr<RenderLog> log_;
};

static InputEvent line(const std::string& text) {
    return {InputEvent::Kind::Line, text};
}

class TowerAppTest : public ::testing::Test {
protected:
    TempGitRepo repo{"tower"};
    TempDir roles_dir{"tower_roles"};
    std::shared_ptr<FakeRunner> runner = std::make_shared<FakeRunner>();
    std::shared_ptr<RenderLog> frames = std::make_shared<RenderLog>();
    int ready_secs = 0;

    void SetUp() override { runner->pass_through("git"); }

    TowerApp::Bootstrapper bootstrapper() {
        return [this]() -> Result<Session> {
            SessionConfig base;
            base.timeouts().exit_grace_ms = 0;
            base.timeouts().agent_ready_secs = ready_secs;
            base.timeouts().tick_ms = 1;
            auto s = bootstrap_session(base, repo.root(), runner);
            if (s.is_err()) return s;
            s.value.agents = std::make_shared<AgentManager>(s.value.tmux,
                                                            s.value.config.agent(), 10);
            s.value.instructions = std::make_shared<const RoleInstructions>(
                RoleInstructions({roles_dir.path()}));
            return s;
        };
    }

    std::unique_ptr<TowerApp> make_app(std::deque<InputEvent> script = {}) {
        TowerOptions opts;
        opts.watch_panes = false;
        return std::make_unique<TowerApp>(std::make_unique<ScriptedInput>(std::move(script)),
                                          std::make_unique<RecordingRenderer>(frames), opts);
    }

    // Ticks until the agent's operation has been reported
    static bool drain(TowerApp& app, int agent_id, int timeout_ms = 10000) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        while (app.in_progress(agent_id)) {
            if (std::chrono::steady_clock::now() > deadline) return false;
            app.tick();
            platform::sleep_ms(10);
        }
        return true;
    }

    static bool has_message(const TowerApp& app, const std::string& text) {
        const auto& m = app.messages();
        return std::find(m.begin(), m.end(), text) != m.end();
    }

    static std::string last_message(const TowerApp& app) {
        return app.messages().empty() ? "" : app.messages().back();
    }
};

TEST_F(TowerAppTest, BootstrapCreatesSessionAndRuns) {
    auto app = make_app();
    auto r = app->bootstrap(bootstrapper());
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(app->state(), TowerState::Running);
    EXPECT_TRUE(app->session().created_tmux_session);
    EXPECT_EQ(runner->tmux_calls("new-session").size(), 1u);
    EXPECT_EQ(runner->tmux_calls("split-window").size(), 3u);
    EXPECT_EQ(runner->tmux_calls("set-environment").size(), 3u);

    EXPECT_TRUE(app->tick());
    ASSERT_EQ(frames->frames.size(), 1u);
    const TowerView& v = frames->frames[0];
    EXPECT_EQ(v.session_name, app->session().config.session_name());
    ASSERT_EQ(v.agents.size(), 4u);
    EXPECT_EQ(v.agents[2].name, "backend");
    EXPECT_EQ(v.agents[2].status, AgentStatus::Pending);
}

TEST_F(TowerAppTest, UnchangedViewIsNotRedrawn) {
    auto app = make_app();
    ASSERT_TRUE(app->bootstrap(bootstrapper()).is_ok());
    app->tick();
    app->tick();
    app->tick();
    EXPECT_EQ(frames->frames.size(), 1u);
}

TEST_F(TowerAppTest, BootstrapFailureTerminates) {
    auto app = make_app();
    auto r = app->bootstrap([]() {
        return Result<Session>::Err("tmux: command not found", ErrorKind::Infrastructure);
    });
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Infrastructure);
    EXPECT_EQ(app->state(), TowerState::Terminated);
    EXPECT_FALSE(app->tick());
    EXPECT_TRUE(frames->frames.empty());
}

TEST_F(TowerAppTest, ExistingSessionWithOtherAgentCountRejected) {
    runner->set_session_exists(true);
    runner->run("tmux", {"set-environment", "-t", "x", ENV_NUM_EXPERTS, "2"});

    auto app = make_app();
    auto r = app->bootstrap(bootstrapper());
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("crew down"), std::string::npos);
    EXPECT_EQ(app->state(), TowerState::Terminated);
}

TEST_F(TowerAppTest, LaunchReportsOutcome) {
    runner->set_screen(1, "bypass permissions on");
    auto app = make_app({line("launch frontend")});
    ASSERT_TRUE(app->bootstrap(bootstrapper()).is_ok());

    app->tick();
    EXPECT_TRUE(has_message(*app, "Launching frontend..."));
    ASSERT_TRUE(drain(*app, 1));
    EXPECT_EQ(last_message(*app), "frontend ready");
}

TEST_F(TowerAppTest, SecondStartForSameAgentIsRejected) {
    ready_secs = 2;
    auto app = make_app();
    ASSERT_TRUE(app->bootstrap(bootstrapper()).is_ok());

    app->execute_command("launch 1");
    ASSERT_TRUE(app->in_progress(1));
    app->execute_command("worktree 1 new feature");
    EXPECT_EQ(last_message(*app), "! Launch of frontend already in progress");

    // Other agents are independent
    app->execute_command("launch 2");
    EXPECT_TRUE(app->in_progress(2));

    app->tick();
    EXPECT_EQ(frames->frames.back().agents[1].operation.value_or(""), "Launch of frontend");

    ASSERT_TRUE(drain(*app, 1));
    ASSERT_TRUE(drain(*app, 2));
    EXPECT_TRUE(has_message(*app, "frontend launched but not ready yet"));
    EXPECT_FALSE(app->in_progress(1));
}

TEST_F(TowerAppTest, WorktreeCommandSanitizesFeatureName) {
    runner->set_screen(3, "bypass permissions on");
    auto app = make_app();
    ASSERT_TRUE(app->bootstrap(bootstrapper()).is_ok());

    app->execute_command("worktree tester Feature X");
    EXPECT_EQ(last_message(*app), "Moving tester to worktree 'feature-x'...");
    ASSERT_TRUE(drain(*app, 3));
    EXPECT_EQ(last_message(*app), "tester launched in worktree 'feature-x'");

    app->tick();
    EXPECT_EQ(frames->frames.back().agents[3].branch.value_or(""), "feature-x");
}

TEST_F(TowerAppTest, FailedOperationIsReported) {
    auto app = make_app();
    ASSERT_TRUE(app->bootstrap(bootstrapper()).is_ok());
    fs::path ghost = app->session().config.worktrees_dir() / "ghost";
    fs::create_directories(ghost / "src");

    app->execute_command("worktree 0 ghost");
    ASSERT_TRUE(drain(*app, 0));
    EXPECT_EQ(last_message(*app).rfind("Worktree launch of architect failed: ", 0), 0u);
}

TEST_F(TowerAppTest, RoleCommandUpdatesTableAndContext) {
    auto app = make_app();
    ASSERT_TRUE(app->bootstrap(bootstrapper()).is_ok());

    app->execute_command("role backend reviewer");
    EXPECT_EQ(last_message(*app), "backend is now 'reviewer' (applies on next launch)");

    const Session& s = app->session();
    auto roles = s.store->load_roles(s.config.session_hash());
    ASSERT_TRUE(roles.is_ok() && roles.value);
    EXPECT_EQ(roles.value->get_role(2).value_or(""), "reviewer");
    EXPECT_EQ(app->view().agents[2].role, "reviewer");
}

TEST_F(TowerAppTest, RoleChangeWaitsForOperation) {
    ready_secs = 1;
    auto app = make_app();
    ASSERT_TRUE(app->bootstrap(bootstrapper()).is_ok());

    app->execute_command("launch 2");
    app->execute_command("role 2 reviewer");
    EXPECT_EQ(last_message(*app), "! Launch of backend already in progress");
    ASSERT_TRUE(drain(*app, 2));
}

TEST_F(TowerAppTest, BadInputBecomesNotices) {
    auto app = make_app();
    ASSERT_TRUE(app->bootstrap(bootstrapper()).is_ok());

    app->execute_command("dance");
    EXPECT_EQ(last_message(*app), "Unknown command: dance (type 'help')");
    app->execute_command("launch");
    EXPECT_EQ(last_message(*app), "Missing agent id");
    app->execute_command("launch zed");
    EXPECT_EQ(last_message(*app), "No agent 'zed'");
    app->execute_command("worktree 1 !!!");
    EXPECT_EQ(last_message(*app), "Usage: worktree <agent> <feature name>");
    app->execute_command("role 1");
    EXPECT_EQ(last_message(*app), "Usage: role <agent> <role>");
    app->execute_command("   ");
    EXPECT_EQ(last_message(*app), "Usage: role <agent> <role>");
    EXPECT_EQ(app->state(), TowerState::Running);
}

TEST_F(TowerAppTest, StatusListsEveryAgent) {
    auto app = make_app();
    ASSERT_TRUE(app->bootstrap(bootstrapper()).is_ok());

    app->execute_command("status");
    ASSERT_EQ(app->messages().size(), 4u);
    EXPECT_EQ(app->messages()[0], "0 architect: pending in project root");
    EXPECT_EQ(app->messages()[3], "3 tester: pending in project root");
}

TEST_F(TowerAppTest, MessageHistoryIsBounded) {
    auto app = make_app();
    ASSERT_TRUE(app->bootstrap(bootstrapper()).is_ok());
    for (int i = 0; i < 20; ++i) app->execute_command("nope" + std::to_string(i));
    EXPECT_EQ(app->messages().size(), static_cast<size_t>(STATUS_HISTORY_LIMIT));
    EXPECT_EQ(last_message(*app), "Unknown command: nope19 (type 'help')");
}

TEST_F(TowerAppTest, QuitTerminates) {
    auto app = make_app({line("help"), line("q")});
    ASSERT_TRUE(app->bootstrap(bootstrapper()).is_ok());
    EXPECT_TRUE(app->tick());
    EXPECT_FALSE(app->tick());
    EXPECT_EQ(app->state(), TowerState::Terminated);
    // Leaving does not tear the session down
    EXPECT_TRUE(runner->tmux_calls("kill-session").empty());
}

TEST_F(TowerAppTest, EndOfInputTerminates) {
    auto app = make_app({InputEvent{InputEvent::Kind::Eof, ""}});
    ASSERT_TRUE(app->bootstrap(bootstrapper()).is_ok());
    app->run();
    EXPECT_EQ(app->state(), TowerState::Terminated);
}

TEST_F(TowerAppTest, TerminateWithOperationInFlight) {
    ready_secs = 1;
    {
        auto app = make_app();
        ASSERT_TRUE(app->bootstrap(bootstrapper()).is_ok());
        ASSERT_TRUE(app->start_guarded_launch(1, LaunchOptions{}).is_ok());
        ASSERT_TRUE(app->in_progress(1));

        app->terminate();
        EXPECT_EQ(app->state(), TowerState::Terminated);
        EXPECT_FALSE(app->tick());
        EXPECT_TRUE(app->start_guarded_launch(2, LaunchOptions{}).is_err());
    }

    // The abandoned operation keeps going after the loop is gone
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (runner->typed(1).find("claude") == std::string::npos &&
           std::chrono::steady_clock::now() < deadline) {
        platform::sleep_ms(20);
    }
    EXPECT_NE(runner->typed(1).find("claude"), std::string::npos);
    // Let it finish its readiness wait before the scratch repo goes away
    platform::sleep_ms(1500);
}

TEST_F(TowerAppTest, AssignSendsTaskInBackground) {
    auto app = make_app();
    ASSERT_TRUE(app->bootstrap(bootstrapper()).is_ok());

    app->execute_command("assign frontend Build the login page");
    EXPECT_EQ(last_message(*app), "Sending task to frontend...");
    ASSERT_TRUE(drain(*app, 1));
    EXPECT_EQ(last_message(*app), "Task sent to frontend");
    EXPECT_EQ(runner->typed(1), "Build the login page\n");

    app->execute_command("assign frontend");
    EXPECT_EQ(last_message(*app), "Usage: assign <agent> <task>");
}

TEST_F(TowerAppTest, TaskWaitsForLaunchOfSameAgent) {
    ready_secs = 1;
    auto app = make_app();
    ASSERT_TRUE(app->bootstrap(bootstrapper()).is_ok());

    app->execute_command("launch 2");
    app->execute_command("assign 2 Add the orders endpoint");
    EXPECT_EQ(last_message(*app), "! Launch of backend already in progress");
    ASSERT_TRUE(drain(*app, 2));
    EXPECT_EQ(runner->typed(2).find("orders endpoint"), std::string::npos);
}

TEST_F(TowerAppTest, DecisionsAreRecordedAndListed) {
    auto app = make_app();
    ASSERT_TRUE(app->bootstrap(bootstrapper()).is_ok());

    app->execute_command("decisions");
    EXPECT_EQ(last_message(*app), "No decisions yet");

    app->execute_command("decide database: use sqlite");
    EXPECT_EQ(last_message(*app),
              "Recorded database: use sqlite (sent with the next role instruction)");
    app->execute_command("decide no colon here");
    EXPECT_EQ(last_message(*app), "Usage: decide <topic>: <decision>");

    app->execute_command("decisions DATA");
    EXPECT_NE(last_message(*app).find("[tower] database: use sqlite"), std::string::npos);
    app->execute_command("decisions styling");
    EXPECT_EQ(last_message(*app), "No decisions about 'styling'");

    const Session& s = app->session();
    auto shared = s.store->load_shared(s.config.session_hash());
    ASSERT_TRUE(shared.is_ok());
    ASSERT_EQ(shared.value.decisions.size(), 1u);
    EXPECT_TRUE(shared.value.decisions[0].affects_experts.empty());
}

TEST_F(TowerAppTest, ReportsAreListedAndShown) {
    auto app = make_app();
    ASSERT_TRUE(app->bootstrap(bootstrapper()).is_ok());

    app->execute_command("reports");
    EXPECT_EQ(last_message(*app), "No reports yet");

    Report r;
    r.task_id = "t-7";
    r.expert_id = 2;
    r.expert_name = "backend";
    r.status = ReportStatus::Done;
    r.started_at = "2026-01-05T08:00:00";
    r.completed_at = "2026-01-05T09:00:00";
    r.summary = "Added the orders endpoint";
    r.findings.push_back({"Missing index", "high", std::string("db.sql"), 12});
    ASSERT_TRUE(app->session().reports->write(r).is_ok());

    app->execute_command("reports");
    EXPECT_EQ(last_message(*app), "backend: done Added the orders endpoint");

    app->execute_command("report backend");
    EXPECT_TRUE(has_message(*app, "backend task t-7: done"));
    EXPECT_EQ(last_message(*app), "- [high] Missing index (db.sql:12)");

    app->execute_command("report 1");
    EXPECT_EQ(last_message(*app), "frontend has not reported");
}

TEST_F(TowerAppTest, ResetStartsFromScratch) {
    runner->set_screen(0, "bypass permissions on");
    auto app = make_app();
    ASSERT_TRUE(app->bootstrap(bootstrapper()).is_ok());
    const Session& s = app->session();
    const std::string hash = s.config.session_hash();

    AgentContext ctx(hash, 0, "architect", "architect");
    ctx.set_resume_token("tok-old");
    ASSERT_TRUE(s.store->save(ctx).is_ok());
    Report r;
    r.task_id = "t-1";
    r.expert_id = 0;
    r.started_at = "2026-01-05T08:00:00";
    ASSERT_TRUE(s.reports->write(r).is_ok());

    app->execute_command("reset architect");
    EXPECT_EQ(last_message(*app), "Resetting architect...");
    ASSERT_TRUE(drain(*app, 0));
    EXPECT_EQ(last_message(*app), "architect ready");

    auto loaded = s.store->load(hash, 0);
    ASSERT_TRUE(loaded.is_ok() && loaded.value);
    EXPECT_FALSE(loaded.value->resume_token().has_value());
    EXPECT_FALSE(fs::exists(s.reports->report_file(0)));
    EXPECT_EQ(runner->typed(0).find("--resume"), std::string::npos);
}
