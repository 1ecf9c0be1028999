#include <gtest/gtest.h>
#include <coordinator/launch_operation.hpp>
#include <session/session_bootstrap.hpp>
#include <managers/state_detector.hpp>
#include <core/constants.hpp>
#include <core/directory_structure.hpp>
#include "test_helpers.hpp"
#include <fstream>
#include <sstream>

static const char* READY_SCREEN = "-- bypass permissions on --\n\xe2\x9d\xaf \n";

// Runs the launch sequence against real git and a fake tmux.
class LaunchOperationTest : public ::testing::Test {
protected:
    TempGitRepo repo{"launch"};
    TempDir roles_dir{"launch_roles"};
    std::shared_ptr<FakeRunner> runner = std::make_shared<FakeRunner>();
    Session session;

    void SetUp() override {
        runner->pass_through("git");
        SessionConfig base;
        base.timeouts().exit_grace_ms = 0;
        base.timeouts().agent_ready_secs = 0;

        auto opened = open_session(base, repo.root(), runner);
        ASSERT_TRUE(opened.is_ok()) << opened.error;
        session = opened.value;
        session.agents = std::make_shared<AgentManager>(session.tmux, session.config.agent(), 10);
        session.instructions = std::make_shared<const RoleInstructions>(
            RoleInstructions({roles_dir.path()}));
    }

    Result<LaunchOutcome> launch(int id, Placement placement) {
        LaunchOptions opts;
        opts.placement = std::move(placement);
        return run_launch_sequence(session.config, session.launch_deps(), id, opts);
    }

    AgentContext context(int id) {
        auto loaded = session.store->load(session.config.session_hash(), id);
        EXPECT_TRUE(loaded.is_ok() && loaded.value.has_value());
        return loaded.is_ok() && loaded.value ? *loaded.value : AgentContext();
    }

    void save(AgentContext ctx) {
        ASSERT_TRUE(session.store->save(ctx).is_ok());
    }

    void role_file(const std::string& role, const std::string& text) {
        std::ofstream(roles_dir.path() / (role + ".md")) << text;
    }

    std::string marker(int id) {
        std::ifstream in(session.config.status_dir() / ("expert" + std::to_string(id)));
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }
};

TEST_F(LaunchOperationTest, WorktreeLaunchMovesAgentAndDropsResumeToken) {
    AgentContext ctx = context(3);
    ctx.set_resume_token("old-conversation");
    save(ctx);
    role_file("tester", "Write the tests first.");
    runner->set_screen(3, READY_SCREEN);

    auto r = launch(3, Placement::worktree("feature-x"));
    ASSERT_TRUE(r.is_ok()) << r.error;
    const LaunchOutcome& out = r.value;

    fs::path wt = session.config.worktrees_dir() / "feature-x";
    EXPECT_TRUE(fs::is_directory(wt));
    EXPECT_TRUE(fs::is_symlink(wt / ".crew"));
    EXPECT_TRUE(repo.branch_exists("feature-x"));

    EXPECT_TRUE(out.ready);
    EXPECT_TRUE(out.instruction_sent);
    EXPECT_TRUE(out.warnings.empty());
    EXPECT_EQ(out.working_dir, wt.string());
    EXPECT_EQ(out.branch.value_or(""), "feature-x");
    EXPECT_EQ(out.summary(), "tester launched in worktree 'feature-x'");

    AgentContext after = context(3);
    EXPECT_EQ(after.worktree_branch().value_or(""), "feature-x");
    EXPECT_EQ(after.worktree_path().value_or(""), wt.string());
    EXPECT_FALSE(after.resume_token().has_value());

    std::string typed = runner->typed(3);
    EXPECT_EQ(typed.find("/exit\n"), 0u);
    EXPECT_NE(typed.find("cd '" + wt.string() + "' && claude"), std::string::npos);
    EXPECT_EQ(typed.find("--resume"), std::string::npos);
    EXPECT_NE(typed.find("Write the tests first."), std::string::npos);
    EXPECT_EQ(marker(3), MARKER_PENDING);
}

TEST_F(LaunchOperationTest, WorktreeLaunchIgnoresOldSessionBanner) {
    AgentContext ctx = context(3);
    ctx.set_resume_token("old-conversation");
    save(ctx);
    runner->set_screen(3, std::string("Session: old-conversation\n") + READY_SCREEN);

    auto r = launch(3, Placement::worktree("feature-x"));
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_TRUE(r.value.ready);

    AgentContext after = context(3);
    EXPECT_EQ(after.worktree_branch().value_or(""), "feature-x");
    EXPECT_FALSE(after.resume_token().has_value());
}

TEST_F(LaunchOperationTest, ReturnToProjectRootIgnoresOldSessionBanner) {
    AgentContext ctx = context(1);
    ctx.set_worktree("feature-w", (repo.root() / "elsewhere").string());
    save(ctx);
    runner->set_screen(1, std::string("Session: from-the-worktree\n") + READY_SCREEN);

    ASSERT_TRUE(launch(1, Placement::project_root()).is_ok());
    EXPECT_FALSE(context(1).resume_token().has_value());
}

TEST_F(LaunchOperationTest, LaunchPassesStatusHookSettings) {
    ASSERT_TRUE(launch(2, Placement::keep()).is_ok());

    fs::path hooks = expert_hooks_path(session.config, 2);
    ASSERT_TRUE(fs::exists(hooks));
    EXPECT_NE(runner->typed(2).find("--settings '" + hooks.string() + "'"), std::string::npos);

    std::ifstream in(hooks);
    std::stringstream ss;
    ss << in.rdbuf();
    EXPECT_NE(ss.str().find(status_marker_path(session.config.status_dir(), 2).string()),
              std::string::npos);
}

TEST_F(LaunchOperationTest, EmptySettingsFlagSkipsHooks) {
    session.config.agent().settings_flag.clear();
    ASSERT_TRUE(launch(2, Placement::keep()).is_ok());
    EXPECT_FALSE(fs::exists(expert_hooks_path(session.config, 2)));
    EXPECT_EQ(runner->typed(2).find("--settings"), std::string::npos);
}

TEST_F(LaunchOperationTest, InstructionCarriesReportPathAndDecisions) {
    role_file("backend", "Own the API.");
    const std::string hash = session.config.session_hash();
    Decision everyone = make_decision(-1, "database", "use sqlite", "");
    Decision other = make_decision(0, "css", "tailwind", "");
    other.affects_experts = {1};
    ASSERT_TRUE(session.store->add_decision(hash, everyone).is_ok());
    ASSERT_TRUE(session.store->add_decision(hash, other).is_ok());
    runner->set_screen(2, READY_SCREEN);

    auto r = launch(2, Placement::keep());
    ASSERT_TRUE(r.is_ok()) << r.error;
    ASSERT_TRUE(r.value.instruction_sent);

    std::string typed = runner->typed(2);
    EXPECT_NE(typed.find("Own the API."), std::string::npos);
    EXPECT_NE(typed.find(expert_report_path(session.config, 2).string()), std::string::npos);
    EXPECT_NE(typed.find("- database: use sqlite"), std::string::npos);
    EXPECT_EQ(typed.find("tailwind"), std::string::npos);
}

TEST_F(LaunchOperationTest, FreshContextForgetsConversationAndReport) {
    AgentContext ctx = context(0);
    ctx.set_resume_token("tok-old");
    ctx.set_worktree("feature-r", (repo.root() / "elsewhere").string());
    save(ctx);
    Report report;
    report.task_id = "t-1";
    report.expert_id = 0;
    report.started_at = "2026-01-05T08:00:00";
    ASSERT_TRUE(session.reports->write(report).is_ok());
    runner->set_screen(0, READY_SCREEN);

    LaunchOptions opts;
    opts.fresh_context = true;
    auto r = run_launch_sequence(session.config, session.launch_deps(), 0, opts);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_FALSE(r.value.resumed);
    EXPECT_TRUE(r.value.warnings.empty());
    EXPECT_EQ(r.value.working_dir, session.config.project_path().string());

    AgentContext after = context(0);
    EXPECT_FALSE(after.resume_token().has_value());
    EXPECT_FALSE(after.in_worktree());
    EXPECT_EQ(runner->typed(0).find("--resume"), std::string::npos);
    EXPECT_FALSE(fs::exists(session.reports->report_file(0)));
}

TEST_F(LaunchOperationTest, ReadinessTimeoutIsNotAnError) {
    role_file("frontend", "Own the UI.");

    auto r = launch(1, Placement::keep());
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_FALSE(r.value.ready);
    EXPECT_FALSE(r.value.instruction_sent);
    EXPECT_EQ(r.value.summary(), "frontend launched but not ready yet");

    std::string typed = runner->typed(1);
    EXPECT_NE(typed.find("claude"), std::string::npos);
    EXPECT_EQ(typed.find("Own the UI."), std::string::npos);
    EXPECT_EQ(marker(1), MARKER_STARTING);
}

TEST_F(LaunchOperationTest, KeepResumesSavedConversation) {
    AgentContext ctx = context(0);
    ctx.set_resume_token("tok-1");
    save(ctx);
    runner->set_screen(0, std::string(READY_SCREEN) + "Session: tok-1\n");

    auto r = launch(0, Placement::keep());
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_TRUE(r.value.resumed);
    EXPECT_EQ(r.value.summary(), "architect ready (resumed)");
    EXPECT_EQ(r.value.working_dir, session.config.project_path().string());

    std::string typed = runner->typed(0);
    EXPECT_NE(typed.find("--resume 'tok-1'"), std::string::npos);
    // Pane was at a shell prompt, so nothing had to exit
    EXPECT_EQ(typed.find("/exit"), std::string::npos);
}

TEST_F(LaunchOperationTest, KeepStopsRunningAgentFirst) {
    runner->set_pane_command(0, "claude");
    ASSERT_TRUE(launch(0, Placement::keep()).is_ok());
    EXPECT_EQ(runner->typed(0).find("/exit\n"), 0u);
}

TEST_F(LaunchOperationTest, ReadyAgentTokenIsPersisted) {
    runner->set_screen(2, std::string(READY_SCREEN) + "Session: fresh-42\n");
    auto r = launch(2, Placement::keep());
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_FALSE(r.value.resumed);
    EXPECT_EQ(context(2).resume_token().value_or(""), "fresh-42");
}

TEST_F(LaunchOperationTest, ReturnToProjectRootLeavesCheckoutOnDisk) {
    runner->set_screen(2, READY_SCREEN);
    ASSERT_TRUE(launch(2, Placement::worktree("feature-y")).is_ok());
    fs::path wt = session.config.worktrees_dir() / "feature-y";

    auto r = launch(2, Placement::project_root());
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.summary(), "backend returned to the project root");
    EXPECT_EQ(r.value.working_dir, session.config.project_path().string());
    EXPECT_FALSE(r.value.branch.has_value());
    EXPECT_FALSE(context(2).in_worktree());
    EXPECT_TRUE(fs::is_directory(wt));
}

TEST_F(LaunchOperationTest, KeepFollowsRecordedWorktree) {
    runner->set_screen(1, READY_SCREEN);
    ASSERT_TRUE(launch(1, Placement::worktree("feature-z")).is_ok());

    auto r = launch(1, Placement::keep());
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.working_dir, (session.config.worktrees_dir() / "feature-z").string());
    EXPECT_EQ(r.value.branch.value_or(""), "feature-z");
}

TEST_F(LaunchOperationTest, VanishedWorktreeFallsBackToProjectRoot) {
    AgentContext ctx = context(0);
    ctx.set_worktree("gone", (repo.root() / "no-such-dir").string());
    save(ctx);

    auto r = launch(0, Placement::keep());
    ASSERT_TRUE(r.is_ok()) << r.error;
    ASSERT_EQ(r.value.warnings.size(), 1u);
    EXPECT_NE(r.value.warnings[0].find("is gone"), std::string::npos);
    EXPECT_EQ(r.value.working_dir, session.config.project_path().string());
    EXPECT_FALSE(context(0).in_worktree());
}

TEST_F(LaunchOperationTest, StaleWorktreeAbortsBeforeLaunch) {
    fs::path ghost = session.config.worktrees_dir() / "ghost";
    fs::create_directories(ghost);
    std::ofstream(ghost / "leftover") << "x";

    auto r = launch(1, Placement::worktree("ghost"));
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::StaleResourceState);
    EXPECT_FALSE(context(1).in_worktree());
    EXPECT_EQ(runner->typed(1).find("claude"), std::string::npos);
}

TEST_F(LaunchOperationTest, RoleTableOverridesConfiguredRole) {
    auto roles = session.store->load_roles(session.config.session_hash());
    ASSERT_TRUE(roles.is_ok() && roles.value);
    SessionRoles table = *roles.value;
    table.set_role(0, "reviewer");
    ASSERT_TRUE(session.store->save_roles(table).is_ok());
    role_file("reviewer", "Review every diff.");
    role_file("architect", "Design the system.");
    runner->set_screen(0, READY_SCREEN);

    auto r = launch(0, Placement::keep());
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_TRUE(r.value.instruction_sent);
    EXPECT_NE(runner->typed(0).find("Review every diff."), std::string::npos);
    EXPECT_EQ(context(0).role(), "reviewer");
}

TEST_F(LaunchOperationTest, TmuxFailureBecomesWarning) {
    runner->fail_subcommand("send-keys", "can't find pane: 2");
    auto r = launch(2, Placement::keep());
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_FALSE(r.value.ready);
    ASSERT_FALSE(r.value.warnings.empty());
    EXPECT_NE(r.value.warnings.back().find("Launch failed"), std::string::npos);
}

TEST_F(LaunchOperationTest, UnknownAgentIsInvalidInput) {
    auto r = launch(42, Placement::keep());
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::InvalidInput);
}

TEST_F(LaunchOperationTest, OperationLogWritten) {
    ASSERT_TRUE(launch(1, Placement::keep()).is_ok());
    EXPECT_TRUE(fs::exists(expert_log_path(session.config, 1)));
}

TEST(LaunchLabelTest, NamesThePlacement) {
    SessionConfig cfg;
    EXPECT_EQ(launch_label(cfg, 0, Placement::keep()), "Launch of architect");
    EXPECT_EQ(launch_label(cfg, 1, Placement::worktree("x")), "Worktree launch of frontend");
    EXPECT_EQ(launch_label(cfg, 2, Placement::project_root()), "Return of backend");
    EXPECT_EQ(launch_label(cfg, 3, Placement::keep(), true), "Reset of tester");
}

TEST(ComposeInstructionTest, AppendsReportPathAndRecentDecisions) {
    std::vector<Decision> decisions;
    for (int i = 0; i < MAX_INSTRUCTION_DECISIONS + 2; ++i) {
        decisions.push_back(make_decision(0, "topic" + std::to_string(i), "choice", ""));
    }
    std::string text = compose_instruction("Review every diff.\n\n", "/p/expert3_report.yaml",
                                           decisions);

    EXPECT_EQ(text.rfind("Review every diff.\n\nWhen you finish a task", 0), 0u);
    EXPECT_NE(text.find("/p/expert3_report.yaml"), std::string::npos);
    EXPECT_EQ(text.find("- topic1: choice"), std::string::npos);
    EXPECT_NE(text.find("- topic2: choice"), std::string::npos);
    EXPECT_NE(text.find("- topic11: choice"), std::string::npos);
}

TEST(ComposeInstructionTest, NoDecisionsNoDecisionSection) {
    std::string text = compose_instruction("Own the UI.", "/p/r.yaml", {});
    EXPECT_EQ(text.find("Team decisions"), std::string::npos);
}
