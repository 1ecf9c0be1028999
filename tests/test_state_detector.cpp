#include <gtest/gtest.h>
#include <managers/state_detector.hpp>
#include <core/constants.hpp>
#include "test_helpers.hpp"
#include <fstream>
#include <map>

class StateDetectorTest : public ::testing::Test {
protected:
    TempDir dir{"state_detector"};
    std::map<int, PaneSnapshot> panes;

    StateDetector detector(int stuck_after_secs = 600) {
        return StateDetector(dir.path(), [this](int id) -> std::optional<PaneSnapshot> {
            auto it = panes.find(id);
            if (it == panes.end()) return std::nullopt;
            return it->second;
        }, stuck_after_secs);
    }

    void pane(int id, const std::string& command, const std::string& screen) {
        panes[id] = make_snapshot(id, screen, command);
    }

    void marker(int id, const std::string& content) {
        ASSERT_TRUE(write_status_marker(dir.path(), id, content).is_ok());
    }
};

TEST_F(StateDetectorTest, NothingKnownIsPending) {
    EXPECT_EQ(detector().classify(0), AgentStatus::Pending);
}

TEST_F(StateDetectorTest, ShellWithoutMarkerIsPending) {
    pane(0, "bash", "user@host:~$ ");
    EXPECT_EQ(detector().classify(0), AgentStatus::Pending);
}

TEST_F(StateDetectorTest, StartingMarkerWhileAgentLoads) {
    marker(1, MARKER_STARTING);
    pane(1, "claude", "loading...");
    EXPECT_EQ(detector().classify(1), AgentStatus::Starting);
    panes.clear();
    EXPECT_EQ(detector().classify(1), AgentStatus::Starting);
}

TEST_F(StateDetectorTest, LeftoverStartingMarkerOverShellIsPending) {
    marker(1, MARKER_STARTING);
    pane(1, "bash", "user@host:~$ ");
    EXPECT_EQ(detector().classify(1), AgentStatus::Pending);
}

TEST_F(StateDetectorTest, LeftoverStartingMarkerFollowsAgentActivity) {
    marker(1, MARKER_STARTING);
    pane(1, "claude", "-- bypass permissions on --\n\xe2\x9d\xaf \n");
    EXPECT_EQ(detector().classify(1), AgentStatus::Ready);
    pane(1, "claude", "\xe2\x8f\xba Reading src/main.cpp\n");
    EXPECT_EQ(detector().classify(1), AgentStatus::Busy);
}

TEST_F(StateDetectorTest, PendingMarkerWithIdleAgentIsReady) {
    marker(2, MARKER_PENDING);
    pane(2, "claude", "Welcome\n\xe2\x9d\xaf \n");
    EXPECT_EQ(detector().classify(2), AgentStatus::Ready);
}

TEST_F(StateDetectorTest, PendingMarkerWithThinkingAgentIsBusy) {
    marker(2, MARKER_PENDING);
    pane(2, "node", "\xe2\x9c\xbb Cogitating... (12s)\n");
    EXPECT_EQ(detector().classify(2), AgentStatus::Busy);
}

TEST_F(StateDetectorTest, PendingMarkerOverShellMeansAgentExited) {
    marker(2, MARKER_PENDING);
    pane(2, "zsh", "% ");
    EXPECT_EQ(detector().classify(2), AgentStatus::Pending);
}

TEST_F(StateDetectorTest, ProcessingMarkerIsBusy) {
    marker(3, MARKER_PROCESSING);
    pane(3, "claude", "\xe2\x8f\xba Reading src/main.cpp\n");
    EXPECT_EQ(detector().classify(3), AgentStatus::Busy);
}

TEST_F(StateDetectorTest, ProcessingMarkerWithoutPaneIsBusy) {
    marker(3, MARKER_PROCESSING);
    EXPECT_EQ(detector().classify(3), AgentStatus::Busy);
}

TEST_F(StateDetectorTest, ProcessingOverShellIsUnknown) {
    marker(3, MARKER_PROCESSING);
    pane(3, "-bash", "$ ");
    EXPECT_EQ(detector().classify(3), AgentStatus::Unknown);
}

TEST_F(StateDetectorTest, OldProcessingMarkerWithQuietPaneIsStuck) {
    marker(0, MARKER_PROCESSING);
    auto past = fs::file_time_type::clock::now() - std::chrono::hours(1);
    fs::last_write_time(dir.path() / "expert0", past);

    pane(0, "claude", "\xe2\x8f\xba Running tests\n");
    panes[0].changed_at = std::chrono::steady_clock::now() - std::chrono::hours(1);
    EXPECT_EQ(detector(60).classify(0), AgentStatus::Stuck);

    // Fresh pane output means it is still working
    panes[0].changed_at = std::chrono::steady_clock::now();
    EXPECT_EQ(detector(60).classify(0), AgentStatus::Busy);
}

TEST_F(StateDetectorTest, GarbageMarkerIsUnknown) {
    marker(0, "??");
    EXPECT_EQ(detector().classify(0), AgentStatus::Unknown);
}

TEST_F(StateDetectorTest, NoMarkerFallsBackToPaneActivity) {
    pane(0, "claude", "\xe2\x9d\xaf ");
    pane(1, "claude", "\xe2\x8f\xba Writing file\n");
    pane(2, "claude", "loading...");
    pane(3, "claude", "Error: rate limited");
    auto d = detector();
    EXPECT_EQ(d.classify(0), AgentStatus::Ready);
    EXPECT_EQ(d.classify(1), AgentStatus::Busy);
    EXPECT_EQ(d.classify(2), AgentStatus::Starting);
    EXPECT_EQ(d.classify(3), AgentStatus::Unknown);
}

TEST_F(StateDetectorTest, ClearMarker) {
    marker(1, MARKER_PENDING);
    ASSERT_TRUE(clear_status_marker(dir.path(), 1).is_ok());
    EXPECT_FALSE(fs::exists(dir.path() / "expert1"));
    // Clearing twice is fine
    EXPECT_TRUE(clear_status_marker(dir.path(), 1).is_ok());
}

TEST(ShellCommandTest, RecognizesShells) {
    EXPECT_TRUE(is_shell_command("bash"));
    EXPECT_TRUE(is_shell_command("-zsh"));
    EXPECT_TRUE(is_shell_command(""));
    EXPECT_FALSE(is_shell_command("claude"));
    EXPECT_FALSE(is_shell_command("node"));
}
