#pragma once

#include <string>
#include <vector>
#include <chrono>

// What the agent's screen suggests it is doing.
enum class PaneActivity {
    Idle,
    Thinking,
    Executing,
    Error,
    Unknown,
};

const char* pane_activity_name(PaneActivity a);
const char* pane_activity_symbol(PaneActivity a);

struct PaneSnapshot {
    int pane = 0;
    bool captured = false;          // false if tmux could not be read
    std::string command;            // pane foreground command
    std::vector<std::string> lines;
    PaneActivity activity = PaneActivity::Unknown;
    std::string last_activity;
    std::chrono::steady_clock::time_point captured_at;
    std::chrono::steady_clock::time_point changed_at;  // last time the text differed
};

// Priority: Error, Executing, Thinking, Idle, Unknown.
PaneActivity analyze_activity(const std::vector<std::string>& lines);

// Last non-empty line, trimmed, cut to 60 characters.
std::string last_activity(const std::vector<std::string>& lines);

// Build a snapshot from raw capture-pane output.
PaneSnapshot make_snapshot(int pane, const std::string& screen, const std::string& command);
