#include "pane_capture.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <algorithm>

const char* pane_activity_name(PaneActivity a) {
    switch (a) {
        case PaneActivity::Idle:      return "idle";
        case PaneActivity::Thinking:  return "thinking";
        case PaneActivity::Executing: return "executing";
        case PaneActivity::Error:     return "error";
        case PaneActivity::Unknown:   return "unknown";
    }
    return "unknown";
}

const char* pane_activity_symbol(PaneActivity a) {
    switch (a) {
        case PaneActivity::Idle:      return "\xe2\x97\x8b";  // ○
        case PaneActivity::Thinking:  return "\xe2\x97\x90";  // ◐
        case PaneActivity::Executing: return "\xe2\x97\x8f";  // ●
        case PaneActivity::Error:     return "\xe2\x9c\x97";  // ✗
        case PaneActivity::Unknown:   return "?";
    }
    return "?";
}

static bool contains_any(const std::string& line, const std::vector<std::string>& needles) {
    for (const auto& n : needles) {
        if (line.find(n) != std::string::npos) return true;
    }
    return false;
}

static bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

// Check the last `window` lines with pred
template <typename Pred>
static bool any_recent(const std::vector<std::string>& lines, int window, Pred pred) {
    int seen = 0;
    for (auto it = lines.rbegin(); it != lines.rend() && seen < window; ++it, ++seen) {
        if (pred(*it)) return true;
    }
    return false;
}

PaneActivity analyze_activity(const std::vector<std::string>& lines) {
    static const std::vector<std::string> error_words = {"Error:", "error:", "FAILED", "panic"};
    static const std::vector<std::string> exec_words = {
        "Running", "Reading", "Writing", "Executing", "Searching"};
    static const std::vector<std::string> spinners = {
        "\xe2\x9c\xbb", "\xe2\x9c\xb3",                                 // ✻ ✳
        "\xe2\xa0\x8b", "\xe2\xa0\x99", "\xe2\xa0\xb9", "\xe2\xa0\xb8",  // ⠋ ⠙ ⠹ ⠸
        "\xe2\xa0\xbc", "\xe2\xa0\xb4", "\xe2\xa0\xa6", "\xe2\xa0\xa7",  // ⠼ ⠴ ⠦ ⠧
        "\xe2\xa0\x87", "\xe2\xa0\x8f",                                 // ⠇ ⠏
        "\xe2\x97\x90", "\xe2\x97\x93", "\xe2\x97\x91", "\xe2\x97\x92",  // ◐ ◓ ◑ ◒
    };
    static const std::vector<std::string> think_words = {
        "Thinking", "thought for", "Churned", "Cogitating"};
    static const std::string tool_marker = "\xe2\x8f\xba";  // ⏺
    static const std::string prompt_marker = "\xe2\x9d\xaf";  // ❯

    for (const auto& line : lines) {
        if (contains_any(line, error_words)) return PaneActivity::Error;
    }

    if (any_recent(lines, ACTIVITY_EXEC_WINDOW, [&](const std::string& l) {
            std::string t = l;
            trim(t);
            return starts_with(t, tool_marker) || contains_any(l, exec_words);
        })) {
        return PaneActivity::Executing;
    }

    if (any_recent(lines, ACTIVITY_THINK_WINDOW, [&](const std::string& l) {
            return contains_any(l, spinners) || contains_any(l, think_words);
        })) {
        return PaneActivity::Thinking;
    }

    if (any_recent(lines, ACTIVITY_THINK_WINDOW, [&](const std::string& l) {
            std::string t = l;
            trim(t);
            return starts_with(t, prompt_marker) || starts_with(t, ">") ||
                   (!t.empty() && t.back() == '>');
        })) {
        return PaneActivity::Idle;
    }

    return PaneActivity::Unknown;
}

std::string last_activity(const std::vector<std::string>& lines) {
    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        std::string t = *it;
        trim(t);
        if (t.empty()) continue;
        std::string cut = truncate_str(t, ACTIVITY_PREVIEW_LEN);
        if (cut == t) return t;
        return truncate_str(t, ACTIVITY_PREVIEW_LEN - 3);
    }
    return "(no activity)";
}

PaneSnapshot make_snapshot(int pane, const std::string& screen, const std::string& command) {
    PaneSnapshot s;
    s.pane = pane;
    s.captured = true;
    s.command = command;
    s.lines = split_lines(screen);
    // capture-pane pads the screen with blank rows
    while (!s.lines.empty()) {
        std::string t = s.lines.back();
        trim(t);
        if (!t.empty()) break;
        s.lines.pop_back();
    }
    s.activity = analyze_activity(s.lines);
    s.last_activity = last_activity(s.lines);
    s.captured_at = std::chrono::steady_clock::now();
    s.changed_at = s.captured_at;
    return s;
}
