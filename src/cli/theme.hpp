#pragma once

#include <string>
#include <core/types.hpp>
#include <core/constants.hpp>
#include <fmt/format.h>

// Terminal styling shared by the host commands and the tower's line renderer.
namespace theme {

namespace color {
    const std::string BLUE      = "\033[38;2;62;120;178m";   // agents, busy
    const std::string BROWN     = "\033[38;2;128;99;58m";    // headings, branches
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string YELLOW    = "\033[93m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

inline std::string paint(const std::string& c, const std::string& s) { return c + s + color::RESET; }

inline std::string blue(const std::string& s)   { return paint(color::BLUE, s); }
inline std::string brown(const std::string& s)  { return paint(color::BROWN, s); }
inline std::string dim(const std::string& s)    { return paint(color::DIM, s); }
inline std::string green(const std::string& s)  { return paint(color::GREEN, s); }
inline std::string red(const std::string& s)    { return paint(color::RED, s); }
inline std::string yellow(const std::string& s) { return paint(color::YELLOW, s); }

// ── Layout ──────────────────────────────────────────────────

constexpr int RULE_WIDTH = 44;

inline std::string rule() {
    std::string line = "  ";
    for (int i = 0; i < RULE_WIDTH; ++i) line += "\xe2\x94\x80";  // U+2500
    return dim(line) + "\n";
}

// Clears the screen; subtitle is usually the session name
inline std::string banner(const std::string& subtitle = "") {
    std::string sub = fmt::format("  v{}{}", CREW_VERSION, subtitle.empty() ? "" : "  " + subtitle);
    return "\033[2J\033[H\n"
           + paint(color::BLUE + color::BOLD, "  crew")
           + dim("  multi-agent tmux orchestrator\n" + sub) + "\n\n"
           + rule();
}

inline std::string section(const std::string& title) {
    return "\n" + paint(color::BROWN + color::BOLD, "  " + title) + "\n\n";
}

inline std::string divider() { return "\n" + rule() + "\n"; }

// ── One-line results ────────────────────────────────────────

inline std::string mark(const std::string& c, char glyph, const std::string& msg) {
    return paint(c, fmt::format("    {} ", glyph)) + msg + "\n";
}

inline std::string ok(const std::string& msg)   { return mark(color::GREEN, '+', msg); }
inline std::string fail(const std::string& msg) { return mark(color::RED, 'x', msg); }
inline std::string info(const std::string& msg) { return mark(color::BLUE, '~', msg); }
inline std::string step(const std::string& msg) { return mark(color::BROWN, '>', msg); }
inline std::string warn(const std::string& msg) { return mark(color::YELLOW, '!', msg); }

inline std::string kv(const std::string& key, const std::string& value) {
    return dim(fmt::format("    {:<10}", key)) + value + "\n";
}

// Padded before coloring so columns line up
inline std::string status(AgentStatus s, int width = 9) {
    std::string text = fmt::format("{:<{}}", agent_status_name(s), width);
    switch (s) {
        case AgentStatus::Ready:    return green(text);
        case AgentStatus::Busy:     return blue(text);
        case AgentStatus::Starting: return yellow(text);
        case AgentStatus::Stuck:    return red(text);
        case AgentStatus::Pending:
        case AgentStatus::Unknown:  break;
    }
    return dim(text);
}

} // namespace theme
