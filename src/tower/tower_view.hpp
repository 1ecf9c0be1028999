#pragma once

#include <string>
#include <vector>
#include <optional>
#include <core/types.hpp>

// ── Input ───────────────────────────────────────────────────

struct InputEvent {
    enum class Kind {
        Tick,   // timeout elapsed with no complete line
        Line,
        Eof,
    };

    Kind kind = Kind::Tick;
    std::string text;
};

class InputSource {
public:
    virtual ~InputSource() = default;

    // Wait at most timeout_ms for the next event. Must not block longer.
    virtual InputEvent next(int timeout_ms) = 0;
};

// ── Output ──────────────────────────────────────────────────

struct AgentRow {
    int id = 0;
    std::string name;
    std::string role;
    AgentStatus status = AgentStatus::Unknown;
    std::string activity;                   // last pane line
    std::optional<std::string> branch;      // worktree, if any
    std::optional<std::string> operation;   // in-flight operation label

    bool operator==(const AgentRow& o) const {
        return id == o.id && name == o.name && role == o.role && status == o.status &&
               activity == o.activity && branch == o.branch && operation == o.operation;
    }
    bool operator!=(const AgentRow& o) const { return !(*this == o); }
};

struct TowerView {
    std::string session_name;
    std::string project_path;
    std::vector<AgentRow> agents;
    std::vector<std::string> messages;      // oldest first

    bool operator==(const TowerView& o) const {
        return session_name == o.session_name && project_path == o.project_path &&
               agents == o.agents && messages == o.messages;
    }
    bool operator!=(const TowerView& o) const { return !(*this == o); }
};

class Renderer {
public:
    virtual ~Renderer() = default;
    virtual void render(const TowerView& view) = 0;
};
