#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <core/types.hpp>
#include <core/config.hpp>
#include <managers/tmux_manager.hpp>
#include <managers/agent_manager.hpp>
#include <managers/worktree_manager.hpp>
#include <context/context_store.hpp>
#include <context/report_store.hpp>
#include <context/role_instructions.hpp>

// Where the agent should run after the launch.
struct Placement {
    enum class Kind {
        Keep,           // wherever the context says (worktree or project root)
        Worktree,       // move into the branch's worktree
        ProjectRoot,    // leave any worktree
    };

    Kind kind = Kind::Keep;
    std::string branch;

    static Placement keep() { return {}; }
    static Placement worktree(std::string branch) { return {Kind::Worktree, std::move(branch)}; }
    static Placement project_root() { return {Kind::ProjectRoot, ""}; }

    bool relocating() const { return kind != Kind::Keep; }
};

struct LaunchOptions {
    Placement placement;
    bool send_role_instruction = true;
    bool fresh_context = false;     // reset: forget token, worktree and report first
};

struct LaunchOutcome {
    int agent_id = 0;
    std::string agent_name;
    Placement placement;
    std::string working_dir;
    std::optional<std::string> branch;  // worktree the agent ended up in
    bool resumed = false;
    bool ready = false;
    bool instruction_sent = false;
    std::vector<std::string> warnings;  // non-fatal step failures

    std::string summary() const;
};

// Collaborators an operation keeps alive for as long as it runs.
struct LaunchDeps {
    std::shared_ptr<TmuxManager> tmux;
    std::shared_ptr<AgentManager> agents;
    std::shared_ptr<WorktreeManager> worktrees;
    std::shared_ptr<ContextStore> store;
    std::shared_ptr<const RoleInstructions> instructions;
    std::shared_ptr<ReportStore> reports;
};

// The full launch/relocation sequence. Blocks: run it on a background thread.
//
// Worktree and alias failures abort with an error. Everything after that
// (context I/O, launch, readiness, instruction) is reported in the outcome.
Result<LaunchOutcome> run_launch_sequence(const SessionConfig& config, const LaunchDeps& deps,
                                          int agent_id, const LaunchOptions& options);

// Role text, then where to leave the report, then the decisions that concern
// the agent (newest last, at most MAX_INSTRUCTION_DECISIONS).
std::string compose_instruction(const std::string& role_text, const fs::path& report_file,
                                const std::vector<Decision>& decisions);

// "Launch of architect", "Worktree launch of architect", "Reset of architect", ...
std::string launch_label(const SessionConfig& config, int agent_id, const Placement& placement,
                         bool fresh_context = false);
