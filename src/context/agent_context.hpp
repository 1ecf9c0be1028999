#pragma once

#include <string>
#include <vector>
#include <optional>

// Durable per-agent record, keyed by (session_hash, agent_id).
// Worktree changes always drop the resume token: a conversation started in
// one checkout must never be resumed in another.
class AgentContext {
public:
    AgentContext() = default;
    AgentContext(std::string session_hash, int agent_id, std::string agent_name,
                 std::string role);

    const std::string& session_hash() const { return session_hash_; }
    int agent_id() const { return agent_id_; }
    const std::string& agent_name() const { return agent_name_; }
    const std::string& role() const { return role_; }
    const std::optional<std::string>& resume_token() const { return resume_token_; }
    const std::optional<std::string>& worktree_branch() const { return worktree_branch_; }
    const std::optional<std::string>& worktree_path() const { return worktree_path_; }
    const std::string& created_at() const { return created_at_; }
    const std::string& last_modified() const { return last_modified_; }

    bool in_worktree() const { return worktree_path_.has_value(); }

    void set_role(const std::string& role);
    void set_resume_token(const std::string& token);

    // Both also clear the resume token
    void set_worktree(const std::string& branch, const std::string& path);
    void clear_worktree();

    void touch();

private:
    std::string session_hash_;
    int agent_id_ = 0;
    std::string agent_name_;
    std::string role_;
    std::optional<std::string> resume_token_;
    std::optional<std::string> worktree_branch_;
    std::optional<std::string> worktree_path_;
    std::string created_at_;
    std::string last_modified_;

    friend class ContextStore;
};

// ── Shared (cross-agent) context ────────────────────────────

struct Decision {
    std::string id;
    int made_by = 0;
    std::string timestamp;
    std::string topic;
    std::string decision;
    std::string rationale;
    std::vector<int> affects_experts;   // empty = everyone
};

struct SharedContext {
    std::vector<Decision> decisions;

    std::vector<Decision> decisions_for_expert(int expert_id) const;
    // Case-insensitive substring match
    std::vector<Decision> decisions_by_topic(const std::string& topic) const;
};

Decision make_decision(int made_by, std::string topic, std::string decision,
                       std::string rationale);

// ── Session role table ──────────────────────────────────────

struct RoleAssignment {
    int expert_id = 0;
    std::string role;
    std::string assigned_at;
};

struct SessionRoles {
    std::string session_hash;
    std::string created_at;
    std::string updated_at;
    std::vector<RoleAssignment> assignments;

    std::optional<std::string> get_role(int expert_id) const;
    void set_role(int expert_id, const std::string& role);
};

SessionRoles make_session_roles(const std::string& session_hash);
