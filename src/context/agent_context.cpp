#include "agent_context.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>
#include <atomic>
#include <chrono>

AgentContext::AgentContext(std::string session_hash, int agent_id, std::string agent_name,
                           std::string role)
    : session_hash_(std::move(session_hash)), agent_id_(agent_id),
      agent_name_(std::move(agent_name)), role_(std::move(role)) {
    created_at_ = now_iso();
    last_modified_ = created_at_;
}

void AgentContext::set_role(const std::string& role) {
    role_ = role;
    touch();
}

void AgentContext::set_resume_token(const std::string& token) {
    resume_token_ = token;
    touch();
}

void AgentContext::set_worktree(const std::string& branch, const std::string& path) {
    worktree_branch_ = branch;
    worktree_path_ = path;
    resume_token_.reset();
    touch();
}

void AgentContext::clear_worktree() {
    worktree_branch_.reset();
    worktree_path_.reset();
    resume_token_.reset();
    touch();
}

void AgentContext::touch() {
    last_modified_ = now_iso();
}

// ── SharedContext ───────────────────────────────────────────

std::vector<Decision> SharedContext::decisions_for_expert(int expert_id) const {
    std::vector<Decision> out;
    for (const auto& d : decisions) {
        if (d.affects_experts.empty()) {
            out.push_back(d);
            continue;
        }
        for (int e : d.affects_experts) {
            if (e == expert_id) { out.push_back(d); break; }
        }
    }
    return out;
}

std::vector<Decision> SharedContext::decisions_by_topic(const std::string& topic) const {
    std::vector<Decision> out;
    std::string wanted = to_lower(topic);
    for (const auto& d : decisions) {
        if (to_lower(d.topic).find(wanted) != std::string::npos) out.push_back(d);
    }
    return out;
}

Decision make_decision(int made_by, std::string topic, std::string decision,
                       std::string rationale) {
    // Unique within a process, even within one second
    static std::atomic<unsigned> seq{0};
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    Decision d;
    d.id = fmt::format("decision-{}-{}", secs, seq++);
    d.made_by = made_by;
    d.timestamp = now_iso();
    d.topic = std::move(topic);
    d.decision = std::move(decision);
    d.rationale = std::move(rationale);
    return d;
}

// ── SessionRoles ────────────────────────────────────────────

std::optional<std::string> SessionRoles::get_role(int expert_id) const {
    for (const auto& a : assignments) {
        if (a.expert_id == expert_id) return a.role;
    }
    return std::nullopt;
}

void SessionRoles::set_role(int expert_id, const std::string& role) {
    updated_at = now_iso();
    for (auto& a : assignments) {
        if (a.expert_id == expert_id) {
            a.role = role;
            a.assigned_at = updated_at;
            return;
        }
    }
    assignments.push_back({expert_id, role, updated_at});
}

SessionRoles make_session_roles(const std::string& session_hash) {
    SessionRoles r;
    r.session_hash = session_hash;
    r.created_at = now_iso();
    r.updated_at = r.created_at;
    return r;
}
