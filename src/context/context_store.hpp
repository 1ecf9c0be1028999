#pragma once

#include <string>
#include <vector>
#include <optional>
#include <mutex>
#include <filesystem>
#include <core/types.hpp>
#include "agent_context.hpp"

namespace fs = std::filesystem;

// YAML records under <queue>/sessions/<hash>/:
//   experts/expert<N>/context.yaml   per-agent context
//   shared/decisions.yaml            cross-agent decisions
//   expert_roles.yaml                role table
// Every write goes to a temp file first and is renamed into place.
class ContextStore {
public:
    explicit ContextStore(const fs::path& queue_path);

    const fs::path& base_path() const { return base_path_; }

    Result<void> init_session(const std::string& session_hash, int num_experts);
    Result<void> cleanup_session(const std::string& session_hash);

    // ── Per-agent ─────────────────────────────────────────
    Result<std::optional<AgentContext>> load(const std::string& session_hash, int agent_id) const;
    Result<void> save(AgentContext& ctx);
    Result<void> clear(const std::string& session_hash, int agent_id);

    // ── Shared ────────────────────────────────────────────
    Result<SharedContext> load_shared(const std::string& session_hash) const;
    Result<void> save_shared(const std::string& session_hash, const SharedContext& shared);
    Result<void> add_decision(const std::string& session_hash, const Decision& decision);

    // ── Roles ─────────────────────────────────────────────
    Result<std::optional<SessionRoles>> load_roles(const std::string& session_hash) const;
    Result<void> save_roles(SessionRoles& roles);

private:
    fs::path session_path(const std::string& session_hash) const;
    fs::path context_file(const std::string& session_hash, int agent_id) const;
    fs::path shared_file(const std::string& session_hash) const;
    fs::path roles_file(const std::string& session_hash) const;

    fs::path base_path_;
    std::mutex shared_mutex_;   // add_decision is read-modify-write
};

// Write content to path via a sibling temp file and rename(2).
Result<void> write_file_atomic(const fs::path& path, const std::string& content);
