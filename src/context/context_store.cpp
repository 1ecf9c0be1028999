#include "context_store.hpp"
#include <core/directory_structure.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <atomic>
#include <fstream>
#include <unistd.h>

ContextStore::ContextStore(const fs::path& queue_path)
    : base_path_(queue_path / "sessions") {}

fs::path ContextStore::session_path(const std::string& session_hash) const {
    return base_path_ / session_hash;
}

fs::path ContextStore::context_file(const std::string& session_hash, int agent_id) const {
    return expert_context_dir(base_path_, session_hash, agent_id) / "context.yaml";
}

fs::path ContextStore::shared_file(const std::string& session_hash) const {
    return session_path(session_hash) / "shared" / "decisions.yaml";
}

fs::path ContextStore::roles_file(const std::string& session_hash) const {
    return session_path(session_hash) / "expert_roles.yaml";
}

// ── helpers ─────────────────────────────────────────────────

Result<void> write_file_atomic(const fs::path& path, const std::string& content) {
    static std::atomic<unsigned> counter{0};

    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return Result<void>::Err(
            fmt::format("Cannot create {}: {}", path.parent_path().string(), ec.message()),
            ErrorKind::Io);
    }

    fs::path tmp = path;
    tmp += fmt::format(".tmp.{}.{}", getpid(), counter++);
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            return Result<void>::Err("Cannot write " + tmp.string(), ErrorKind::Io);
        }
        out << content;
        out.flush();
        if (!out) {
            fs::remove(tmp, ec);
            return Result<void>::Err("Short write to " + tmp.string(), ErrorKind::Io);
        }
    }

    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return Result<void>::Err(
            fmt::format("Cannot replace {}: {}", path.string(), ec.message()), ErrorKind::Io);
    }
    return Result<void>::Ok();
}

static void emit_optional(YAML::Emitter& out, const char* key,
                          const std::optional<std::string>& v) {
    out << YAML::Key << key << YAML::Value;
    if (v) out << *v;
    else out << YAML::Null;
}

static std::optional<std::string> read_optional(const YAML::Node& n) {
    if (!n || n.IsNull()) return std::nullopt;
    auto s = n.as<std::string>("");
    if (s.empty()) return std::nullopt;
    return s;
}

// ── Session ─────────────────────────────────────────────────

Result<void> ContextStore::init_session(const std::string& session_hash, int num_experts) {
    std::error_code ec;
    fs::create_directories(session_path(session_hash) / "shared", ec);
    for (int i = 0; i < num_experts && !ec; ++i) {
        fs::create_directories(expert_context_dir(base_path_, session_hash, i), ec);
    }
    if (ec) {
        return Result<void>::Err(
            fmt::format("Cannot initialize session {}: {}", session_hash, ec.message()),
            ErrorKind::Infrastructure);
    }
    return Result<void>::Ok();
}

Result<void> ContextStore::cleanup_session(const std::string& session_hash) {
    std::error_code ec;
    fs::remove_all(session_path(session_hash), ec);
    if (ec) {
        return Result<void>::Err(
            fmt::format("Cannot remove session {}: {}", session_hash, ec.message()),
            ErrorKind::Io);
    }
    crew_log(fmt::format("context_store: removed session {}", session_hash));
    return Result<void>::Ok();
}

// ── Per-agent ───────────────────────────────────────────────

Result<std::optional<AgentContext>> ContextStore::load(const std::string& session_hash,
                                                       int agent_id) const {
    fs::path path = context_file(session_hash, agent_id);
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Result<std::optional<AgentContext>>::Ok(std::nullopt);
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        AgentContext ctx;
        ctx.session_hash_ = root["session_hash"].as<std::string>(session_hash);
        ctx.agent_id_ = root["expert_id"].as<int>(agent_id);
        ctx.agent_name_ = root["expert_name"].as<std::string>("");
        ctx.role_ = root["role"].as<std::string>("");
        ctx.resume_token_ = read_optional(root["resume_token"]);
        ctx.worktree_branch_ = read_optional(root["worktree_branch"]);
        ctx.worktree_path_ = read_optional(root["worktree_path"]);
        ctx.created_at_ = root["created_at"].as<std::string>("");
        ctx.last_modified_ = root["last_modified"].as<std::string>("");
        return Result<std::optional<AgentContext>>::Ok(ctx);
    } catch (const YAML::Exception& e) {
        return Result<std::optional<AgentContext>>::Err(
            fmt::format("Corrupt context {}: {}", path.string(), e.what()), ErrorKind::Io);
    }
}

Result<void> ContextStore::save(AgentContext& ctx) {
    ctx.touch();

    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "session_hash" << YAML::Value << ctx.session_hash_;
    out << YAML::Key << "expert_id" << YAML::Value << ctx.agent_id_;
    out << YAML::Key << "expert_name" << YAML::Value << ctx.agent_name_;
    out << YAML::Key << "role" << YAML::Value << ctx.role_;
    emit_optional(out, "resume_token", ctx.resume_token_);
    emit_optional(out, "worktree_branch", ctx.worktree_branch_);
    emit_optional(out, "worktree_path", ctx.worktree_path_);
    out << YAML::Key << "created_at" << YAML::Value << ctx.created_at_;
    out << YAML::Key << "last_modified" << YAML::Value << ctx.last_modified_;
    out << YAML::EndMap;

    return write_file_atomic(context_file(ctx.session_hash_, ctx.agent_id_),
                             std::string(out.c_str()) + "\n");
}

Result<void> ContextStore::clear(const std::string& session_hash, int agent_id) {
    std::error_code ec;
    fs::remove(context_file(session_hash, agent_id), ec);
    if (ec) {
        return Result<void>::Err(
            fmt::format("Cannot clear context for agent {}: {}", agent_id, ec.message()),
            ErrorKind::Io);
    }
    return Result<void>::Ok();
}

// ── Shared ──────────────────────────────────────────────────

Result<SharedContext> ContextStore::load_shared(const std::string& session_hash) const {
    SharedContext shared;
    fs::path path = shared_file(session_hash);
    std::error_code ec;
    if (!fs::exists(path, ec)) return Result<SharedContext>::Ok(shared);

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        if (root["decisions"] && root["decisions"].IsSequence()) {
            for (const auto& n : root["decisions"]) {
                Decision d;
                d.id = n["id"].as<std::string>("");
                d.made_by = n["made_by"].as<int>(0);
                d.timestamp = n["timestamp"].as<std::string>("");
                d.topic = n["topic"].as<std::string>("");
                d.decision = n["decision"].as<std::string>("");
                d.rationale = n["rationale"].as<std::string>("");
                if (n["affects_experts"] && n["affects_experts"].IsSequence()) {
                    d.affects_experts = n["affects_experts"].as<std::vector<int>>();
                }
                shared.decisions.push_back(d);
            }
        }
    } catch (const YAML::Exception& e) {
        return Result<SharedContext>::Err(
            fmt::format("Corrupt shared context {}: {}", path.string(), e.what()),
            ErrorKind::Io);
    }
    return Result<SharedContext>::Ok(shared);
}

Result<void> ContextStore::save_shared(const std::string& session_hash,
                                       const SharedContext& shared) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "decisions" << YAML::Value << YAML::BeginSeq;
    for (const auto& d : shared.decisions) {
        out << YAML::BeginMap;
        out << YAML::Key << "id" << YAML::Value << d.id;
        out << YAML::Key << "made_by" << YAML::Value << d.made_by;
        out << YAML::Key << "timestamp" << YAML::Value << d.timestamp;
        out << YAML::Key << "topic" << YAML::Value << d.topic;
        out << YAML::Key << "decision" << YAML::Value << d.decision;
        out << YAML::Key << "rationale" << YAML::Value << d.rationale;
        out << YAML::Key << "affects_experts" << YAML::Value << YAML::Flow << d.affects_experts;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;

    return write_file_atomic(shared_file(session_hash), std::string(out.c_str()) + "\n");
}

Result<void> ContextStore::add_decision(const std::string& session_hash,
                                        const Decision& decision) {
    std::lock_guard<std::mutex> lock(shared_mutex_);
    auto shared = load_shared(session_hash);
    if (shared.is_err()) return Result<void>::Err(shared.error, shared.kind);
    shared.value.decisions.push_back(decision);
    return save_shared(session_hash, shared.value);
}

// ── Roles ───────────────────────────────────────────────────

Result<std::optional<SessionRoles>> ContextStore::load_roles(
        const std::string& session_hash) const {
    fs::path path = roles_file(session_hash);
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Result<std::optional<SessionRoles>>::Ok(std::nullopt);
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        SessionRoles roles;
        roles.session_hash = root["session_hash"].as<std::string>(session_hash);
        roles.created_at = root["created_at"].as<std::string>("");
        roles.updated_at = root["updated_at"].as<std::string>("");
        if (root["assignments"] && root["assignments"].IsSequence()) {
            for (const auto& n : root["assignments"]) {
                RoleAssignment a;
                a.expert_id = n["expert_id"].as<int>(0);
                a.role = n["role"].as<std::string>("");
                a.assigned_at = n["assigned_at"].as<std::string>("");
                roles.assignments.push_back(a);
            }
        }
        return Result<std::optional<SessionRoles>>::Ok(roles);
    } catch (const YAML::Exception& e) {
        return Result<std::optional<SessionRoles>>::Err(
            fmt::format("Corrupt role table {}: {}", path.string(), e.what()), ErrorKind::Io);
    }
}

Result<void> ContextStore::save_roles(SessionRoles& roles) {
    roles.updated_at = now_iso();

    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "session_hash" << YAML::Value << roles.session_hash;
    out << YAML::Key << "created_at" << YAML::Value << roles.created_at;
    out << YAML::Key << "updated_at" << YAML::Value << roles.updated_at;
    out << YAML::Key << "assignments" << YAML::Value << YAML::BeginSeq;
    for (const auto& a : roles.assignments) {
        out << YAML::BeginMap;
        out << YAML::Key << "expert_id" << YAML::Value << a.expert_id;
        out << YAML::Key << "role" << YAML::Value << a.role;
        out << YAML::Key << "assigned_at" << YAML::Value << a.assigned_at;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;

    return write_file_atomic(roles_file(roles.session_hash), std::string(out.c_str()) + "\n");
}
