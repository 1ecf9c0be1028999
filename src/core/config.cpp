#include "config.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>

static std::vector<ExpertConfig> default_experts() {
    return {
        {"architect", "architect"},
        {"frontend", "frontend"},
        {"backend", "backend"},
        {"tester", "tester"},
    };
}

static fs::path canonical_or_absolute(const fs::path& p) {
    std::error_code ec;
    auto c = fs::canonical(p, ec);
    if (!ec) return c;
    return fs::absolute(p, ec);
}

SessionConfig::SessionConfig() : experts_(default_experts()) {
    project_path_ = canonical_or_absolute(fs::current_path());
    git_root_ = project_path_;
}

// ── Parsing ─────────────────────────────────────────────────

class ConfigParser {
public:
    static Result<void> apply(SessionConfig& cfg, const YAML::Node& root) {
        if (!root || root.IsNull()) return Result<void>::Ok();
        if (!root.IsMap()) {
            return Result<void>::Err("config root must be a mapping", ErrorKind::InvalidInput);
        }

        cfg.num_experts_ = root["num_experts"].as<int>(cfg.num_experts_);
        if (cfg.num_experts_ < 1) {
            return Result<void>::Err(
                fmt::format("num_experts must be at least 1 (got {})", cfg.num_experts_),
                ErrorKind::InvalidInput);
        }
        cfg.session_prefix_ = root["session_prefix"].as<std::string>(cfg.session_prefix_);

        if (root["experts"] && root["experts"].IsSequence()) {
            cfg.experts_.clear();
            for (const auto& n : root["experts"]) {
                ExpertConfig e;
                if (n.IsScalar()) {
                    e.name = n.as<std::string>();
                    e.role = e.name;
                } else {
                    e.name = n["name"].as<std::string>("");
                    e.role = n["role"].as<std::string>(e.name);
                }
                if (e.name.empty()) {
                    return Result<void>::Err("expert entry without a name", ErrorKind::InvalidInput);
                }
                cfg.experts_.push_back(e);
            }
        }

        if (auto a = root["agent"]) {
            cfg.agent_.command = a["command"].as<std::string>(cfg.agent_.command);
            if (a["args"] && a["args"].IsSequence()) {
                cfg.agent_.args = a["args"].as<std::vector<std::string>>();
            }
            cfg.agent_.resume_flag = a["resume_flag"].as<std::string>(cfg.agent_.resume_flag);
            cfg.agent_.settings_flag =
                a["settings_flag"].as<std::string>(cfg.agent_.settings_flag);
            cfg.agent_.ready_marker = a["ready_marker"].as<std::string>(cfg.agent_.ready_marker);
            cfg.agent_.exit_command = a["exit_command"].as<std::string>(cfg.agent_.exit_command);
        }

        if (auto t = root["timeouts"]) {
            auto& to = cfg.timeouts_;
            to.agent_ready_secs = t["agent_ready"].as<int>(to.agent_ready_secs);
            to.exit_grace_ms = t["exit_grace_ms"].as<int>(to.exit_grace_ms);
            to.stuck_after_secs = t["stuck_after"].as<int>(to.stuck_after_secs);
            to.tick_ms = t["tick_ms"].as<int>(to.tick_ms);
            to.capture_interval_ms = t["capture_interval_ms"].as<int>(to.capture_interval_ms);
        }

        // An explicit expert list sets the count unless num_experts says otherwise
        if (!root["num_experts"] && root["experts"] && root["experts"].IsSequence()) {
            cfg.num_experts_ = static_cast<int>(cfg.experts_.size());
        }
        cfg = cfg.with_num_experts(cfg.num_experts_);
        return Result<void>::Ok();
    }
};

Result<SessionConfig> SessionConfig::load(const fs::path& path) {
    SessionConfig cfg;
    if (!fs::exists(path)) {
        return Result<SessionConfig>::Ok(cfg);
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        auto applied = ConfigParser::apply(cfg, root);
        if (applied.is_err()) {
            return Result<SessionConfig>::Err(
                fmt::format("{}: {}", path.string(), applied.error), applied.kind);
        }
    } catch (const YAML::Exception& e) {
        return Result<SessionConfig>::Err(
            fmt::format("Failed to parse {}: {}", path.string(), e.what()),
            ErrorKind::InvalidInput);
    }
    return Result<SessionConfig>::Ok(cfg);
}

Result<SessionConfig> SessionConfig::load_default() {
    return load(get_config_path());
}

// ── Derived copies ──────────────────────────────────────────

SessionConfig SessionConfig::with_project_path(const fs::path& path) const {
    SessionConfig copy = *this;
    copy.project_path_ = canonical_or_absolute(path);
    copy.git_root_ = copy.project_path_;
    return copy;
}

SessionConfig SessionConfig::with_git_root(const fs::path& root) const {
    SessionConfig copy = *this;
    copy.git_root_ = canonical_or_absolute(root);
    return copy;
}

SessionConfig SessionConfig::with_num_experts(int n) const {
    SessionConfig copy = *this;
    if (n < 1) n = 1;
    copy.num_experts_ = n;
    if (static_cast<int>(copy.experts_.size()) > n) {
        copy.experts_.resize(n);
    }
    for (int i = static_cast<int>(copy.experts_.size()); i < n; ++i) {
        copy.experts_.push_back({fmt::format("expert{}", i), "general"});
    }
    return copy;
}

// ── Identity ────────────────────────────────────────────────

std::string SessionConfig::session_hash() const {
    return sha256_hex(project_path_.string()).substr(0, 8);
}

std::string SessionConfig::session_name() const {
    return fmt::format("{}-{}", session_prefix_, session_hash());
}

// ── Layout ──────────────────────────────────────────────────

fs::path SessionConfig::data_root() const { return git_root_ / DATA_DIR_NAME; }
fs::path SessionConfig::queue_path() const { return data_root() / "queue"; }
fs::path SessionConfig::status_dir() const { return queue_path() / "status"; }
fs::path SessionConfig::sessions_dir() const { return queue_path() / "sessions"; }
fs::path SessionConfig::session_dir() const { return sessions_dir() / session_hash(); }
fs::path SessionConfig::reports_dir() const { return queue_path() / "reports"; }
fs::path SessionConfig::hooks_dir() const { return queue_path() / "hooks"; }
fs::path SessionConfig::logs_dir() const { return queue_path() / "logs"; }
fs::path SessionConfig::worktrees_dir() const { return data_root() / "worktrees"; }

// ── Experts ─────────────────────────────────────────────────

std::vector<ExpertInfo> SessionConfig::expert_infos() const {
    std::vector<ExpertInfo> out;
    for (int i = 0; i < static_cast<int>(experts_.size()); ++i) {
        out.push_back({i, experts_[i].name, experts_[i].role});
    }
    return out;
}

std::optional<ExpertInfo> SessionConfig::expert(int id) const {
    if (id < 0 || id >= static_cast<int>(experts_.size())) return std::nullopt;
    return ExpertInfo{id, experts_[id].name, experts_[id].role};
}

std::optional<ExpertInfo> SessionConfig::expert_by_name(const std::string& name) const {
    std::string wanted = to_lower(name);
    for (int i = 0; i < static_cast<int>(experts_.size()); ++i) {
        if (to_lower(experts_[i].name) == wanted) return expert(i);
    }
    return std::nullopt;
}

std::optional<ExpertInfo> SessionConfig::resolve_expert(const std::string& id_or_name) const {
    int id = safe_stoi(id_or_name, -1);
    if (id >= 0) return expert(id);
    return expert_by_name(id_or_name);
}

// ── Paths ───────────────────────────────────────────────────

fs::path get_config_dir() {
    return platform::config_home() / "crew";
}

fs::path get_config_path() {
    std::string env = platform::get_env(CONFIG_ENV_VAR);
    if (!env.empty()) return fs::path(env);
    return get_config_dir() / "config.yaml";
}

Result<void> create_default_config(const fs::path& path) {
    if (fs::exists(path)) return Result<void>::Ok();

    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return Result<void>::Err(
            fmt::format("Cannot create {}: {}", path.parent_path().string(), ec.message()),
            ErrorKind::Io);
    }

    SessionConfig defaults;
    YAML::Emitter out;
    out << YAML::Comment("crew configuration");
    out << YAML::BeginMap;
    out << YAML::Key << "num_experts" << YAML::Value << defaults.num_experts();
    out << YAML::Key << "session_prefix" << YAML::Value << defaults.session_prefix();
    out << YAML::Key << "experts" << YAML::Value << YAML::BeginSeq;
    for (const auto& e : defaults.experts()) {
        out << YAML::BeginMap;
        out << YAML::Key << "name" << YAML::Value << e.name;
        out << YAML::Key << "role" << YAML::Value << e.role;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::Key << "agent" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "command" << YAML::Value << defaults.agent().command;
    out << YAML::Key << "args" << YAML::Value << defaults.agent().args;
    out << YAML::Key << "resume_flag" << YAML::Value << defaults.agent().resume_flag;
    out << YAML::Key << "settings_flag" << YAML::Value << defaults.agent().settings_flag
        << YAML::Comment("hooks that keep queue/status current");
    out << YAML::Key << "ready_marker" << YAML::Value << defaults.agent().ready_marker;
    out << YAML::Key << "exit_command" << YAML::Value << defaults.agent().exit_command;
    out << YAML::EndMap;
    out << YAML::Key << "timeouts" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "agent_ready" << YAML::Value << defaults.timeouts().agent_ready_secs
        << YAML::Comment("seconds");
    out << YAML::Key << "exit_grace_ms" << YAML::Value << defaults.timeouts().exit_grace_ms;
    out << YAML::Key << "stuck_after" << YAML::Value << defaults.timeouts().stuck_after_secs
        << YAML::Comment("seconds");
    out << YAML::Key << "tick_ms" << YAML::Value << defaults.timeouts().tick_ms;
    out << YAML::Key << "capture_interval_ms" << YAML::Value
        << defaults.timeouts().capture_interval_ms;
    out << YAML::EndMap;
    out << YAML::EndMap;

    std::ofstream f(path);
    if (!f) {
        return Result<void>::Err("Cannot write " + path.string(), ErrorKind::Io);
    }
    f << out.c_str() << "\n";
    return Result<void>::Ok();
}
