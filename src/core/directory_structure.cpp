#include "directory_structure.hpp"
#include "config.hpp"
#include <fmt/format.h>

Result<void> ensure_session_directories(const SessionConfig& config) {
    const fs::path dirs[] = {
        config.status_dir(),
        config.session_dir() / "experts",
        config.session_dir() / "shared",
        config.reports_dir(),
        config.hooks_dir(),
        config.logs_dir(),
        config.worktrees_dir(),
    };

    for (const auto& d : dirs) {
        std::error_code ec;
        fs::create_directories(d, ec);
        if (ec) {
            return Result<void>::Err(
                fmt::format("Cannot create {}: {}", d.string(), ec.message()),
                ErrorKind::Infrastructure);
        }
    }
    return Result<void>::Ok();
}

fs::path expert_context_dir(const fs::path& sessions_dir,
                            const std::string& session_hash, int expert_id) {
    return sessions_dir / session_hash / "experts" / fmt::format("expert{}", expert_id);
}

fs::path expert_log_path(const SessionConfig& config, int expert_id) {
    return config.logs_dir() / fmt::format("expert{}.log", expert_id);
}

fs::path expert_hooks_path(const SessionConfig& config, int expert_id) {
    return config.hooks_dir() / fmt::format("expert{}.json", expert_id);
}

fs::path expert_report_path(const SessionConfig& config, int expert_id) {
    return config.reports_dir() / fmt::format("expert{}_report.yaml", expert_id);
}
