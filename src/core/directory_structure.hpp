#pragma once

#include <filesystem>
#include <string>
#include "types.hpp"

namespace fs = std::filesystem;

class SessionConfig;

// Ensures the <git root>/.crew layout for this session exists:
//   queue/status, queue/sessions/<hash>/{experts,shared}, queue/reports,
//   queue/hooks, queue/logs, worktrees
// Creates directories as needed but does not overwrite files.
Result<void> ensure_session_directories(const SessionConfig& config);

// queue/sessions/<hash>/experts/expert<N>
fs::path expert_context_dir(const fs::path& sessions_dir,
                            const std::string& session_hash, int expert_id);

// queue/logs/expert<N>.log
fs::path expert_log_path(const SessionConfig& config, int expert_id);

// queue/hooks/expert<N>.json, passed to the agent at launch
fs::path expert_hooks_path(const SessionConfig& config, int expert_id);

// queue/reports/expert<N>_report.yaml, written by the agent
fs::path expert_report_path(const SessionConfig& config, int expert_id);
