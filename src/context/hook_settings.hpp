#pragma once

#include <string>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

class SessionConfig;

// Agent settings whose hooks keep the readiness marker current:
// a submitted prompt writes "processing", a finished turn writes "pending".
// Emitted in flow style with double-quoted strings, which is plain JSON.
std::string hook_settings_json(const fs::path& status_file);

// Writes queue/hooks/expert<N>.json for the agent and returns its path.
Result<fs::path> write_hook_settings(const SessionConfig& config, int agent_id);
