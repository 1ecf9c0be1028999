#include "hook_settings.hpp"
#include "context_store.hpp"
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/directory_structure.hpp>
#include <core/utils.hpp>
#include <managers/state_detector.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>

static void emit_marker_hook(YAML::Emitter& out, const char* event, const char* marker,
                             const std::string& quoted_path) {
    out << YAML::Key << event << YAML::Value << YAML::BeginSeq;
    out << YAML::BeginMap;
    out << YAML::Key << "hooks" << YAML::Value << YAML::BeginSeq;
    out << YAML::BeginMap;
    out << YAML::Key << "type" << YAML::Value << "command";
    out << YAML::Key << "command" << YAML::Value
        << fmt::format("printf '%s' {} >| {}", marker, quoted_path);
    out << YAML::EndMap;
    out << YAML::EndSeq;
    out << YAML::EndMap;
    out << YAML::EndSeq;
}

std::string hook_settings_json(const fs::path& status_file) {
    std::string quoted = shell_quote(status_file.string());

    YAML::Emitter out;
    out.SetMapFormat(YAML::Flow);
    out.SetSeqFormat(YAML::Flow);
    out.SetStringFormat(YAML::DoubleQuoted);

    out << YAML::BeginMap;
    out << YAML::Key << "hooks" << YAML::Value << YAML::BeginMap;
    emit_marker_hook(out, "UserPromptSubmit", MARKER_PROCESSING, quoted);
    emit_marker_hook(out, "Stop", MARKER_PENDING, quoted);
    out << YAML::EndMap;
    out << YAML::EndMap;
    return std::string(out.c_str()) + "\n";
}

Result<fs::path> write_hook_settings(const SessionConfig& config, int agent_id) {
    fs::path path = expert_hooks_path(config, agent_id);
    auto written = write_file_atomic(
        path, hook_settings_json(status_marker_path(config.status_dir(), agent_id)));
    if (written.is_err()) return Result<fs::path>::Err(written.error, written.kind);
    return Result<fs::path>::Ok(path);
}
