#include "role_instructions.hpp"
#include <core/config.hpp>
#include <core/log.hpp>
#include <fstream>
#include <set>
#include <sstream>

RoleInstructions::RoleInstructions(std::vector<fs::path> search_dirs)
    : search_dirs_(std::move(search_dirs)) {}

RoleInstructions RoleInstructions::for_session(const SessionConfig& config) {
    return RoleInstructions({get_config_dir() / "instructions",
                             config.project_path() / "instructions"});
}

static bool valid_role_name(const std::string& role) {
    if (role.empty() || role == "." || role == "..") return false;
    return role.find('/') == std::string::npos && role.find('\\') == std::string::npos;
}

static bool read_file(const fs::path& path, std::string& out) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) return false;
    std::ifstream in(path);
    if (!in) return false;
    std::stringstream ss;
    ss << in.rdbuf();
    out = ss.str();
    return true;
}

std::string RoleInstructions::load(const std::string& role) const {
    std::string text;
    if (valid_role_name(role)) {
        for (const auto& dir : search_dirs_) {
            if (read_file(dir / (role + ".md"), text)) return text;
        }
    }
    for (const auto& dir : search_dirs_) {
        if (read_file(dir / "general.md", text)) return text;
    }
    crew_log("role_instructions: nothing found for role '" + role + "'");
    return "";
}

std::vector<std::string> RoleInstructions::available_roles() const {
    std::set<std::string> roles;
    for (const auto& dir : search_dirs_) {
        std::error_code ec;
        if (!fs::is_directory(dir, ec)) continue;
        for (const auto& entry : fs::directory_iterator(dir, ec)) {
            if (entry.path().extension() == ".md") {
                roles.insert(entry.path().stem().string());
            }
        }
    }
    return {roles.begin(), roles.end()};
}
