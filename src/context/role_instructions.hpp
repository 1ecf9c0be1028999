#pragma once

#include <string>
#include <vector>
#include <filesystem>

namespace fs = std::filesystem;

class SessionConfig;

// Looks up <dir>/<role>.md across the search dirs, then <dir>/general.md.
// Nothing found means an empty instruction.
class RoleInstructions {
public:
    explicit RoleInstructions(std::vector<fs::path> search_dirs);

    // <config dir>/instructions, then <project>/instructions
    static RoleInstructions for_session(const SessionConfig& config);

    std::string load(const std::string& role) const;

    // Role names found in any search dir
    std::vector<std::string> available_roles() const;

private:
    std::vector<fs::path> search_dirs_;
};
