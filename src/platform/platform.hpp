#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME, falling back to the temp dir).
std::filesystem::path home_dir();

// Returns $XDG_CONFIG_HOME, or ~/.config when unset.
std::filesystem::path config_home();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Reads an environment variable; empty when unset.
std::string get_env(const std::string& name);

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
