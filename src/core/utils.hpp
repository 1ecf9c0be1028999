#pragma once

#include <string>
#include <vector>

// Generate an ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS) for the current local time.
std::string now_iso();

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

std::string to_lower(std::string s);

std::vector<std::string> split_lines(const std::string& text);

// Cut to max_chars characters (UTF-8 aware), appending "..." when cut.
std::string truncate_str(const std::string& s, size_t max_chars);

// Turn free text ("Add Login Page!") into a git-safe branch ("add-login-page").
// Returns "" if nothing usable remains.
std::string sanitize_branch_name(const std::string& input);

// Single-quote for /bin/sh.
std::string shell_quote(const std::string& s);

// Lowercase hex SHA-256 digest of data.
std::string sha256_hex(const std::string& data);
