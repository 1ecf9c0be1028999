#include "utils.hpp"
#include "constants.hpp"
#include <openssl/sha.h>
#include <chrono>
#include <ctime>
#include <cctype>
#include <sstream>

std::string now_iso() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    return std::string(buf);
}

int safe_stoi(const std::string& s, int fallback) {
    try {
        size_t pos = 0;
        int v = std::stoi(s, &pos);
        return pos == s.size() ? v : fallback;
    } catch (const std::exception&) {
        return fallback;
    }
}

std::string to_lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
    return lines;
}

std::string truncate_str(const std::string& s, size_t max_chars) {
    // Walk code points, not bytes, so multi-byte glyphs are never split
    size_t chars = 0;
    size_t i = 0;
    size_t cut = std::string::npos;
    while (i < s.size()) {
        if (chars == max_chars) { cut = i; break; }
        unsigned char c = static_cast<unsigned char>(s[i]);
        size_t len = 1;
        if (c >= 0xF0) len = 4;
        else if (c >= 0xE0) len = 3;
        else if (c >= 0xC0) len = 2;
        i += len;
        ++chars;
    }
    if (cut == std::string::npos) return s;
    return s.substr(0, cut) + "...";
}

std::string sanitize_branch_name(const std::string& input) {
    std::string out;
    bool last_dash = false;
    for (unsigned char c : input) {
        if (std::isalnum(c) || c == '_' || c == '.' || c == '/') {
            out += static_cast<char>(std::tolower(c));
            last_dash = false;
        } else if (!last_dash && !out.empty()) {
            out += '-';
            last_dash = true;
        }
    }

    // git rejects "..", a leading '.', '/' or '-', and trailing '.', '/', '-' or ".lock"
    size_t dots;
    while ((dots = out.find("..")) != std::string::npos) out.erase(dots, 1);
    while (!out.empty() && (out.front() == '-' || out.front() == '.' || out.front() == '/'))
        out.erase(0, 1);
    if (out.size() > static_cast<size_t>(MAX_BRANCH_NAME_LEN))
        out.resize(MAX_BRANCH_NAME_LEN);
    while (!out.empty() && (out.back() == '-' || out.back() == '.' || out.back() == '/'))
        out.pop_back();
    if (out.size() >= 5 && out.compare(out.size() - 5, 5, ".lock") == 0)
        out.resize(out.size() - 5);
    return out;
}

std::string shell_quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

std::string sha256_hex(const std::string& data) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest);
    static const char HEX[] = "0123456789abcdef";
    std::string out;
    out.reserve(SHA256_DIGEST_LENGTH * 2);
    for (unsigned char b : digest) {
        out += HEX[b >> 4];
        out += HEX[b & 0x0F];
    }
    return out;
}
