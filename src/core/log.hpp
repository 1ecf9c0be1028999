#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <core/types.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

// Debug log shared by every thread. The terminal belongs to the renderer,
// so diagnostics only ever go here.
inline std::string crew_log_path() {
    static std::string path = (platform::temp_dir() / "crew_debug.log").string();
    return path;
}

inline void crew_log(const std::string& msg) {
    std::ofstream out(crew_log_path(), std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    out << "[" << ts << "] " << msg << "\n";
}

inline void crew_log_cmd(const std::string& label, const std::string& cmd,
                         const CommandResult& r) {
    crew_log(fmt::format("{} CMD: {}", label, cmd));
    crew_log(fmt::format("{} exit={} stdout({})={}", label, r.exit_code,
                         r.stdout_data.size(), r.stdout_data.substr(0, 300)));
    if (!r.stderr_data.empty())
        crew_log(fmt::format("{} stderr={}", label, r.stderr_data.substr(0, 300)));
}

// Per-operation log with elapsed-time stamps, mirrored into the debug log.
class OperationLog {
public:
    OperationLog(std::filesystem::path path, std::string label)
        : path_(std::move(path)), label_(std::move(label)),
          t0_(std::chrono::steady_clock::now()) {
        std::error_code ec;
        std::filesystem::create_directories(path_.parent_path(), ec);
    }

    void operator()(const std::string& msg) const {
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - t0_).count();
        std::string ts = (ms < 1000) ? fmt::format("{}ms", ms)
                                     : fmt::format("{:.1f}s", ms / 1000.0);
        std::string stamped = fmt::format("[{}] {}", ts, msg);
        std::ofstream f(path_, std::ios::app);
        if (f) {
            f << stamped << "\n";
        }
        crew_log(fmt::format("{}: {}", label_, stamped));
    }

private:
    std::filesystem::path path_;
    std::string label_;
    std::chrono::steady_clock::time_point t0_;
};
