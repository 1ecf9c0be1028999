#pragma once

#include <string>
#include <optional>
#include <vector>

// Broad failure categories. Callers branch on these, never on message text.
enum class ErrorKind {
    None,
    Infrastructure,         // bootstrap-level, fatal
    GuardRejected,          // resource already has an operation in flight
    ExternalCommandFailed,  // git/tmux/agent exited non-zero
    StaleResourceState,     // on-disk state disagrees with git's view
    Io,
    InvalidInput,
};

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorKind::None};
    }

    static Result<T> Err(const std::string& err,
                         ErrorKind kind = ErrorKind::Infrastructure) {
        return {false, T{}, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<void> Ok() {
        return {true, "", ErrorKind::None};
    }

    static Result<void> Err(const std::string& err,
                            ErrorKind kind = ErrorKind::Infrastructure) {
        return {false, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Outcome of one external command (tmux, git, ...)
struct CommandResult {
    int exit_code = -1;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }
};

// "<context>: <program> exited with <code>: <stderr>"
std::string describe_failure(const std::string& context,
                             const std::string& program,
                             const CommandResult& r);

// Agent status as observed on a single tick. Never persisted.
enum class AgentStatus {
    Pending,    // no process or marker yet
    Starting,   // launched, not ready
    Ready,      // idle at its prompt
    Busy,       // working on an instruction
    Stuck,      // busy for too long with no visible activity
    Unknown,    // observations disagree or could not be read
};

const char* agent_status_name(AgentStatus status);

// Static identity of one agent in a session
struct ExpertInfo {
    int id = 0;
    std::string name;
    std::string role;
};
