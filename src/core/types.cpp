#include "types.hpp"
#include "utils.hpp"
#include <fmt/format.h>

std::string describe_failure(const std::string& context,
                             const std::string& program,
                             const CommandResult& r) {
    std::string err = r.stderr_data;
    trim(err);
    if (err.empty()) {
        return fmt::format("{}: {} exited with {}", context, program, r.exit_code);
    }
    return fmt::format("{}: {} exited with {}: {}", context, program, r.exit_code, err);
}

const char* agent_status_name(AgentStatus status) {
    switch (status) {
        case AgentStatus::Pending:  return "pending";
        case AgentStatus::Starting: return "starting";
        case AgentStatus::Ready:    return "ready";
        case AgentStatus::Busy:     return "busy";
        case AgentStatus::Stuck:    return "stuck";
        case AgentStatus::Unknown:  return "unknown";
    }
    return "unknown";
}
