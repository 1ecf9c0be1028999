#include "task_assignment.hpp"
#include <core/constants.hpp>
#include <core/directory_structure.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

std::string task_label(const SessionConfig& config, int agent_id) {
    auto info = config.expert(agent_id);
    return "Task for " + (info ? info->name : fmt::format("expert{}", agent_id));
}

Result<std::string> run_task_assignment(const SessionConfig& config, const LaunchDeps& deps,
                                        int agent_id, const std::string& task) {
    auto info = config.expert(agent_id);
    if (!info) {
        return Result<std::string>::Err(fmt::format("No agent with id {}", agent_id),
                                        ErrorKind::InvalidInput);
    }
    if (task.empty()) {
        return Result<std::string>::Err("Task description is empty", ErrorKind::InvalidInput);
    }

    OperationLog log(expert_log_path(config, agent_id), fmt::format("expert{}", agent_id));
    log(fmt::format("{} started ({} bytes)", task_label(config, agent_id), task.size()));

    Decision d = make_decision(agent_id, "Task Assignment to " + info->name,
                               "Assigned: " + truncate_str(task, TASK_DECISION_PREVIEW_LEN), "");
    d.affects_experts = {agent_id};
    auto recorded = deps.store->add_decision(config.session_hash(), d);
    std::string note;
    if (recorded.is_err()) {
        log("Decision not recorded: " + recorded.error);
        note = " (not recorded: " + recorded.error + ")";
    }

    auto sent = deps.agents->send_instruction(agent_id, task);
    if (sent.is_err()) {
        log("Send failed: " + sent.error);
        return Result<std::string>::Err(sent.error, sent.kind);
    }

    log("Task sent");
    return Result<std::string>::Ok(fmt::format("Task sent to {}{}", info->name, note));
}
