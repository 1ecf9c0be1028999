#pragma once

#include <string>
#include <core/types.hpp>
#include <core/config.hpp>
#include "launch_operation.hpp"

// Records the assignment as a shared decision, then types the task into the
// agent's pane. Blocks while typing: run it on a background thread.
// Returns the message for the control loop.
Result<std::string> run_task_assignment(const SessionConfig& config, const LaunchDeps& deps,
                                        int agent_id, const std::string& task);

// "Task for architect"
std::string task_label(const SessionConfig& config, int agent_id);
