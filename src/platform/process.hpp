#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

namespace platform {

// Run a program to completion and collect stdout and stderr.
// cwd: if non-empty, the child chdirs there before exec.
// A program that cannot be started yields exit_code 127 and an stderr message.
CommandResult run_capture(const std::string& program,
                          const std::vector<std::string>& args,
                          const std::string& cwd = "");

} // namespace platform
