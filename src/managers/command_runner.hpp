#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

// Seam between the process managers and the outside world. Implementations
// must be callable from several threads at once.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    virtual CommandResult run(const std::string& program,
                              const std::vector<std::string>& args,
                              const std::string& cwd = "") = 0;
};

// Forks the real program and logs every invocation.
class SystemCommandRunner : public CommandRunner {
public:
    CommandResult run(const std::string& program,
                      const std::vector<std::string>& args,
                      const std::string& cwd = "") override;
};

std::string format_command_line(const std::string& program,
                                const std::vector<std::string>& args);
