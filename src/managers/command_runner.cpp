#include "command_runner.hpp"
#include <core/log.hpp>
#include <platform/process.hpp>

std::string format_command_line(const std::string& program,
                                const std::vector<std::string>& args) {
    std::string line = program;
    for (const auto& a : args) {
        line += ' ';
        if (a.find_first_of(" \t'\"") != std::string::npos) {
            line += '"' + a + '"';
        } else {
            line += a;
        }
    }
    return line;
}

CommandResult SystemCommandRunner::run(const std::string& program,
                                       const std::vector<std::string>& args,
                                       const std::string& cwd) {
    auto result = platform::run_capture(program, args, cwd);
    crew_log_cmd(program, format_command_line(program, args), result);
    return result;
}
