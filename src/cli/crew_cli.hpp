#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <filesystem>
#include <core/types.hpp>
#include <core/config.hpp>
#include <managers/command_runner.hpp>

namespace fs = std::filesystem;

// Flags shared by the host commands: [path] [-n N] [-c config] [--clean]
struct HostOptions {
    fs::path project_path;
    std::optional<int> num_experts;
    std::optional<fs::path> config_path;
    bool clean = false;
};

Result<HostOptions> parse_host_args(const std::vector<std::string>& args);

// One method per `crew <command>`. Each returns the process exit code.
class CrewCLI {
public:
    explicit CrewCLI(std::shared_ptr<CommandRunner> runner = nullptr);

    int run_start(const HostOptions& opts);
    int run_launch(const HostOptions& opts);
    int run_tower(const HostOptions& opts);
    int run_down(const HostOptions& opts);
    int run_sessions(const HostOptions& opts);
    int run_status(const HostOptions& opts);
    int run_reset(const std::string& agent, const HostOptions& opts);

    void print_usage() const;
    void print_version() const;

    // Dispatch argv[1..]; unknown commands print usage
    int run_command(const std::string& command, const std::vector<std::string>& args);

private:
    Result<SessionConfig> load_config(const HostOptions& opts) const;

    std::shared_ptr<CommandRunner> runner_;
};
