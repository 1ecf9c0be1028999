#include "process.hpp"

#include <unistd.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>

namespace platform {

// ── helpers ──────────────────────────────────────────────────

static std::vector<const char*> build_argv(const std::string& program,
                                           const std::vector<std::string>& args) {
    std::vector<const char*> argv;
    argv.push_back(program.c_str());
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);
    return argv;
}

static int wait_exit_code(pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return -1;
    }
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

// ── run_capture ──────────────────────────────────────────────

CommandResult run_capture(const std::string& program,
                          const std::vector<std::string>& args,
                          const std::string& cwd) {
    CommandResult result;

    int out_pipe[2];
    int err_pipe[2];
    if (pipe2(out_pipe, O_CLOEXEC) != 0) {
        result.stderr_data = std::string("pipe failed: ") + std::strerror(errno);
        return result;
    }
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        result.stderr_data = std::string("pipe failed: ") + std::strerror(errno);
        close(out_pipe[0]);
        close(out_pipe[1]);
        return result;
    }

    // CLOEXEC keeps these ends out of children forked concurrently by other
    // threads; dup2 below clears the flag on the child's copies.
    // argv is built before fork: no allocation in the child
    auto argv = build_argv(program, args);

    pid_t pid = fork();
    if (pid < 0) {
        result.stderr_data = std::string("fork failed: ") + std::strerror(errno);
        close(out_pipe[0]); close(out_pipe[1]);
        close(err_pipe[0]); close(err_pipe[1]);
        return result;
    }

    if (pid == 0) {
        // Child process
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        close(out_pipe[0]); close(out_pipe[1]);
        close(err_pipe[0]); close(err_pipe[1]);

        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            const char msg[] = "cannot change directory\n";
            (void)!write(STDERR_FILENO, msg, sizeof(msg) - 1);
            _exit(127);
        }

        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        const char msg[] = "exec failed\n";
        (void)!write(STDERR_FILENO, msg, sizeof(msg) - 1);
        _exit(127);
    }

    // Parent: drain both pipes until EOF so neither side can fill and block
    close(out_pipe[1]);
    close(err_pipe[1]);

    struct pollfd fds[2] = {
        {out_pipe[0], POLLIN, 0},
        {err_pipe[0], POLLIN, 0},
    };
    std::string* sinks[2] = {&result.stdout_data, &result.stderr_data};
    int open_fds = 2;
    char buf[4096];

    while (open_fds > 0) {
        int rc = poll(fds, 2, -1);
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0) continue;
            if (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) {
                ssize_t n = read(fds[i].fd, buf, sizeof(buf));
                if (n > 0) {
                    sinks[i]->append(buf, static_cast<size_t>(n));
                } else if (n == 0 || errno != EINTR) {
                    close(fds[i].fd);
                    fds[i].fd = -1;
                    --open_fds;
                }
            }
        }
    }
    for (auto& f : fds) {
        if (f.fd >= 0) close(f.fd);
    }

    result.exit_code = wait_exit_code(pid);
    if (result.exit_code == 127 && result.stderr_data == "exec failed\n") {
        result.stderr_data = program + ": command not found";
    }
    return result;
}

} // namespace platform
