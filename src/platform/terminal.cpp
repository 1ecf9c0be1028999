#include "terminal.hpp"

#include <sys/ioctl.h>
#include <unistd.h>
#include <poll.h>

namespace platform {

// ── Terminal width ───────────────────────────────────────────

int term_width() {
    struct winsize ws;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0)
        return ws.ws_col;
    return 80;
}

// ── poll_stdin ───────────────────────────────────────────────

bool poll_stdin(int timeout_ms) {
    struct pollfd pfd = {STDIN_FILENO, POLLIN, 0};
    return poll(&pfd, 1, timeout_ms) > 0 && (pfd.revents & (POLLIN | POLLHUP));
}

} // namespace platform
