#pragma once

namespace platform {

// Terminal width in columns, 80 when unknown.
int term_width();

// Poll stdin for input readability with a timeout.
// Returns true if stdin has data to read.
bool poll_stdin(int timeout_ms);

} // namespace platform
