#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <sys/types.h>

namespace gptshell {

struct PtyProcess {
    pid_t pid = -1;
    int master_fd = -1;  // close-on-exec, blocking
};

struct PtyOptions {
    std::string term = "dumb";
    uint16_t rows = 24;
    uint16_t cols = 80;
};

// Allocate a pseudo-terminal and exec argv[0] with the slave as its
// controlling terminal (new session, stdio on the slave).
// Throws AgentError(ExecFailure) if the PTY, fork or exec fail.
PtyProcess spawn_pty(const std::vector<std::string>& argv, const PtyOptions& options);

// Apply a window size to the PTY (TIOCSWINSZ). Returns false on failure.
bool set_window_size(int master_fd, uint16_t rows, uint16_t cols);

} // namespace gptshell
