#pragma once
#include <mutex>
#include <string>
#include <vector>
#include <cstddef>
#include <sys/types.h>

namespace gptshell {

// Reported when the OS gives no usable exit status.
constexpr int kUnknownExitCode = -1;

struct SpawnedProcess {
    pid_t pid = -1;
    int stdin_fd = -1;   // -1 when the child reads /dev/null
    int stdout_fd = -1;
    int stderr_fd = -1;
};

// Held across every fork. A descriptor that only becomes close-on-exec after
// its fork returns (the forkpty master) cannot leak into a sibling spawn.
std::mutex& spawn_mutex();

// Fork `shell -c command` as the leader of a new session and process group,
// with stdout and stderr on separate pipes. With with_stdin the child's stdin
// is a pipe, otherwise /dev/null. Every parent-side descriptor is close-on-exec.
// Throws AgentError(ExecFailure) if the pipes, fork or exec fail.
SpawnedProcess spawn_shell_command(const std::string& shell,
                                   const std::string& command,
                                   bool with_stdin);

// Feed `input` to the child's stdin (then close it) while collecting stdout
// and stderr until both reach end-of-file, then reap the child. Closes every
// descriptor in `proc` and returns the exit code.
int collect_output(SpawnedProcess& proc, const std::string& input,
                   std::string& out, std::string& err);

// Exit status for a normal exit, -signal for death by signal.
int decode_wait_status(int status);

// Signal the process group led by pid; falls back to the pid alone.
int signal_process_group(pid_t pid, int sig);

// Write everything, retrying on EINTR/EAGAIN. Returns false on a hard error.
bool write_all(int fd, const char* data, size_t len);

void close_fd(int& fd);

// Build a NULL-terminated execve environment from the current one with the
// given NAME=value entries replacing any existing NAME.
std::vector<std::string> environment_with(const std::vector<std::string>& overrides);

} // namespace gptshell
