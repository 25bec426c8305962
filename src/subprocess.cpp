#include "subprocess.hpp"
#include "errors.hpp"

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstring>

extern char** environ;

namespace gptshell {

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

bool write_all(int fd, const char* data, size_t len) {
    while (len > 0) {
        ssize_t n = ::write(fd, data, len);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                struct pollfd pfd{fd, POLLOUT, 0};
                ::poll(&pfd, 1, 100);
                continue;
            }
            return false;
        }
        data += n;
        len -= static_cast<size_t>(n);
    }
    return true;
}

int decode_wait_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return -WTERMSIG(status);
    return kUnknownExitCode;
}

int signal_process_group(pid_t pid, int sig) {
    if (pid <= 0) return -1;
    if (::kill(-pid, sig) == 0) return 0;
    return ::kill(pid, sig);
}

std::vector<std::string> environment_with(const std::vector<std::string>& overrides) {
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        std::string name = entry.substr(0, eq);
        bool replaced = false;
        for (const auto& o : overrides) {
            if (o.compare(0, name.size() + 1, name + "=") == 0) {
                replaced = true;
                break;
            }
        }
        if (!replaced) env.push_back(std::move(entry));
    }
    for (const auto& o : overrides) env.push_back(o);
    return env;
}

// ── Spawning ─────────────────────────────────────────────────────

std::mutex& spawn_mutex() {
    static std::mutex mutex;
    return mutex;
}

static void close_pair(int p[2]) {
    close_fd(p[0]);
    close_fd(p[1]);
}

SpawnedProcess spawn_shell_command(const std::string& shell,
                                   const std::string& command,
                                   bool with_stdin) {
    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};  // child reports exec errno, closed by exec on success

    auto cleanup = [&]() {
        close_pair(in_pipe);
        close_pair(out_pipe);
        close_pair(err_pipe);
        close_pair(exec_pipe);
    };

    if ((with_stdin && ::pipe2(in_pipe, O_CLOEXEC) != 0) ||
        ::pipe2(out_pipe, O_CLOEXEC) != 0 ||
        ::pipe2(err_pipe, O_CLOEXEC) != 0 ||
        ::pipe2(exec_pipe, O_CLOEXEC) != 0) {
        int saved = errno;
        cleanup();
        throw AgentError(ErrorKind::ExecFailure,
                         std::string("Failed to create pipes: ") + std::strerror(saved));
    }

    // Everything the child touches is prepared before fork.
    const char* argv[] = {shell.c_str(), "-c", command.c_str(), nullptr};

    std::unique_lock<std::mutex> spawn_lock(spawn_mutex());
    pid_t pid = ::fork();
    if (pid < 0) {
        int saved = errno;
        cleanup();
        throw AgentError(ErrorKind::ExecFailure,
                         std::string("Failed to fork process: ") + std::strerror(saved));
    }

    if (pid == 0) {
        // Child: own session so the whole group can be signalled.
        ::setsid();
        ::signal(SIGPIPE, SIG_DFL);
        ::signal(SIGCHLD, SIG_DFL);

        int stdin_src = with_stdin ? in_pipe[0] : ::open("/dev/null", O_RDONLY);
        if (stdin_src < 0 ||
            ::dup2(stdin_src, STDIN_FILENO) < 0 ||
            ::dup2(out_pipe[1], STDOUT_FILENO) < 0 ||
            ::dup2(err_pipe[1], STDERR_FILENO) < 0) {
            int e = errno;
            (void)!::write(exec_pipe[1], &e, sizeof(e));
            ::_exit(127);
        }
        ::execv(shell.c_str(), const_cast<char* const*>(argv));
        int e = errno;
        (void)!::write(exec_pipe[1], &e, sizeof(e));
        ::_exit(127);
    }

    // Parent
    spawn_lock.unlock();
    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        cleanup();
        throw AgentError(ErrorKind::ExecFailure,
                         "Failed to execute " + shell + ": " + std::strerror(child_errno));
    }

    SpawnedProcess proc;
    proc.pid = pid;
    proc.stdin_fd = in_pipe[1];
    proc.stdout_fd = out_pipe[0];
    proc.stderr_fd = err_pipe[0];
    return proc;
}

// ── Blocking collection ──────────────────────────────────────────

static void read_into(int& fd, std::string& sink) {
    char buf[4096];
    ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n > 0) {
        sink.append(buf, static_cast<size_t>(n));
    } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
        close_fd(fd);
    }
}

int collect_output(SpawnedProcess& proc, const std::string& input,
                   std::string& out, std::string& err) {
    size_t written = 0;
    if (proc.stdin_fd >= 0) {
        if (input.empty()) {
            close_fd(proc.stdin_fd);
        } else {
            int flags = ::fcntl(proc.stdin_fd, F_GETFL, 0);
            ::fcntl(proc.stdin_fd, F_SETFL, flags | O_NONBLOCK);
        }
    }

    bool poll_failed = false;
    int poll_errno = 0;
    while (proc.stdout_fd >= 0 || proc.stderr_fd >= 0) {
        struct pollfd fds[3];
        int* owners[3];
        nfds_t count = 0;
        for (int* fd : {&proc.stdout_fd, &proc.stderr_fd}) {
            if (*fd < 0) continue;
            fds[count] = {*fd, POLLIN, 0};
            owners[count++] = fd;
        }
        if (proc.stdin_fd >= 0) {
            fds[count] = {proc.stdin_fd, POLLOUT, 0};
            owners[count++] = &proc.stdin_fd;
        }

        int ret = ::poll(fds, count, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            poll_failed = true;
            poll_errno = errno;
            break;
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0) continue;
            if (owners[i] == &proc.stdin_fd) {
                ssize_t n = ::write(proc.stdin_fd, input.data() + written,
                                    input.size() - written);
                if (n > 0) {
                    written += static_cast<size_t>(n);
                    if (written == input.size()) close_fd(proc.stdin_fd);
                } else if (n < 0 && errno != EINTR && errno != EAGAIN) {
                    close_fd(proc.stdin_fd);  // child stopped reading
                }
            } else {
                read_into(*owners[i], owners[i] == &proc.stdout_fd ? out : err);
            }
        }
    }

    close_fd(proc.stdin_fd);
    close_fd(proc.stdout_fd);
    close_fd(proc.stderr_fd);

    if (poll_failed) {
        signal_process_group(proc.pid, SIGKILL);
    }

    int status = 0;
    pid_t reaped;
    do {
        reaped = ::waitpid(proc.pid, &status, 0);
    } while (reaped < 0 && errno == EINTR);

    if (poll_failed) {
        throw AgentError(ErrorKind::Internal,
                         std::string("poll failed: ") + std::strerror(poll_errno));
    }
    return reaped == proc.pid ? decode_wait_status(status) : kUnknownExitCode;
}

} // namespace gptshell
