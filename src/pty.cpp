#include "pty.hpp"
#include "errors.hpp"
#include "subprocess.hpp"

#include <fcntl.h>
#include <sys/ioctl.h>
#include <sys/wait.h>
#include <termios.h>
#include <unistd.h>

#if __APPLE__
#include <util.h>
#elif __FreeBSD__
#include <libutil.h>
#else
#include <pty.h>
#endif

#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>

namespace gptshell {

bool set_window_size(int master_fd, uint16_t rows, uint16_t cols) {
    struct winsize ws{};
    ws.ws_row = rows;
    ws.ws_col = cols;
    return ::ioctl(master_fd, TIOCSWINSZ, &ws) == 0;
}

PtyProcess spawn_pty(const std::vector<std::string>& argv, const PtyOptions& options) {
    if (argv.empty()) {
        throw AgentError(ErrorKind::ExecFailure, "Empty command");
    }

    int exec_pipe[2] = {-1, -1};
    if (::pipe2(exec_pipe, O_CLOEXEC) != 0) {
        throw AgentError(ErrorKind::ExecFailure,
                         std::string("Failed to create pipe: ") + std::strerror(errno));
    }

    // execve arguments are built before fork; the child only makes
    // async-signal-safe calls.
    std::vector<char*> args;
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    auto env_strings = environment_with({"TERM=" + options.term});
    std::vector<char*> envp;
    for (auto& e : env_strings) envp.push_back(&e[0]);
    envp.push_back(nullptr);

    struct winsize ws{};
    ws.ws_row = options.rows;
    ws.ws_col = options.cols;

    int master_fd = -1;
    std::unique_lock<std::mutex> spawn_lock(spawn_mutex());
    pid_t pid = ::forkpty(&master_fd, nullptr, nullptr, &ws);
    if (pid < 0) {
        int saved = errno;
        close_fd(exec_pipe[0]);
        close_fd(exec_pipe[1]);
        throw AgentError(ErrorKind::ExecFailure,
                         std::string("Failed to allocate pty: ") + std::strerror(saved));
    }

    if (pid == 0) {
        ::signal(SIGPIPE, SIG_DFL);
        ::signal(SIGCHLD, SIG_DFL);
        ::execve(args[0], args.data(), envp.data());
        int e = errno;
        (void)!::write(exec_pipe[1], &e, sizeof(e));
        ::_exit(127);
    }

    ::fcntl(master_fd, F_SETFD, FD_CLOEXEC);
    spawn_lock.unlock();
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
        close_fd(master_fd);
        throw AgentError(ErrorKind::ExecFailure,
                         "Failed to execute " + argv[0] + ": " + std::strerror(child_errno));
    }

    PtyProcess proc;
    proc.pid = pid;
    proc.master_fd = master_fd;
    return proc;
}

} // namespace gptshell
