#include "process.hpp"
#include "errors.hpp"
#include "pty.hpp"
#include "subprocess.hpp"
#include "util.hpp"

#include <sys/wait.h>

#include <cerrno>
#include <csignal>
#include <cstring>

namespace gptshell {

const char* mode_name(ProcessMode mode) {
    switch (mode) {
        case ProcessMode::Blocking:    return "blocking";
        case ProcessMode::Detached:    return "detached";
        case ProcessMode::Interactive: return "interactive";
    }
    return "detached";
}

const char* status_name(ProcessStatus status) {
    switch (status) {
        case ProcessStatus::Running: return "running";
        case ProcessStatus::Exited:  return "exited";
        case ProcessStatus::Killed:  return "killed";
    }
    return "running";
}

ProcessRecord::ProcessRecord(std::string id, ProcessMode mode, std::string command,
                             size_t buffer_capacity)
    : id_(std::move(id))
    , mode_(mode)
    , command_(std::move(command))
    , created_at_(epoch_seconds())
    , stdout_(buffer_capacity)
    , stderr_(buffer_capacity)
{}

ProcessRecord::~ProcessRecord() {
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
    close_fd(pty_fd_);
    if (pid_ > 0 && !reaped_) {
        signal_process_group(pid_, SIGKILL);
        int status = 0;
        while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {}
    }
}

void ProcessRecord::attach(pid_t pid, int stdout_fd, int stderr_fd, int pty_fd) {
    std::lock_guard<std::mutex> lock(mutex_);
    pid_ = pid;
    stdout_fd_ = stdout_fd;
    stderr_fd_ = stderr_fd;
    pty_fd_ = pty_fd;
    open_streams_ = (stdout_fd >= 0) + (stderr_fd >= 0) + (pty_fd >= 0);
}

ProcessStatus ProcessRecord::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

bool ProcessRecord::running() const {
    return status() == ProcessStatus::Running;
}

std::optional<int> ProcessRecord::exit_code() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return exit_code_;
}

uint64_t ProcessRecord::finished_at() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return finished_at_;
}

ProcessSnapshot ProcessRecord::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    ProcessSnapshot snap;
    snap.id = id_;
    snap.mode = mode_;
    snap.status = status_;
    snap.exit_code = exit_code_;
    snap.command = command_;
    snap.created_at = created_at_;
    return snap;
}

// ── Lifecycle ────────────────────────────────────────────────────

bool ProcessRecord::try_reap() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (reaped_) return true;
    if (pid_ <= 0) return false;

    int status = 0;
    pid_t r = ::waitpid(pid_, &status, WNOHANG);
    if (r == pid_) {
        reaped_ = true;
        reaped_code_ = decode_wait_status(status);
    } else if (r < 0 && errno == ECHILD) {
        // Collected elsewhere; the status is gone.
        reaped_ = true;
        reaped_code_ = kUnknownExitCode;
    }
    if (reaped_) cv_.notify_all();
    return reaped_;
}

bool ProcessRecord::reaped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reaped_;
}

int ProcessRecord::reaped_exit_code() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reaped_code_;
}

bool ProcessRecord::finish(ProcessStatus terminal, int exit_code) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (status_ != ProcessStatus::Running) return false;
    // A pending kill owns the transition.
    if (terminal == ProcessStatus::Exited && kill_requested_) return false;
    status_ = terminal;
    exit_code_ = exit_code;
    finished_at_ = epoch_seconds();
    cv_.notify_all();
    return true;
}

bool ProcessRecord::begin_kill() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (kill_requested_ || status_ != ProcessStatus::Running) return false;
    kill_requested_ = true;
    return true;
}

void ProcessRecord::wait_terminal() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return status_ != ProcessStatus::Running; });
}

int ProcessRecord::signal_group(int sig) const {
    std::lock_guard<std::mutex> lock(mutex_);
    // After reaping the pid may belong to someone else.
    if (reaped_) return -1;
    return signal_process_group(pid_, sig);
}

// ── PTY input ────────────────────────────────────────────────────

void ProcessRecord::write_input(const std::string& text) {
    std::lock_guard<std::mutex> input_lock(input_mutex_);
    int fd;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (status_ != ProcessStatus::Running || pty_fd_ < 0) {
            throw AgentError(ErrorKind::SessionClosed, "Session " + id_ + " has exited");
        }
        fd = pty_fd_;
    }
    // input_mutex_ keeps the descriptor open while the write is in flight.
    if (!write_all(fd, text.data(), text.size())) {
        int saved = errno;
        if (saved == EIO || saved == EBADF) {
            throw AgentError(ErrorKind::SessionClosed, "Session " + id_ + " has exited");
        }
        throw AgentError(ErrorKind::Internal,
                         std::string("write to pty failed: ") + std::strerror(saved));
    }
}

void ProcessRecord::resize(uint16_t rows, uint16_t cols) {
    std::lock_guard<std::mutex> input_lock(input_mutex_);
    std::lock_guard<std::mutex> lock(mutex_);
    if (status_ != ProcessStatus::Running || pty_fd_ < 0) {
        throw AgentError(ErrorKind::SessionClosed, "Session " + id_ + " has exited");
    }
    if (!set_window_size(pty_fd_, rows, cols)) {
        throw AgentError(ErrorKind::Internal,
                         std::string("TIOCSWINSZ failed: ") + std::strerror(errno));
    }
}

// ── Stream teardown ──────────────────────────────────────────────

int& ProcessRecord::fd_for(Stream stream) {
    switch (stream) {
        case Stream::Stdout: return stdout_fd_;
        case Stream::Stderr: return stderr_fd_;
        case Stream::Pty:    return pty_fd_;
    }
    return stdout_fd_;
}

bool ProcessRecord::close_stream(Stream stream) {
    std::lock_guard<std::mutex> input_lock(input_mutex_);
    std::lock_guard<std::mutex> lock(mutex_);
    int& fd = fd_for(stream);
    if (fd < 0) return false;
    close_fd(fd);
    --open_streams_;
    cv_.notify_all();
    return open_streams_ == 0;
}

void ProcessRecord::wait_drained(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return open_streams_ == 0; });
}

bool ProcessRecord::drained() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_streams_ == 0;
}

} // namespace gptshell
