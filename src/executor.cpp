#include "executor.hpp"
#include "errors.hpp"
#include "pty.hpp"
#include "subprocess.hpp"
#include "util.hpp"

#include <poll.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <cstring>
#include <iostream>
#include <mutex>
#include <system_error>
#include <thread>

namespace gptshell {

namespace {

constexpr int kDrainSliceMs = 100;
constexpr auto kReapSlice = std::chrono::milliseconds(20);
constexpr auto kPostExitDrain = std::chrono::milliseconds(200);
constexpr auto kDrainWait = std::chrono::milliseconds(1000);
constexpr auto kShutdownWait = std::chrono::milliseconds(5000);

const char* stream_label(Stream stream) {
    switch (stream) {
        case Stream::Stdout: return "stdout";
        case Stream::Stderr: return "stderr";
        case Stream::Pty:    return "pty";
    }
    return "stdout";
}

void echo_chunk(const char* label, const std::string& id, const std::string& chunk) {
    std::string text = trim(chunk);
    if (text.empty()) return;
    // One write per chunk so concurrent sessions don't interleave mid-line.
    std::string line = "[" + std::string(label) + " " + id.substr(0, 8) + "] " + text + "\n";
    std::cerr << line << std::flush;
}

// Read fd into the record's buffer until end-of-file, or until the child has
// been reaped and the pipe runs dry (a grandchild may still hold the write
// end). Output that keeps coming after the exit is read for kPostExitDrain.
void drain_stream(ProcessRecord& rec, int fd, Stream stream, bool echo) {
    OutputBuffer& buf = (stream == Stream::Stderr) ? rec.stderr_buffer() : rec.stdout_buffer();
    std::array<char, 4096> chunk;
    bool exited = false;
    auto deadline = std::chrono::steady_clock::time_point::max();

    while (true) {
        if (!exited && rec.try_reap()) {
            exited = true;
            deadline = std::chrono::steady_clock::now() + kPostExitDrain;
        }
        if (exited && std::chrono::steady_clock::now() >= deadline) break;

        struct pollfd pfd{fd, POLLIN, 0};
        int ret = ::poll(&pfd, 1, exited ? 0 : kDrainSliceMs);
        if (ret < 0) {
            if (errno == EINTR) continue;
            throw std::system_error(errno, std::generic_category(), "poll");
        }
        if (ret == 0) {
            if (exited) break;
            continue;
        }

        ssize_t n = ::read(fd, chunk.data(), chunk.size());
        if (n > 0) {
            buf.append(chunk.data(), static_cast<size_t>(n));
            if (echo) {
                echo_chunk(stream_label(stream), rec.id(),
                           std::string(chunk.data(), static_cast<size_t>(n)));
            }
            continue;
        }
        if (n == 0) break;
        if (errno == EINTR || errno == EAGAIN) continue;
        if (errno == EIO) break;  // PTY: slave side fully closed
        throw std::system_error(errno, std::generic_category(), "read");
    }
}

// Last stream closed: collect the child and record the natural exit.
void finalize_record(ProcessRecord& rec) {
    // The child may have closed its output early and still be running.
    while (!rec.try_reap()) {
        std::this_thread::sleep_for(kReapSlice);
    }
    int code = rec.reaped_exit_code();
    if (rec.finish(ProcessStatus::Exited, code)) {
        std::cerr << "[drain] " << rec.id() << " exited with code " << code << "\n";
    }
}

// Drain fault: never leave the record RUNNING with a dead reader.
void abort_record(ProcessRecord& rec, const std::string& what) {
    std::cerr << "[drain] " << rec.id() << " failed: " << what << "\n";
    rec.signal_group(SIGKILL);
    rec.finish(ProcessStatus::Killed, kUnknownExitCode);
}

bool wait_reaped(ProcessRecord& rec, std::chrono::milliseconds budget) {
    auto deadline = std::chrono::steady_clock::now() + budget;
    while (!rec.try_reap()) {
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(kReapSlice);
    }
    return true;
}

} // namespace

// Counts live drain threads so the engine can outlast them on shutdown.
struct DrainTracker {
    std::mutex mutex;
    std::condition_variable cv;
    size_t active = 0;

    void enter() {
        std::lock_guard<std::mutex> lock(mutex);
        ++active;
    }
    void leave() {
        std::lock_guard<std::mutex> lock(mutex);
        --active;
        cv.notify_all();
    }
    bool wait_idle(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, timeout, [this] { return active == 0; });
    }
};

ExecutionEngine::ExecutionEngine(SessionTable& table, ExecConfig config,
                                 CommandApprover approver)
    : table_(table)
    , config_(std::move(config))
    , approver_(std::move(approver))
    , drains_(std::make_shared<DrainTracker>())
{
    // Writes to a child that stopped reading must fail with EPIPE, not kill us.
    std::signal(SIGPIPE, SIG_IGN);
}

ExecutionEngine::~ExecutionEngine() {
    shutdown();
    if (!drains_->wait_idle(kShutdownWait)) {
        std::cerr << "[server] drain threads still running\n";
    }
}

void ExecutionEngine::approve(const std::string& command) const {
    if (approver_ && !approver_(command)) {
        throw AgentError(ErrorKind::Rejected, "Command rejected by operator: " + command);
    }
}

std::shared_ptr<ProcessRecord> ExecutionEngine::lookup(const std::string& id,
                                                       ProcessMode mode) const {
    auto rec = table_.find(id);
    if (!rec || rec->mode() != mode) {
        const char* what = mode == ProcessMode::Interactive ? "Session" : "Process";
        throw AgentError(ErrorKind::NotFound, std::string(what) + " not found: " + id);
    }
    return rec;
}

std::shared_ptr<ProcessRecord> ExecutionEngine::make_record(ProcessMode mode,
                                                            const std::string& command) {
    return std::make_shared<ProcessRecord>(generate_uuid(), mode, command,
                                           config_.max_buffer_bytes);
}

void ExecutionEngine::launch_drain(const std::shared_ptr<ProcessRecord>& rec, int fd,
                                   Stream stream) {
    drains_->enter();
    auto tracker = drains_;
    bool echo = config_.echo_output;
    try {
        std::thread([rec, fd, stream, echo, tracker]() {
            try {
                drain_stream(*rec, fd, stream, echo);
            } catch (const std::exception& e) {
                abort_record(*rec, e.what());
            }
            if (rec->close_stream(stream)) {
                finalize_record(*rec);
            }
            tracker->leave();
        }).detach();
    } catch (const std::system_error& e) {
        drains_->leave();
        abort_record(*rec, e.what());
        if (rec->close_stream(stream)) {
            finalize_record(*rec);
        }
        throw AgentError(ErrorKind::Internal,
                         std::string("Failed to start drain thread: ") + e.what());
    }
}

// The writer owns fd and closes it when done, so the child sees EOF.
void ExecutionEngine::feed_stdin(const std::string& id, int fd, std::string data) {
    drains_->enter();
    auto tracker = drains_;
    try {
        std::thread([id, fd, data = std::move(data), tracker]() mutable {
            if (!write_all(fd, data.data(), data.size())) {
                int saved = errno;
                // EPIPE: the child exited or closed stdin without reading it all.
                if (saved != EPIPE) {
                    std::cerr << "[start] " << id << ": stdin write failed: "
                              << std::strerror(saved) << "\n";
                }
            }
            close_fd(fd);
            tracker->leave();
        }).detach();
    } catch (const std::system_error& e) {
        drains_->leave();
        close_fd(fd);
        std::cerr << "[start] " << id << ": stdin writer not started: " << e.what() << "\n";
    }
}

// ── Blocking mode ────────────────────────────────────────────────

void ExecutionEngine::track_blocking(pid_t pid) {
    std::lock_guard<std::mutex> lock(blocking_mutex_);
    blocking_pids_.insert(pid);
    if (stopping_) signal_process_group(pid, SIGKILL);
}

void ExecutionEngine::untrack_blocking(pid_t pid) {
    std::lock_guard<std::mutex> lock(blocking_mutex_);
    blocking_pids_.erase(pid);
    blocking_cv_.notify_all();
}

void ExecutionEngine::stop_blocking_runs() {
    std::unique_lock<std::mutex> lock(blocking_mutex_);
    stopping_ = true;
    if (blocking_pids_.empty()) return;

    std::cerr << "[run] terminating " << blocking_pids_.size() << " blocking run(s)\n";
    for (pid_t pid : blocking_pids_) signal_process_group(pid, SIGTERM);

    auto grace = std::chrono::milliseconds(config_.kill_grace_ms);
    if (!blocking_cv_.wait_for(lock, grace, [this] { return blocking_pids_.empty(); })) {
        for (pid_t pid : blocking_pids_) signal_process_group(pid, SIGKILL);
    }
}

RunResult ExecutionEngine::run_blocking(const std::string& command,
                                        const std::optional<std::string>& stdin_data) {
    std::string cmd = trim(command);
    if (cmd.empty()) throw AgentError(ErrorKind::ExecFailure, "Empty command");
    approve(cmd);

    std::cerr << "[run] " << cmd << "\n";

    bool has_stdin = stdin_data && !stdin_data->empty();
    SpawnedProcess proc = spawn_shell_command(config_.shell, cmd, has_stdin);
    pid_t pid = proc.pid;
    track_blocking(pid);

    RunResult result;
    try {
        result.exit_code = collect_output(proc, has_stdin ? *stdin_data : std::string(),
                                          result.stdout_data, result.stderr_data);
    } catch (const AgentError&) {
        untrack_blocking(pid);
        throw;
    }
    untrack_blocking(pid);

    if (config_.echo_output) {
        echo_chunk("stdout", "run", result.stdout_data);
        echo_chunk("stderr", "run", result.stderr_data);
    }
    std::cerr << "[run] exit code " << result.exit_code << "\n";
    return result;
}

// ── Detached mode ────────────────────────────────────────────────

std::string ExecutionEngine::start_detached(const std::string& command,
                                            const std::optional<std::string>& stdin_data) {
    std::string cmd = trim(command);
    if (cmd.empty()) throw AgentError(ErrorKind::ExecFailure, "Empty command");
    approve(cmd);

    bool has_stdin = stdin_data && !stdin_data->empty();
    auto rec = make_record(ProcessMode::Detached, cmd);
    SpawnedProcess proc = spawn_shell_command(config_.shell, cmd, has_stdin);
    rec->attach(proc.pid, proc.stdout_fd, proc.stderr_fd, -1);

    std::cerr << "[start] " << rec->id() << ": " << cmd << "\n";

    table_.insert(rec);
    try {
        launch_drain(rec, proc.stdout_fd, Stream::Stdout);
    } catch (const AgentError&) {
        close_fd(proc.stdin_fd);
        // No reader will ever own stderr.
        if (rec->close_stream(Stream::Stderr)) finalize_record(*rec);
        throw;
    }
    try {
        // On failure the running stdout drain finalizes the aborted record.
        launch_drain(rec, proc.stderr_fd, Stream::Stderr);
    } catch (const AgentError&) {
        close_fd(proc.stdin_fd);
        throw;
    }

    // Written only once both readers run: a child echoing its input would
    // otherwise fill its output pipe and stall the write.
    if (proc.stdin_fd >= 0) {
        feed_stdin(rec->id(), proc.stdin_fd, *stdin_data);
    }
    return rec->id();
}

OutputDelta ExecutionEngine::get_output(const std::string& id) {
    auto rec = lookup(id, ProcessMode::Detached);
    // Status first: once it reads terminal, every byte is already buffered.
    auto snap = rec->snapshot();
    OutputDelta delta;
    delta.running = snap.status == ProcessStatus::Running;
    delta.exit_code = snap.exit_code;
    delta.stdout_data = rec->stdout_buffer().drain();
    delta.stderr_data = rec->stderr_buffer().drain();
    delta.stdout_next_offset = rec->stdout_buffer().cursor();
    delta.stderr_next_offset = rec->stderr_buffer().cursor();
    return delta;
}

OutputDelta ExecutionEngine::get_output_from(const std::string& id,
                                             uint64_t stdout_offset,
                                             uint64_t stderr_offset) {
    auto rec = lookup(id, ProcessMode::Detached);
    auto snap = rec->snapshot();
    OutputDelta delta;
    delta.running = snap.status == ProcessStatus::Running;
    delta.exit_code = snap.exit_code;

    auto out = rec->stdout_buffer().read_from(stdout_offset);
    auto err = rec->stderr_buffer().read_from(stderr_offset);
    delta.stdout_data = out.dropped ? truncation_marker(out.dropped) + out.data : out.data;
    delta.stderr_data = err.dropped ? truncation_marker(err.dropped) + err.data : err.data;
    delta.stdout_next_offset = out.next_offset;
    delta.stderr_next_offset = err.next_offset;
    return delta;
}

KillResult ExecutionEngine::kill(const std::string& id) {
    auto rec = lookup(id, ProcessMode::Detached);
    return kill_record(*rec);
}

KillResult ExecutionEngine::kill_record(ProcessRecord& rec) {
    const std::string terminated = "Process " + rec.id() + " terminated.";

    if (!rec.begin_kill()) {
        // Either already final, or another caller is mid-kill.
        bool in_flight = rec.running();
        rec.wait_terminal();
        return {in_flight ? terminated : "Process " + rec.id() + " already exited.",
                rec.exit_code()};
    }

    std::cerr << "[kill] " << rec.id() << "\n";
    auto grace = std::chrono::milliseconds(config_.kill_grace_ms);

    rec.signal_group(SIGTERM);
    if (rec.mode() == ProcessMode::Interactive) {
        // Interactive shells ignore SIGTERM.
        rec.signal_group(SIGHUP);
    }

    if (!wait_reaped(rec, grace)) {
        std::cerr << "[kill] " << rec.id() << " ignored SIGTERM, sending SIGKILL\n";
        rec.signal_group(SIGKILL);
        if (!wait_reaped(rec, grace)) {
            std::cerr << "[kill] " << rec.id() << " could not be collected\n";
        }
    }

    // Drains stop shortly after the reap; the terminal status must not be
    // visible before their last bytes are buffered.
    rec.wait_drained(kDrainWait);
    int code = rec.reaped() ? rec.reaped_exit_code() : kUnknownExitCode;
    rec.finish(ProcessStatus::Killed, code);
    return {terminated, rec.exit_code()};
}

// ── Interactive mode ─────────────────────────────────────────────

std::string ExecutionEngine::interactive_start(const std::string& cmd) {
    std::vector<std::string> argv;
    std::string command = trim(cmd);
    if (command.empty()) {
        command = resolve_interactive_shell(config_);
        argv = {command, "-i"};
    } else {
        argv = {config_.shell, "-c", command};
    }
    approve(command);

    PtyOptions opts;
    opts.term = config_.term;
    opts.rows = config_.pty_rows;
    opts.cols = config_.pty_cols;

    auto rec = make_record(ProcessMode::Interactive, command);
    PtyProcess proc = spawn_pty(argv, opts);
    rec->attach(proc.pid, -1, -1, proc.master_fd);

    std::cerr << "[interactive] " << rec->id() << ": " << command << "\n";

    table_.insert(rec);
    launch_drain(rec, proc.master_fd, Stream::Pty);
    return rec->id();
}

InteractiveDelta ExecutionEngine::interactive_output(const std::string& id) {
    auto rec = lookup(id, ProcessMode::Interactive);
    auto snap = rec->snapshot();
    InteractiveDelta delta;
    delta.running = snap.status == ProcessStatus::Running;
    delta.exit_code = snap.exit_code;
    delta.output = rec->output().drain();
    delta.next_offset = rec->output().cursor();
    return delta;
}

InteractiveDelta ExecutionEngine::interactive_output_from(const std::string& id,
                                                          uint64_t offset) {
    auto rec = lookup(id, ProcessMode::Interactive);
    auto snap = rec->snapshot();
    InteractiveDelta delta;
    delta.running = snap.status == ProcessStatus::Running;
    delta.exit_code = snap.exit_code;
    auto chunk = rec->output().read_from(offset);
    delta.output = chunk.dropped ? truncation_marker(chunk.dropped) + chunk.data : chunk.data;
    delta.next_offset = chunk.next_offset;
    return delta;
}

void ExecutionEngine::interactive_input(const std::string& id, const std::string& text) {
    auto rec = lookup(id, ProcessMode::Interactive);
    rec->write_input(text);
}

void ExecutionEngine::interactive_resize(const std::string& id, uint16_t rows, uint16_t cols) {
    auto rec = lookup(id, ProcessMode::Interactive);
    rec->resize(rows, cols);
}

KillResult ExecutionEngine::interactive_kill(const std::string& id) {
    auto rec = lookup(id, ProcessMode::Interactive);
    return kill_record(*rec);
}

// ── Table maintenance ────────────────────────────────────────────

std::vector<ProcessSnapshot> ExecutionEngine::list_sessions() const {
    std::vector<ProcessSnapshot> out;
    for (const auto& rec : table_.records()) {
        out.push_back(rec->snapshot());
    }
    return out;
}

size_t ExecutionEngine::purge_finished() {
    if (config_.session_ttl == 0) return 0;
    size_t n = table_.purge_finished(config_.session_ttl, epoch_seconds());
    if (n > 0) {
        std::cerr << "[janitor] purged " << n << " finished session(s)\n";
    }
    return n;
}

void ExecutionEngine::shutdown() {
    stop_blocking_runs();
    for (const auto& rec : table_.records()) {
        if (rec->running()) {
            kill_record(*rec);
        }
    }
}

} // namespace gptshell
