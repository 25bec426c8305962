#pragma once
#include "output_buffer.hpp"
#include <string>
#include <mutex>
#include <condition_variable>
#include <optional>
#include <chrono>
#include <cstdint>
#include <sys/types.h>

namespace gptshell {

enum class ProcessMode { Blocking, Detached, Interactive };
enum class ProcessStatus { Running, Exited, Killed };

const char* mode_name(ProcessMode mode);
const char* status_name(ProcessStatus status);

enum class Stream { Stdout, Stderr, Pty };

struct ProcessSnapshot {
    std::string id;
    ProcessMode mode = ProcessMode::Detached;
    ProcessStatus status = ProcessStatus::Running;
    std::optional<int> exit_code;
    std::string command;
    uint64_t created_at = 0;
};

// State of one spawned process (pipes or PTY).
//
// The record owns the child's pid and descriptors. Reaping goes through
// try_reap() only, so the drain threads and kill() never race on waitpid.
// Exactly one RUNNING -> EXITED/KILLED transition happens, via finish().
class ProcessRecord {
public:
    ProcessRecord(std::string id, ProcessMode mode, std::string command,
                  size_t buffer_capacity);
    ~ProcessRecord();

    ProcessRecord(const ProcessRecord&) = delete;
    ProcessRecord& operator=(const ProcessRecord&) = delete;

    // Attach the live handle. Descriptors of -1 are skipped; each one that
    // is set must later be released with close_stream().
    void attach(pid_t pid, int stdout_fd, int stderr_fd, int pty_fd);

    const std::string& id() const { return id_; }
    ProcessMode mode() const { return mode_; }
    const std::string& command() const { return command_; }
    uint64_t created_at() const { return created_at_; }

    OutputBuffer& stdout_buffer() { return stdout_; }
    OutputBuffer& stderr_buffer() { return stderr_; }
    // PTY output is merged into the stdout buffer.
    OutputBuffer& output() { return stdout_; }

    ProcessStatus status() const;
    bool running() const;
    std::optional<int> exit_code() const;
    ProcessSnapshot snapshot() const;
    uint64_t finished_at() const;

    // Non-blocking waitpid. Returns true once the child has been collected
    // (by this or an earlier call).
    bool try_reap();
    bool reaped() const;
    int reaped_exit_code() const;

    // RUNNING -> terminal. Returns false if the record was already terminal,
    // or for EXITED when a kill has been claimed.
    bool finish(ProcessStatus terminal, int exit_code);

    // Claim the kill. Returns false if another kill already owns it.
    bool begin_kill();
    void wait_terminal();

    int signal_group(int sig) const;

    // Write to the PTY master. Throws AgentError(SessionClosed) once the
    // session has left RUNNING or the PTY is closed.
    void write_input(const std::string& text);
    void resize(uint16_t rows, uint16_t cols);

    // Called by a drain thread when its descriptor is finished with.
    // Returns true when this was the last open stream.
    bool close_stream(Stream stream);
    void wait_drained(std::chrono::milliseconds timeout);
    bool drained() const;

private:
    int& fd_for(Stream stream);

    const std::string id_;
    const ProcessMode mode_;
    const std::string command_;
    const uint64_t created_at_;

    OutputBuffer stdout_;
    OutputBuffer stderr_;

    // Lock order: input_mutex_ before mutex_.
    std::mutex input_mutex_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    pid_t pid_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    int pty_fd_ = -1;
    int open_streams_ = 0;

    bool reaped_ = false;
    int reaped_code_ = -1;
    bool kill_requested_ = false;
    ProcessStatus status_ = ProcessStatus::Running;
    std::optional<int> exit_code_;
    uint64_t finished_at_ = 0;
};

} // namespace gptshell
