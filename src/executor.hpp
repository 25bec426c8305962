#pragma once
#include "config.hpp"
#include "process.hpp"
#include "session_table.hpp"
#include <sys/types.h>
#include <condition_variable>
#include <string>
#include <memory>
#include <mutex>
#include <set>
#include <optional>
#include <functional>
#include <vector>
#include <cstdint>

namespace gptshell {

struct RunResult {
    std::string stdout_data;
    std::string stderr_data;
    int exit_code = 0;
};

struct OutputDelta {
    std::string stdout_data;
    std::string stderr_data;
    bool running = false;
    std::optional<int> exit_code;
    uint64_t stdout_next_offset = 0;
    uint64_t stderr_next_offset = 0;
};

struct InteractiveDelta {
    std::string output;
    bool running = false;
    std::optional<int> exit_code;
    uint64_t next_offset = 0;
};

struct KillResult {
    std::string message;
    std::optional<int> exit_code;
};

// Pre-execution hook. Returning false rejects the command.
using CommandApprover = std::function<bool(const std::string& command)>;

struct DrainTracker;

// Creates processes in the three execution modes and acts on them.
//
// Every operation either returns a definite result or throws AgentError.
// Only run_blocking waits on the child; the others act on buffered state
// or, for kill, wait at most the configured grace period per signal.
class ExecutionEngine {
public:
    ExecutionEngine(SessionTable& table, ExecConfig config, CommandApprover approver = nullptr);
    ~ExecutionEngine();

    ExecutionEngine(const ExecutionEngine&) = delete;
    ExecutionEngine& operator=(const ExecutionEngine&) = delete;

    RunResult run_blocking(const std::string& command,
                           const std::optional<std::string>& stdin_data = std::nullopt);

    std::string start_detached(const std::string& command,
                               const std::optional<std::string>& stdin_data = std::nullopt);

    // Delta since the previous poll (implicit cursor).
    OutputDelta get_output(const std::string& id);
    // Read from explicit offsets without touching the implicit cursor.
    OutputDelta get_output_from(const std::string& id,
                                uint64_t stdout_offset, uint64_t stderr_offset);

    KillResult kill(const std::string& id);

    // Empty cmd starts the interactive shell.
    std::string interactive_start(const std::string& cmd = "");
    InteractiveDelta interactive_output(const std::string& id);
    InteractiveDelta interactive_output_from(const std::string& id, uint64_t offset);
    void interactive_input(const std::string& id, const std::string& text);
    void interactive_resize(const std::string& id, uint16_t rows, uint16_t cols);
    KillResult interactive_kill(const std::string& id);

    std::vector<ProcessSnapshot> list_sessions() const;

    // Remove finished records older than the session TTL.
    size_t purge_finished();

    // Kill every running session and every in-flight blocking run.
    // Blocking runs started afterwards are killed as soon as they spawn.
    void shutdown();

    const ExecConfig& config() const { return config_; }

private:
    std::shared_ptr<ProcessRecord> lookup(const std::string& id, ProcessMode mode) const;
    void approve(const std::string& command) const;
    std::shared_ptr<ProcessRecord> make_record(ProcessMode mode, const std::string& command);
    void launch_drain(const std::shared_ptr<ProcessRecord>& rec, int fd, Stream stream);
    void feed_stdin(const std::string& id, int fd, std::string data);
    KillResult kill_record(ProcessRecord& rec);
    void track_blocking(pid_t pid);
    void untrack_blocking(pid_t pid);
    void stop_blocking_runs();

    SessionTable& table_;
    ExecConfig config_;
    CommandApprover approver_;
    std::shared_ptr<DrainTracker> drains_;

    // Children of in-flight run_blocking calls, which never enter the table.
    std::mutex blocking_mutex_;
    std::condition_variable blocking_cv_;
    std::set<pid_t> blocking_pids_;
    bool stopping_ = false;
};

} // namespace gptshell
