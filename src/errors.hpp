#pragma once
#include <stdexcept>
#include <string>

namespace gptshell {

enum class ErrorKind {
    NotFound,       // unknown id / session
    ExecFailure,    // process could not be spawned
    SessionClosed,  // input or resize on a session that already exited
    Rejected,       // confirmation gate denied the command
    Internal,       // unexpected OS-level failure
};

// Stable lowercase name used in logs and HTTP error bodies.
const char* error_kind_name(ErrorKind kind);

// Typed failure raised by every ExecutionEngine operation.
class AgentError : public std::runtime_error {
public:
    AgentError(ErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace gptshell
