#include "errors.hpp"

namespace gptshell {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound:      return "not_found";
        case ErrorKind::ExecFailure:   return "exec_failure";
        case ErrorKind::SessionClosed: return "session_closed";
        case ErrorKind::Rejected:      return "rejected";
        case ErrorKind::Internal:      return "internal";
    }
    return "internal";
}

} // namespace gptshell
