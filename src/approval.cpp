#include "approval.hpp"
#include "util.hpp"

#include <memory>
#include <mutex>
#include <string>

namespace gptshell {

bool parse_approval(const std::string& answer) {
    std::string a = to_lower(trim(answer));
    return a.empty() || a == "y" || a == "yes";
}

CommandApprover make_console_approver(std::istream& in, std::ostream& out) {
    auto mutex = std::make_shared<std::mutex>();
    return [&in, &out, mutex](const std::string& command) {
        std::lock_guard<std::mutex> lock(*mutex);
        out << "\nIncoming command:\n  " << command << "\nRun this command? [Y/n] " << std::flush;
        std::string line;
        if (!std::getline(in, line)) {
            out << "\n[approval] no operator input, rejecting\n" << std::flush;
            return false;
        }
        bool ok = parse_approval(line);
        if (!ok) out << "[approval] rejected\n" << std::flush;
        return ok;
    };
}

} // namespace gptshell
