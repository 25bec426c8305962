#pragma once
#include "executor.hpp"
#include <istream>
#include <ostream>

namespace gptshell {

// Y/n operator prompt in front of every command. Empty input, "y" and "yes"
// approve; anything else or end-of-input rejects. Concurrent prompts are
// serialized. The streams must outlive the returned approver.
CommandApprover make_console_approver(std::istream& in, std::ostream& out);

// Parse a single Y/n answer line.
bool parse_approval(const std::string& answer);

} // namespace gptshell
