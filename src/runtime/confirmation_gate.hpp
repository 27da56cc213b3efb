#pragma once

#include <functional>
#include <iosfwd>
#include "protocol/action_request.hpp"

namespace saferclaw::runtime {

// Injected approval capability: returns true only on an explicit approval.
using ConfirmationGate = std::function<bool(const protocol::ActionRequest&)>;

// Prompts on `out` and reads one line from `in`; only "y"/"yes" approves.
ConfirmationGate make_interactive_gate(std::istream& in, std::ostream& out);

// For callers that were pre-authorized (e.g. --yes).
ConfirmationGate make_auto_approve_gate();

// For unattended contexts such as queue workers.
ConfirmationGate make_deny_gate();

}  // namespace saferclaw::runtime
