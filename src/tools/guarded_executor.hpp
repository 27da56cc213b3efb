#pragma once

#include "core/config/safety_config.hpp"
#include "core/errors/safety_errors.hpp"
#include "policy/policy_engine.hpp"
#include "protocol/action_request.hpp"
#include "protocol/execution_result.hpp"
#include "session/audit_recorder.hpp"

namespace saferclaw::tools {

// Performs already-approved actions without any shell. Each action (and each
// plan step) is audited as "attempted" before and with its outcome after.
class GuardedExecutor {
public:
    explicit GuardedExecutor(const session::AuditRecorder& audit);

    // Throws std::logic_error when `decision` is a denial: callers must never
    // reach the executor without an Allow.
    core::errors::Result<protocol::ExecutionResult> execute(
        const protocol::ActionRequest& request,
        const policy::PolicyDecision& decision,
        const core::config::SafetyConfig& config) const;

private:
    core::errors::Result<protocol::ExecutionResult> execute_audited(
        const protocol::ActionRequest& request,
        const core::config::SafetyConfig& config) const;

    protocol::ExecutionResult run_command(const protocol::CommandAction& command,
                                          const core::config::SafetyConfig& config) const;
    protocol::ExecutionResult read_file(const protocol::ReadFileAction& read,
                                        const core::config::SafetyConfig& config) const;
    protocol::ExecutionResult write_file(const protocol::WriteFileAction& write,
                                         const core::config::SafetyConfig& config) const;
    core::errors::Result<protocol::ExecutionResult> run_plan(
        const protocol::PlanAction& plan,
        const core::config::SafetyConfig& config) const;

    const session::AuditRecorder& audit_;
};

}  // namespace saferclaw::tools
