#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/config/safety_config.hpp"
#include "core/errors/safety_errors.hpp"
#include "policy/policy_engine.hpp"
#include "protocol/action_request.hpp"
#include "protocol/execution_result.hpp"
#include "runtime/confirmation_gate.hpp"
#include "session/audit_recorder.hpp"

namespace saferclaw::runtime {

enum class ActionStatus {
    Blocked,
    Skipped,
    Succeeded,
    Failed
};

struct ActionOutcome {
    ActionStatus status = ActionStatus::Blocked;
    protocol::ActionKind kind = protocol::ActionKind::Command;
    policy::PolicyDecision decision;
    std::optional<protocol::ExecutionResult> result;
    std::string reason;
    std::string detail;
};

struct PipelineOptions {
    bool pre_authorized = false;  // caller already approved (--yes)
    bool dry_run = false;         // validate and audit, never execute
};

std::string to_string(ActionStatus status);
nlohmann::json to_json(const ActionOutcome& outcome);

// evaluate -> (blocked) -> confirm -> (skipped) -> execute -> outcome.
// The config and audit recorder are borrowed; both must outlive the pipeline.
class ActionPipeline {
public:
    ActionPipeline(const core::config::SafetyConfig& config,
                   const session::AuditRecorder& audit, ConfirmationGate gate,
                   PipelineOptions options = {});

    core::errors::Result<ActionOutcome> run(const protocol::ActionRequest& request) const;

    // Audits a request that could not be decoded into an ActionRequest.
    core::errors::Result<ActionOutcome> record_malformed(
        protocol::ActionKind kind, const nlohmann::json& raw_payload,
        const std::string& message) const;

private:
    const core::config::SafetyConfig& config_;
    const session::AuditRecorder& audit_;
    ConfirmationGate gate_;
    PipelineOptions options_;
};

}  // namespace saferclaw::runtime
