#include "runtime/action_pipeline.hpp"

#include <utility>
#include "core/logging/logger.hpp"
#include "tools/guarded_executor.hpp"

namespace saferclaw::runtime {

using nlohmann::json;
using policy::DenyReason;
using policy::PolicyDecision;
using policy::PolicyEngine;
using protocol::ActionRequest;
using session::AuditStatus;
using tools::GuardedExecutor;

namespace {

constexpr std::size_t kMaxRawPayloadBytes = 256;

}  // namespace

std::string to_string(const ActionStatus status) {
    switch (status) {
        case ActionStatus::Blocked:
            return "blocked";
        case ActionStatus::Skipped:
            return "skipped";
        case ActionStatus::Succeeded:
            return "succeeded";
        case ActionStatus::Failed:
            return "failed";
        default:
            return "unknown";
    }
}

json to_json(const ActionOutcome& outcome) {
    json payload;
    payload["status"] = to_string(outcome.status);
    payload["kind"] = protocol::to_string(outcome.kind);
    if (!outcome.reason.empty()) {
        payload["reason"] = outcome.reason;
    }
    if (!outcome.detail.empty()) {
        payload["detail"] = outcome.detail;
    }
    if (outcome.result.has_value()) {
        payload["result"] = protocol::to_json(outcome.result.value());
    }
    return payload;
}

ActionPipeline::ActionPipeline(const core::config::SafetyConfig& config,
                               const session::AuditRecorder& audit,
                               ConfirmationGate gate, PipelineOptions options)
    : config_(config), audit_(audit), gate_(std::move(gate)), options_(options) {}

core::errors::Result<ActionOutcome> ActionPipeline::run(const ActionRequest& request) const {
    ActionOutcome outcome;
    outcome.kind = protocol::kind_of(request);

    const PolicyEngine policy_engine;
    outcome.decision = policy_engine.evaluate(request, config_);
    if (!outcome.decision.allowed) {
        outcome.status = ActionStatus::Blocked;
        outcome.reason = policy::to_string(outcome.decision.reason);
        outcome.detail = outcome.decision.detail;
        LOG_WARN("Blocked " + protocol::to_string(outcome.kind) + " [" +
                 outcome.reason + "]: " + outcome.detail);
        auto recorded = audit_.record_action(request, AuditStatus::Blocked,
                                             outcome.reason, outcome.detail);
        if (core::errors::is_error(recorded)) {
            return core::errors::get_error(recorded);
        }
        return outcome;
    }

    if (options_.dry_run) {
        outcome.status = ActionStatus::Skipped;
        outcome.reason = "dry_run";
        outcome.detail = protocol::describe(request);
        LOG_INFO("Dry run, not executing " + protocol::describe(request));
        auto recorded =
            audit_.record_action(request, AuditStatus::Skipped, outcome.reason);
        if (core::errors::is_error(recorded)) {
            return core::errors::get_error(recorded);
        }
        return outcome;
    }

    if (config_.require_confirmation && !options_.pre_authorized) {
        const bool approved = gate_ ? gate_(request) : false;
        if (!approved) {
            outcome.status = ActionStatus::Skipped;
            outcome.reason = "confirmation_declined";
            LOG_INFO("Confirmation declined for " + protocol::describe(request));
            auto recorded =
                audit_.record_action(request, AuditStatus::Skipped, outcome.reason);
            if (core::errors::is_error(recorded)) {
                return core::errors::get_error(recorded);
            }
            return outcome;
        }
    }

    const GuardedExecutor executor(audit_);
    auto executed = executor.execute(request, outcome.decision, config_);
    if (core::errors::is_error(executed)) {
        const auto& err = core::errors::get_error(executed);
        LOG_ERROR("Execution aborted [" + err.code + "]: " + err.message);
        return err;
    }

    outcome.result = core::errors::get_value(executed);
    outcome.status =
        outcome.result->success ? ActionStatus::Succeeded : ActionStatus::Failed;
    if (!outcome.result->success) {
        outcome.reason = protocol::to_string(outcome.result->error);
        outcome.detail = outcome.result->error_message;
    }
    LOG_INFO("Executed " + protocol::to_string(outcome.kind) + ": " +
             to_string(outcome.status));
    return outcome;
}

core::errors::Result<ActionOutcome> ActionPipeline::record_malformed(
    const protocol::ActionKind kind, const json& raw_payload,
    const std::string& message) const {
    std::string raw = raw_payload.dump(-1, ' ', false, json::error_handler_t::replace);
    if (raw.size() > kMaxRawPayloadBytes) {
        raw = raw.substr(0, kMaxRawPayloadBytes) + "...[truncated]";
    }

    session::AuditEvent event;
    event.action = kind;
    event.payload = json{{"raw", raw}};
    event.status = AuditStatus::Blocked;
    event.reason = policy::to_string(DenyReason::MalformedRequest);
    event.detail = message;
    auto recorded = audit_.record(event);
    if (core::errors::is_error(recorded)) {
        return core::errors::get_error(recorded);
    }

    ActionOutcome outcome;
    outcome.status = ActionStatus::Blocked;
    outcome.kind = kind;
    outcome.decision = PolicyDecision::deny(DenyReason::MalformedRequest, message);
    outcome.reason = event.reason.value();
    outcome.detail = message;
    LOG_WARN("Blocked malformed " + protocol::to_string(kind) + ": " + message);
    return outcome;
}

}  // namespace saferclaw::runtime
