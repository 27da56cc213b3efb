#include "queue/queue_worker.hpp"

#include <string>
#include <utility>
#include "core/logging/logger.hpp"
#include "policy/policy_engine.hpp"
#include "runtime/confirmation_gate.hpp"

namespace saferclaw::queue {

using core::errors::SafetyError;
using nlohmann::json;
using runtime::ActionOutcome;
using runtime::ActionStatus;

namespace {

runtime::ConfirmationGate worker_gate(const WorkerOptions& options) {
    return options.pre_authorized ? runtime::make_auto_approve_gate()
                                  : runtime::make_deny_gate();
}

std::string reason_text(const ActionOutcome& outcome) {
    if (outcome.detail.empty()) {
        return outcome.reason;
    }
    return outcome.reason + ": " + outcome.detail;
}

}  // namespace

QueueWorker::QueueWorker(JobQueue& queue, const core::config::SafetyConfig& config,
                         const session::AuditRecorder& audit, const WorkerOptions options)
    : queue_(queue),
      config_(config),
      options_(options),
      pipeline_(config, audit, worker_gate(options),
                runtime::PipelineOptions{options.pre_authorized, false}) {
    if (config.require_confirmation && !options.pre_authorized) {
        LOG_WARN("QueueWorker: confirmation is required and workers cannot prompt; "
                 "jobs will be blocked");
    }
}

core::errors::Result<std::optional<WorkReport>> QueueWorker::run_once() {
    if (options_.dry_run) {
        return SafetyError{core::errors::ErrorCategory::Input,
                           "Workers cannot dry-run: claiming a job changes its state.",
                           "dry_run_unsupported",
                           "Use `jobs --status queued` to inspect pending work."};
    }

    auto claimed = queue_.claim_next();
    if (core::errors::is_error(claimed)) {
        return core::errors::get_error(claimed);
    }
    const auto& maybe_job = core::errors::get_value(claimed);
    if (!maybe_job.has_value()) {
        return std::optional<WorkReport>{};
    }
    const Job& job = maybe_job.value();
    LOG_INFO("QueueWorker: processing job " + std::to_string(job.id) + " (" +
             protocol::to_string(job.kind) + ", attempt " +
             std::to_string(job.attempts + 1) + "/" + std::to_string(job.max_attempts) +
             ")");

    json payload = json::parse(job.payload, nullptr, false);
    core::errors::Result<protocol::ActionRequest> request =
        payload.is_discarded()
            ? core::errors::Result<protocol::ActionRequest>{SafetyError{
                  core::errors::ErrorCategory::Input, "Job payload is not valid JSON.",
                  "malformed_request"}}
            : protocol::parse_job_payload(job.kind, payload);

    core::errors::Result<ActionOutcome> outcome =
        core::errors::is_error(request)
            ? pipeline_.record_malformed(
                  job.kind, payload.is_discarded() ? json(job.payload) : payload,
                  core::errors::get_error(request).message)
            : pipeline_.run(core::errors::get_value(request));

    if (core::errors::is_error(outcome)) {
        const auto& err = core::errors::get_error(outcome);
        LOG_ERROR("QueueWorker: job " + std::to_string(job.id) + " aborted [" + err.code +
                  "]: " + err.message);
        abort_job(job, request, err);
        return err;
    }

    const ActionOutcome& result = core::errors::get_value(outcome);
    auto persisted = persist(job, result);
    if (core::errors::is_error(persisted)) {
        return core::errors::get_error(persisted);
    }
    return std::optional<WorkReport>(WorkReport{core::errors::get_value(persisted), result});
}

core::errors::Result<Job> QueueWorker::persist(const Job& job, const ActionOutcome& outcome) {
    switch (outcome.status) {
        case ActionStatus::Succeeded:
            return queue_.complete(job.id, runtime::to_json(outcome).dump());
        case ActionStatus::Failed:
            return queue_.fail(job.id, reason_text(outcome));
        case ActionStatus::Skipped:
            return queue_.block(job.id, "confirmation_required");
        case ActionStatus::Blocked:
        default:
            return queue_.block(job.id, reason_text(outcome));
    }
}

void QueueWorker::abort_job(const Job& job,
                            const core::errors::Result<protocol::ActionRequest>& request,
                            const SafetyError& err) {
    const std::string reason = err.code + ": " + err.message;
    const bool denied =
        core::errors::is_error(request) ||
        !policy::PolicyEngine().evaluate(core::errors::get_value(request), config_).allowed;
    auto moved = denied ? queue_.block(job.id, reason) : queue_.abandon(job.id, reason);
    if (core::errors::is_error(moved)) {
        const auto& move_err = core::errors::get_error(moved);
        LOG_ERROR("QueueWorker: unable to record abort for job " + std::to_string(job.id) +
                  " [" + move_err.code + "]: " + move_err.message);
    }
}

core::errors::Result<std::vector<WorkReport>> QueueWorker::run(const std::size_t max_jobs) {
    std::vector<WorkReport> reports;
    while (max_jobs == 0 || reports.size() < max_jobs) {
        auto processed = run_once();
        if (core::errors::is_error(processed)) {
            return core::errors::get_error(processed);
        }
        const auto& report = core::errors::get_value(processed);
        if (!report.has_value()) {
            break;
        }
        reports.push_back(report.value());
    }
    LOG_INFO("QueueWorker: processed " + std::to_string(reports.size()) + " job(s)");
    return reports;
}

}  // namespace saferclaw::queue
