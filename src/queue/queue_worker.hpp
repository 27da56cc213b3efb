#pragma once

#include <cstddef>
#include <optional>
#include <vector>
#include "core/config/safety_config.hpp"
#include "core/errors/safety_errors.hpp"
#include "queue/job.hpp"
#include "queue/job_queue.hpp"
#include "runtime/action_pipeline.hpp"
#include "session/audit_recorder.hpp"

namespace saferclaw::queue {

struct WorkReport {
    Job job;  // state after the outcome was persisted
    runtime::ActionOutcome outcome;
};

struct WorkerOptions {
    // Workers never prompt. Without pre-authorization a job that needs
    // confirmation is blocked.
    bool pre_authorized = false;
    // Claiming is itself a state change, so a dry-run worker refuses to start.
    bool dry_run = false;
};

// Claims jobs one at a time and runs them through the same pipeline as
// interactive requests.
class QueueWorker {
public:
    QueueWorker(JobQueue& queue, const core::config::SafetyConfig& config,
                const session::AuditRecorder& audit, WorkerOptions options = {});

    // nullopt when nothing was claimable. A pipeline error is terminal for
    // the claimed job: the action may already have run, so it is never
    // retried automatically.
    core::errors::Result<std::optional<WorkReport>> run_once();

    // Stops when the queue is drained or `max_jobs` jobs were processed
    // (0 means no limit).
    core::errors::Result<std::vector<WorkReport>> run(std::size_t max_jobs);

private:
    core::errors::Result<Job> persist(const Job& job,
                                      const runtime::ActionOutcome& outcome);
    void abort_job(const Job& job,
                   const core::errors::Result<protocol::ActionRequest>& request,
                   const core::errors::SafetyError& err);

    JobQueue& queue_;
    const core::config::SafetyConfig& config_;
    WorkerOptions options_;
    runtime::ActionPipeline pipeline_;
};

}  // namespace saferclaw::queue
