#include "queue/job.hpp"

namespace saferclaw::queue {

using core::errors::ErrorCategory;
using core::errors::SafetyError;
using nlohmann::json;

std::string to_string(const JobStatus status) {
    switch (status) {
        case JobStatus::Queued:
            return "queued";
        case JobStatus::Running:
            return "running";
        case JobStatus::Done:
            return "done";
        case JobStatus::Failed:
            return "failed";
        case JobStatus::Blocked:
            return "blocked";
        default:
            return "unknown";
    }
}

core::errors::Result<JobStatus> job_status_from_string(const std::string& text) {
    if (text == "queued") {
        return JobStatus::Queued;
    }
    if (text == "running") {
        return JobStatus::Running;
    }
    if (text == "done") {
        return JobStatus::Done;
    }
    if (text == "failed") {
        return JobStatus::Failed;
    }
    if (text == "blocked") {
        return JobStatus::Blocked;
    }
    return SafetyError{ErrorCategory::Input, "Unknown job status: " + text,
                       "invalid_job_status",
                       "Use one of: queued, running, done, failed, blocked."};
}

bool is_terminal(const JobStatus status) {
    return status == JobStatus::Done || status == JobStatus::Failed ||
           status == JobStatus::Blocked;
}

json to_json(const Job& job) {
    json payload;
    payload["id"] = job.id;
    payload["kind"] = protocol::to_string(job.kind);
    payload["status"] = to_string(job.status);
    json parsed = json::parse(job.payload, nullptr, false);
    payload["payload"] = parsed.is_discarded() ? json(job.payload) : parsed;
    payload["attempts"] = job.attempts;
    payload["max_attempts"] = job.max_attempts;
    payload["created_at"] = job.created_at;
    payload["updated_at"] = job.updated_at;
    payload["claimed_at"] = job.claimed_at.has_value() ? json(job.claimed_at.value()) : json();
    if (job.result_json.has_value()) {
        json result = json::parse(job.result_json.value(), nullptr, false);
        payload["result"] = result.is_discarded() ? json(job.result_json.value()) : result;
    } else {
        payload["result"] = nullptr;
    }
    payload["error"] = job.error.has_value() ? json(job.error.value()) : json();
    return payload;
}

}  // namespace saferclaw::queue
