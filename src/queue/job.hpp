#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/safety_errors.hpp"
#include "protocol/action_request.hpp"

namespace saferclaw::queue {

// queued -> running -> {done, queued (retry), failed, blocked}
enum class JobStatus {
    Queued,
    Running,
    Done,
    Failed,
    Blocked
};

struct Job {
    std::int64_t id = 0;
    protocol::ActionKind kind = protocol::ActionKind::Command;
    JobStatus status = JobStatus::Queued;
    std::string payload;  // JSON text, schema keyed by kind
    std::uint32_t attempts = 0;
    std::uint32_t max_attempts = 3;
    std::string created_at;
    std::string updated_at;
    std::optional<std::string> claimed_at;
    std::optional<std::string> result_json;
    std::optional<std::string> error;
};

struct JobFilter {
    std::optional<JobStatus> status;
    std::size_t limit = 50;
};

std::string to_string(JobStatus status);
core::errors::Result<JobStatus> job_status_from_string(const std::string& text);
bool is_terminal(JobStatus status);

nlohmann::json to_json(const Job& job);

}  // namespace saferclaw::queue
