#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/safety_errors.hpp"
#include "protocol/action_request.hpp"
#include "queue/job.hpp"

struct sqlite3;

namespace saferclaw::queue {

// Durable job store backed by a single SQLite file. Several processes (or
// several JobQueue instances) may share the file; claims are serialized by
// BEGIN IMMEDIATE plus a status compare-and-set, so a job is handed to at
// most one claimer.
class JobQueue {
public:
    static core::errors::Result<std::unique_ptr<JobQueue>> open(
        const std::filesystem::path& path);

    ~JobQueue();
    JobQueue(const JobQueue&) = delete;
    JobQueue& operator=(const JobQueue&) = delete;

    // The payload is validated against the kind's schema before insertion.
    core::errors::Result<std::int64_t> enqueue(protocol::ActionKind kind,
                                               const nlohmann::json& payload,
                                               std::uint32_t max_attempts);
    core::errors::Result<std::int64_t> enqueue(const protocol::ActionRequest& request,
                                               std::uint32_t max_attempts);

    // Oldest queued job, now running. nullopt when nothing is queued or
    // another claimer won the race.
    core::errors::Result<std::optional<Job>> claim_next();

    core::errors::Result<Job> complete(std::int64_t id, const std::string& result_json);
    // Counts an attempt. Back to queued while attempts remain, failed otherwise.
    core::errors::Result<Job> fail(std::int64_t id, const std::string& error);
    core::errors::Result<Job> block(std::int64_t id, const std::string& reason);
    // Counts an attempt and fails the job outright, whatever attempts remain.
    core::errors::Result<Job> abandon(std::int64_t id, const std::string& error);
    // Operator recovery for a job stuck in running after a crashed worker.
    core::errors::Result<Job> requeue(std::int64_t id);

    core::errors::Result<Job> get(std::int64_t id) const;
    core::errors::Result<std::vector<Job>> list(const JobFilter& filter) const;

    const std::filesystem::path& path() const { return path_; }

private:
    JobQueue(sqlite3* db, std::filesystem::path path);

    core::errors::Result<Job> transition_from_running(
        std::int64_t id, const std::function<Job(Job)>& next);
    core::errors::Result<Job> load(std::int64_t id) const;

    mutable std::mutex mutex_;
    sqlite3* db_ = nullptr;
    std::filesystem::path path_;
};

}  // namespace saferclaw::queue
