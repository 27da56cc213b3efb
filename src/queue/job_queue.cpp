#include "queue/job_queue.hpp"

#include <algorithm>
#include <sqlite3.h>
#include <string>
#include <system_error>
#include <utility>
#include "core/logging/logger.hpp"
#include "core/time/iso8601.hpp"

namespace saferclaw::queue {

using core::errors::ErrorCategory;
using core::errors::SafetyError;
using nlohmann::json;

namespace {

constexpr int kBusyTimeoutMs = 5000;

constexpr const char* kSchema =
    "PRAGMA journal_mode = WAL;"
    "CREATE TABLE IF NOT EXISTS jobs ("
    "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  kind TEXT NOT NULL,"
    "  status TEXT NOT NULL,"
    "  payload TEXT NOT NULL,"
    "  attempts INTEGER NOT NULL DEFAULT 0,"
    "  max_attempts INTEGER NOT NULL,"
    "  created_at TEXT NOT NULL,"
    "  updated_at TEXT NOT NULL,"
    "  claimed_at TEXT,"
    "  result_json TEXT,"
    "  error TEXT"
    ");"
    "CREATE INDEX IF NOT EXISTS idx_jobs_status_id ON jobs (status, id);";

#define SAFERCLAW_JOB_COLUMNS                                              \
    "id, kind, status, payload, attempts, max_attempts, created_at, "     \
    "updated_at, claimed_at, result_json, error"

constexpr const char* kSelectById =
    "SELECT " SAFERCLAW_JOB_COLUMNS " FROM jobs WHERE id = ?1";
constexpr const char* kListAll =
    "SELECT " SAFERCLAW_JOB_COLUMNS " FROM jobs ORDER BY id DESC LIMIT ?1";
constexpr const char* kListByStatus =
    "SELECT " SAFERCLAW_JOB_COLUMNS
    " FROM jobs WHERE status = ?2 ORDER BY id DESC LIMIT ?1";

#undef SAFERCLAW_JOB_COLUMNS

// Owns one prepared statement.
class Statement {
public:
    Statement(sqlite3* db, const char* sql)
        : rc_(sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr)) {}
    ~Statement() { sqlite3_finalize(stmt_); }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    bool prepared() const { return rc_ == SQLITE_OK && stmt_ != nullptr; }

    void bind_text(const int index, const std::string& value) {
        sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()),
                          SQLITE_TRANSIENT);
    }
    void bind_int(const int index, const std::int64_t value) {
        sqlite3_bind_int64(stmt_, index, value);
    }
    void bind_optional(const int index, const std::optional<std::string>& value) {
        if (value.has_value()) {
            bind_text(index, value.value());
        } else {
            sqlite3_bind_null(stmt_, index);
        }
    }

    int step() { return sqlite3_step(stmt_); }
    sqlite3_stmt* get() const { return stmt_; }

private:
    sqlite3_stmt* stmt_ = nullptr;
    int rc_;
};

// BEGIN IMMEDIATE takes the write lock up front; rolls back unless committed.
class ImmediateTransaction {
public:
    explicit ImmediateTransaction(sqlite3* db)
        : db_(db), rc_(sqlite3_exec(db, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr)) {}
    ~ImmediateTransaction() {
        if (rc_ == SQLITE_OK && !committed_) {
            sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
        }
    }
    ImmediateTransaction(const ImmediateTransaction&) = delete;
    ImmediateTransaction& operator=(const ImmediateTransaction&) = delete;

    bool began() const { return rc_ == SQLITE_OK; }
    int rc() const { return rc_; }

    int commit() {
        const int rc = sqlite3_exec(db_, "COMMIT", nullptr, nullptr, nullptr);
        if (rc == SQLITE_OK) {
            committed_ = true;
        }
        return rc;
    }

private:
    sqlite3* db_;
    int rc_;
    bool committed_ = false;
};

bool is_busy(const int rc) {
    return rc == SQLITE_BUSY || rc == SQLITE_LOCKED;
}

SafetyError store_error(sqlite3* db, const std::string& what) {
    return SafetyError{ErrorCategory::Queue, what + ": " + sqlite3_errmsg(db),
                       "store_unavailable",
                       "Check that the queue file is writable and not held by another process."};
}

SafetyError job_not_found(const std::int64_t id) {
    return SafetyError{ErrorCategory::Queue, "Job not found: " + std::to_string(id),
                       "job_not_found", "Use `saferclaw jobs` to list known job IDs."};
}

std::string column_text(sqlite3_stmt* stmt, const int column) {
    const unsigned char* text = sqlite3_column_text(stmt, column);
    if (text == nullptr) {
        return {};
    }
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<std::size_t>(sqlite3_column_bytes(stmt, column)));
}

std::optional<std::string> column_optional(sqlite3_stmt* stmt, const int column) {
    if (sqlite3_column_type(stmt, column) == SQLITE_NULL) {
        return std::nullopt;
    }
    return column_text(stmt, column);
}

core::errors::Result<Job> read_row(sqlite3_stmt* stmt) {
    Job job;
    job.id = sqlite3_column_int64(stmt, 0);

    auto kind = protocol::action_kind_from_string(column_text(stmt, 1));
    if (core::errors::is_error(kind)) {
        return SafetyError{ErrorCategory::Queue,
                           "Corrupt job record " + std::to_string(job.id) + ": " +
                               core::errors::get_error(kind).message,
                           "store_unavailable"};
    }
    job.kind = core::errors::get_value(kind);

    auto status = job_status_from_string(column_text(stmt, 2));
    if (core::errors::is_error(status)) {
        return SafetyError{ErrorCategory::Queue,
                           "Corrupt job record " + std::to_string(job.id) + ": " +
                               core::errors::get_error(status).message,
                           "store_unavailable"};
    }
    job.status = core::errors::get_value(status);

    job.payload = column_text(stmt, 3);
    job.attempts = static_cast<std::uint32_t>(sqlite3_column_int64(stmt, 4));
    job.max_attempts = static_cast<std::uint32_t>(sqlite3_column_int64(stmt, 5));
    job.created_at = column_text(stmt, 6);
    job.updated_at = column_text(stmt, 7);
    job.claimed_at = column_optional(stmt, 8);
    job.result_json = column_optional(stmt, 9);
    job.error = column_optional(stmt, 10);
    return job;
}

}  // namespace

JobQueue::JobQueue(sqlite3* db, std::filesystem::path path)
    : db_(db), path_(std::move(path)) {}

JobQueue::~JobQueue() {
    sqlite3_close_v2(db_);
}

core::errors::Result<std::unique_ptr<JobQueue>> JobQueue::open(
    const std::filesystem::path& path) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return SafetyError{ErrorCategory::Queue,
                               "Unable to create queue directory: " +
                                   path.parent_path().string(),
                               "store_unavailable"};
        }
    }

    sqlite3* db = nullptr;
    const int rc = sqlite3_open_v2(path.string().c_str(), &db,
                                   SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                                       SQLITE_OPEN_FULLMUTEX,
                                   nullptr);
    if (rc != SQLITE_OK) {
        const std::string message = db != nullptr ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
        sqlite3_close_v2(db);
        return SafetyError{ErrorCategory::Queue,
                           "Unable to open job queue " + path.string() + ": " + message,
                           "store_unavailable"};
    }
    sqlite3_busy_timeout(db, kBusyTimeoutMs);

    std::unique_ptr<JobQueue> queue(new JobQueue(db, path));
    char* schema_error = nullptr;
    if (sqlite3_exec(db, kSchema, nullptr, nullptr, &schema_error) != SQLITE_OK) {
        const std::string message =
            schema_error != nullptr ? schema_error : "unknown schema error";
        sqlite3_free(schema_error);
        return SafetyError{ErrorCategory::Queue,
                           "Unable to initialize job queue " + path.string() + ": " +
                               message,
                           "store_unavailable"};
    }

    LOG_DEBUG("JobQueue: opened " + path.string());
    return std::move(queue);
}

core::errors::Result<std::int64_t> JobQueue::enqueue(const protocol::ActionKind kind,
                                                     const json& payload,
                                                     const std::uint32_t max_attempts) {
    auto request = protocol::parse_job_payload(kind, payload);
    if (core::errors::is_error(request)) {
        return core::errors::get_error(request);
    }
    return enqueue(core::errors::get_value(request), max_attempts);
}

core::errors::Result<std::int64_t> JobQueue::enqueue(const protocol::ActionRequest& request,
                                                     const std::uint32_t max_attempts) {
    if (max_attempts == 0) {
        return SafetyError{ErrorCategory::Input, "max_attempts must be at least 1.",
                           "invalid_max_attempts"};
    }

    const std::string kind = protocol::to_string(protocol::kind_of(request));
    const std::string payload = protocol::to_payload_json(request).dump();
    const std::string now = core::time::utc_now_iso8601();

    std::lock_guard<std::mutex> lock(mutex_);
    Statement insert(db_,
                     "INSERT INTO jobs (kind, status, payload, attempts, max_attempts, "
                     "created_at, updated_at) VALUES (?1, 'queued', ?2, 0, ?3, ?4, ?4)");
    if (!insert.prepared()) {
        return store_error(db_, "Unable to prepare enqueue");
    }
    insert.bind_text(1, kind);
    insert.bind_text(2, payload);
    insert.bind_int(3, max_attempts);
    insert.bind_text(4, now);
    if (insert.step() != SQLITE_DONE) {
        return store_error(db_, "Unable to enqueue job");
    }

    const std::int64_t id = sqlite3_last_insert_rowid(db_);
    LOG_INFO("JobQueue: job " + std::to_string(id) + " enqueued (" + kind + ")");
    return id;
}

core::errors::Result<std::optional<Job>> JobQueue::claim_next() {
    std::lock_guard<std::mutex> lock(mutex_);
    ImmediateTransaction tx(db_);
    if (!tx.began()) {
        if (is_busy(tx.rc())) {
            LOG_DEBUG("JobQueue: claim conflict, store busy");
            return std::optional<Job>{};
        }
        return store_error(db_, "Unable to begin claim");
    }

    std::int64_t id = 0;
    {
        Statement select(db_,
                         "SELECT id FROM jobs WHERE status = 'queued' ORDER BY id ASC LIMIT 1");
        if (!select.prepared()) {
            return store_error(db_, "Unable to prepare claim");
        }
        const int rc = select.step();
        if (rc == SQLITE_DONE) {
            return std::optional<Job>{};
        }
        if (rc != SQLITE_ROW) {
            return store_error(db_, "Unable to select queued job");
        }
        id = sqlite3_column_int64(select.get(), 0);
    }

    const std::string now = core::time::utc_now_iso8601();
    {
        Statement update(db_,
                         "UPDATE jobs SET status = 'running', claimed_at = ?1, "
                         "updated_at = ?1 WHERE id = ?2 AND status = 'queued'");
        if (!update.prepared()) {
            return store_error(db_, "Unable to prepare claim");
        }
        update.bind_text(1, now);
        update.bind_int(2, id);
        if (update.step() != SQLITE_DONE) {
            return store_error(db_, "Unable to claim job");
        }
        if (sqlite3_changes(db_) != 1) {
            LOG_DEBUG("JobQueue: claim conflict on job " + std::to_string(id));
            return std::optional<Job>{};
        }
    }

    auto claimed = load(id);
    if (core::errors::is_error(claimed)) {
        return core::errors::get_error(claimed);
    }

    const int commit_rc = tx.commit();
    if (commit_rc != SQLITE_OK) {
        if (is_busy(commit_rc)) {
            LOG_DEBUG("JobQueue: claim conflict on commit for job " + std::to_string(id));
            return std::optional<Job>{};
        }
        return store_error(db_, "Unable to commit claim");
    }

    LOG_INFO("JobQueue: job " + std::to_string(id) + " transition queued -> running");
    return std::optional<Job>(core::errors::get_value(claimed));
}

core::errors::Result<Job> JobQueue::complete(const std::int64_t id,
                                             const std::string& result_json) {
    return transition_from_running(id, [&result_json](Job job) {
        job.status = JobStatus::Done;
        job.result_json = result_json;
        job.error.reset();
        return job;
    });
}

core::errors::Result<Job> JobQueue::fail(const std::int64_t id, const std::string& error) {
    return transition_from_running(id, [&error](Job job) {
        job.attempts += 1;
        job.error = error;
        if (job.attempts < job.max_attempts) {
            job.status = JobStatus::Queued;
            job.claimed_at.reset();
        } else {
            job.status = JobStatus::Failed;
        }
        return job;
    });
}

core::errors::Result<Job> JobQueue::block(const std::int64_t id, const std::string& reason) {
    return transition_from_running(id, [&reason](Job job) {
        job.status = JobStatus::Blocked;
        job.error = reason;
        return job;
    });
}

core::errors::Result<Job> JobQueue::abandon(const std::int64_t id, const std::string& error) {
    return transition_from_running(id, [&error](Job job) {
        job.attempts = std::min(job.attempts + 1, job.max_attempts);
        job.error = error;
        job.status = JobStatus::Failed;
        return job;
    });
}

core::errors::Result<Job> JobQueue::requeue(const std::int64_t id) {
    return transition_from_running(id, [](Job job) {
        job.status = JobStatus::Queued;
        job.claimed_at.reset();
        return job;
    });
}

core::errors::Result<Job> JobQueue::transition_from_running(
    const std::int64_t id, const std::function<Job(Job)>& next) {
    std::lock_guard<std::mutex> lock(mutex_);
    ImmediateTransaction tx(db_);
    if (!tx.began()) {
        return store_error(db_, "Unable to begin job transition");
    }

    auto current = load(id);
    if (core::errors::is_error(current)) {
        return core::errors::get_error(current);
    }
    const Job& before = core::errors::get_value(current);
    if (before.status != JobStatus::Running) {
        return SafetyError{ErrorCategory::Queue,
                           "Job " + std::to_string(id) + " is " + to_string(before.status) +
                               ", expected running",
                           "invalid_state_transition"};
    }

    Job after = next(before);
    after.updated_at = core::time::utc_now_iso8601();
    {
        Statement update(db_,
                         "UPDATE jobs SET status = ?1, attempts = ?2, updated_at = ?3, "
                         "claimed_at = ?4, result_json = ?5, error = ?6 "
                         "WHERE id = ?7 AND status = 'running'");
        if (!update.prepared()) {
            return store_error(db_, "Unable to prepare job transition");
        }
        update.bind_text(1, to_string(after.status));
        update.bind_int(2, after.attempts);
        update.bind_text(3, after.updated_at);
        update.bind_optional(4, after.claimed_at);
        update.bind_optional(5, after.result_json);
        update.bind_optional(6, after.error);
        update.bind_int(7, id);
        if (update.step() != SQLITE_DONE) {
            return store_error(db_, "Unable to update job");
        }
        if (sqlite3_changes(db_) != 1) {
            return SafetyError{ErrorCategory::Queue,
                               "Job " + std::to_string(id) + " changed concurrently",
                               "invalid_state_transition"};
        }
    }

    if (tx.commit() != SQLITE_OK) {
        return store_error(db_, "Unable to commit job transition");
    }

    LOG_INFO("JobQueue: job " + std::to_string(id) + " transition running -> " +
             to_string(after.status));
    return after;
}

core::errors::Result<Job> JobQueue::get(const std::int64_t id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return load(id);
}

core::errors::Result<Job> JobQueue::load(const std::int64_t id) const {
    Statement select(db_, kSelectById);
    if (!select.prepared()) {
        return store_error(db_, "Unable to prepare job lookup");
    }
    select.bind_int(1, id);
    const int rc = select.step();
    if (rc == SQLITE_DONE) {
        return job_not_found(id);
    }
    if (rc != SQLITE_ROW) {
        return store_error(db_, "Unable to read job");
    }
    return read_row(select.get());
}

core::errors::Result<std::vector<Job>> JobQueue::list(const JobFilter& filter) const {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement select(db_, filter.status.has_value() ? kListByStatus : kListAll);
    if (!select.prepared()) {
        return store_error(db_, "Unable to prepare job listing");
    }
    // LIMIT -1 is unbounded in SQLite.
    select.bind_int(1, filter.limit == 0 ? -1 : static_cast<std::int64_t>(filter.limit));
    if (filter.status.has_value()) {
        select.bind_text(2, to_string(filter.status.value()));
    }

    std::vector<Job> jobs;
    int rc = SQLITE_ROW;
    while ((rc = select.step()) == SQLITE_ROW) {
        auto job = read_row(select.get());
        if (core::errors::is_error(job)) {
            return core::errors::get_error(job);
        }
        jobs.push_back(core::errors::get_value(job));
    }
    if (rc != SQLITE_DONE) {
        return store_error(db_, "Unable to list jobs");
    }
    return jobs;
}

}  // namespace saferclaw::queue
