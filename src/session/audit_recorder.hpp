#pragma once

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/safety_errors.hpp"
#include "protocol/action_request.hpp"

namespace saferclaw::session {

enum class AuditStatus {
    Attempted,
    Blocked,
    Skipped,
    Succeeded,
    Failed
};

std::string to_string(AuditStatus status);

struct AuditEvent {
    std::string timestamp;
    protocol::ActionKind action = protocol::ActionKind::Command;
    nlohmann::json payload;
    AuditStatus status = AuditStatus::Attempted;
    std::optional<std::string> reason;
    std::optional<std::string> detail;
};

// Redacted, size-bounded view of a request for the audit trail.
nlohmann::json redact_payload(const protocol::ActionRequest& request);

// Append-only JSON-lines audit trail. One object per line, never rewritten.
class AuditRecorder {
public:
    explicit AuditRecorder(std::filesystem::path audit_file);

    core::errors::Result<std::filesystem::path> record(const AuditEvent& event) const;

    core::errors::Result<std::filesystem::path> record_action(
        const protocol::ActionRequest& request, AuditStatus status,
        const std::optional<std::string>& reason = std::nullopt,
        const std::optional<std::string>& detail = std::nullopt) const;

    // Last `limit` records in append order.
    core::errors::Result<std::vector<nlohmann::json>> read_events(std::size_t limit) const;

    const std::filesystem::path& path() const { return audit_file_; }

private:
    std::filesystem::path audit_file_;
    mutable std::mutex mutex_;
};

}  // namespace saferclaw::session
