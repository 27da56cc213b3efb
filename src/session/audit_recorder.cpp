#include "session/audit_recorder.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <deque>
#include <fstream>
#include <system_error>
#include <type_traits>
#include <utility>
#include "core/time/iso8601.hpp"
#include "core/util/common.hpp"

namespace saferclaw::session {

using core::errors::ErrorCategory;
using core::errors::SafetyError;
using nlohmann::json;
using protocol::ActionRequest;
using core::util::kAlwaysFalse;
using core::util::lowercase;

namespace {

constexpr std::size_t kMaxFieldBytes = 256;

constexpr std::array<const char*, 6> kSecretKeys = {
    "password", "passwd", "secret", "token", "api_key", "apikey"};

std::string truncate_field(const std::string& value) {
    if (value.size() <= kMaxFieldBytes) {
        return value;
    }
    return value.substr(0, kMaxFieldBytes) + "...[truncated]";
}

std::string redact_token(const std::string& token) {
    const auto eq = token.find('=');
    if (eq == std::string::npos) {
        return truncate_field(token);
    }
    const std::string key = lowercase(token.substr(0, eq));
    for (const char* secret : kSecretKeys) {
        if (key.find(secret) != std::string::npos) {
            return token.substr(0, eq + 1) + "[redacted]";
        }
    }
    return truncate_field(token);
}

}  // namespace

std::string to_string(const AuditStatus status) {
    switch (status) {
        case AuditStatus::Attempted:
            return "attempted";
        case AuditStatus::Blocked:
            return "blocked";
        case AuditStatus::Skipped:
            return "skipped";
        case AuditStatus::Succeeded:
            return "succeeded";
        case AuditStatus::Failed:
            return "failed";
        default:
            return "unknown";
    }
}

json redact_payload(const ActionRequest& request) {
    return std::visit(
        [](const auto& action) -> json {
            using T = std::decay_t<decltype(action)>;
            if constexpr (std::is_same_v<T, protocol::CommandAction>) {
                json argv = json::array();
                for (const auto& token : action.argv) {
                    argv.push_back(redact_token(token));
                }
                return json{{"command", argv}};
            } else if constexpr (std::is_same_v<T, protocol::ReadFileAction>) {
                return json{{"path", truncate_field(action.path)}};
            } else if constexpr (std::is_same_v<T, protocol::WriteFileAction>) {
                return json{{"path", truncate_field(action.path)},
                            {"content_bytes", action.content.size()},
                            {"content_preview", truncate_field(action.content)}};
            } else if constexpr (std::is_same_v<T, protocol::PlanAction>) {
                json steps = json::array();
                for (const auto& step : action.steps) {
                    json entry = redact_payload(step);
                    entry["kind"] = protocol::to_string(protocol::kind_of(step));
                    steps.push_back(entry);
                }
                return json{{"steps", steps}};
            } else {
                static_assert(kAlwaysFalse<T>, "unhandled action kind");
            }
        },
        request.action);
}

AuditRecorder::AuditRecorder(std::filesystem::path audit_file)
    : audit_file_(std::move(audit_file)) {}

core::errors::Result<std::filesystem::path> AuditRecorder::record(
    const AuditEvent& event) const {
    json line;
    line["timestamp"] = event.timestamp.empty() ? core::time::utc_now_iso8601()
                                                : event.timestamp;
    line["action"] = protocol::to_string(event.action);
    line["payload"] = event.payload;
    line["status"] = to_string(event.status);
    if (event.reason.has_value()) {
        line["reason"] = event.reason.value();
    }
    if (event.detail.has_value()) {
        line["detail"] = truncate_field(event.detail.value());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    if (audit_file_.has_parent_path()) {
        std::filesystem::create_directories(audit_file_.parent_path(), ec);
        if (ec) {
            return SafetyError{ErrorCategory::Internal,
                               "Unable to create audit directory: " +
                                   audit_file_.parent_path().string(),
                               "audit_write_failed"};
        }
    }

    std::ofstream out(audit_file_, std::ios::app);
    if (!out.is_open()) {
        return SafetyError{ErrorCategory::Internal,
                           "Unable to open audit file: " + audit_file_.string(),
                           "audit_write_failed"};
    }

    out << line.dump(-1, ' ', false, json::error_handler_t::replace) << "\n";
    out.flush();
    if (!out.good()) {
        return SafetyError{ErrorCategory::Internal,
                           "Unable to write audit event: " + audit_file_.string(),
                           "audit_write_failed"};
    }
    return audit_file_;
}

core::errors::Result<std::filesystem::path> AuditRecorder::record_action(
    const ActionRequest& request, const AuditStatus status,
    const std::optional<std::string>& reason,
    const std::optional<std::string>& detail) const {
    AuditEvent event;
    event.action = protocol::kind_of(request);
    event.payload = redact_payload(request);
    event.status = status;
    event.reason = reason;
    event.detail = detail;
    return record(event);
}

core::errors::Result<std::vector<json>> AuditRecorder::read_events(
    const std::size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<json> events;
    std::error_code ec;
    if (!std::filesystem::exists(audit_file_, ec) || ec) {
        return events;
    }

    std::ifstream in(audit_file_);
    if (!in.is_open()) {
        return SafetyError{ErrorCategory::Internal,
                           "Unable to open audit file: " + audit_file_.string(),
                           "audit_read_failed"};
    }

    std::deque<json> window;
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) {
            continue;
        }
        json parsed = json::parse(line, nullptr, false);
        if (parsed.is_discarded()) {
            return SafetyError{ErrorCategory::Internal,
                               "Corrupt audit record in " + audit_file_.string(),
                               "audit_read_failed"};
        }
        window.push_back(std::move(parsed));
        if (limit > 0 && window.size() > limit) {
            window.pop_front();
        }
    }
    events.assign(window.begin(), window.end());
    return events;
}

}  // namespace saferclaw::session
