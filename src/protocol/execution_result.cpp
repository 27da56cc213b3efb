#include "protocol/execution_result.hpp"

namespace saferclaw::protocol {

using nlohmann::json;

std::string to_string(const ExecutionError error) {
    switch (error) {
        case ExecutionError::None:
            return "none";
        case ExecutionError::Timeout:
            return "timeout";
        case ExecutionError::NonZeroExit:
            return "non_zero_exit";
        case ExecutionError::SpawnFailure:
            return "spawn_failure";
        case ExecutionError::IoFailure:
            return "io_failure";
        case ExecutionError::Skipped:
            return "skipped";
        default:
            return "unknown";
    }
}

json to_json(const ExecutionResult& result) {
    json payload;
    payload["kind"] = to_string(result.kind);
    payload["success"] = result.success;
    if (result.exit_code.has_value()) {
        payload["exit_code"] = result.exit_code.value();
    }
    payload["byte_count"] = result.byte_count;
    payload["stdout"] = result.stdout_text;
    payload["stderr"] = result.stderr_text;
    payload["truncated"] = result.truncated;
    payload["duration_ms"] = result.duration_ms;
    if (result.error != ExecutionError::None) {
        payload["error"] = to_string(result.error);
        payload["error_message"] = result.error_message;
    }
    if (result.kind == ActionKind::Plan) {
        json steps = json::array();
        for (const auto& step : result.steps) {
            steps.push_back(to_json(step));
        }
        payload["steps"] = steps;
    }
    return payload;
}

}  // namespace saferclaw::protocol
