#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "protocol/action_request.hpp"

namespace saferclaw::protocol {

    enum class ExecutionError {
        None,
        Timeout,
        NonZeroExit,
        SpawnFailure,
        IoFailure,
        Skipped     // plan step not run because an earlier step failed
    };

    inline constexpr const char* kTruncationMarker = "\n...[truncated]";

    // Bounded outcome of one guarded action.
    struct ExecutionResult {
        ActionKind kind = ActionKind::Command;
        bool success = false;
        std::optional<int> exit_code;     // commands only
        std::uint64_t byte_count = 0;     // bytes read or written
        std::string stdout_text;          // command stdout or file content
        std::string stderr_text;
        bool truncated = false;
        double duration_ms = 0.0;
        ExecutionError error = ExecutionError::None;
        std::string error_message;
        std::vector<ExecutionResult> steps;  // plans only
    };

    std::string to_string(ExecutionError error);

    nlohmann::json to_json(const ExecutionResult& result);

} // namespace saferclaw::protocol
