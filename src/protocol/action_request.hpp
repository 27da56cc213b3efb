#pragma once

#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/safety_errors.hpp"

namespace saferclaw::protocol {

    enum class ActionKind {
        Command,
        ReadFile,
        WriteFile,
        Plan
    };

    struct ActionRequest;

    // argv is executed as-is; no shell ever sees it.
    struct CommandAction { std::vector<std::string> argv; };
    struct ReadFileAction { std::string path; };
    struct WriteFileAction { std::string path; std::string content; };
    struct PlanAction { std::vector<ActionRequest> steps; };

    // Closed set of action kinds. Every dispatch point uses std::visit so a
    // new alternative fails to compile until it is handled.
    struct ActionRequest {
        std::variant<CommandAction, ReadFileAction, WriteFileAction, PlanAction> action;
    };

    ActionKind kind_of(const ActionRequest& request);

    std::string to_string(ActionKind kind);
    core::errors::Result<ActionKind> action_kind_from_string(const std::string& text);

    // Word splitting with quotes and backslash escapes. No expansion of any kind.
    core::errors::Result<std::vector<std::string>> tokenize_command(const std::string& text);

    // Model tool-call schema: run_command, read_file, write_file, run_plan.
    core::errors::Result<ActionRequest> parse_tool_call(const std::string& name,
                                                        const nlohmann::json& arguments);

    // Plan documents: a list of steps or an object with a "steps" list.
    core::errors::Result<ActionRequest> parse_plan(const nlohmann::json& document);

    // Job payload codec, keyed by job kind.
    nlohmann::json to_payload_json(const ActionRequest& request);
    core::errors::Result<ActionRequest> parse_job_payload(ActionKind kind,
                                                          const nlohmann::json& payload);

    std::string describe(const ActionRequest& request);

} // namespace saferclaw::protocol
