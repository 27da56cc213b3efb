#include "protocol/action_request.hpp"

#include <sstream>
#include <type_traits>
#include <utility>
#include "core/util/common.hpp"

namespace saferclaw::protocol {

using core::errors::ErrorCategory;
using core::errors::SafetyError;
using nlohmann::json;
using core::util::kAlwaysFalse;

namespace {

SafetyError malformed(const std::string& message) {
    return SafetyError{ErrorCategory::Input, message, "malformed_request"};
}

core::errors::Result<std::vector<std::string>> parse_argv(const json& node) {
    if (node.is_string()) {
        return tokenize_command(node.get<std::string>());
    }
    if (node.is_array()) {
        std::vector<std::string> argv;
        for (const auto& item : node) {
            if (!item.is_string()) {
                return malformed("Command list entries must be strings.");
            }
            argv.push_back(item.get<std::string>());
        }
        return argv;
    }
    return malformed("Command must be a string or a list of strings.");
}

core::errors::Result<ActionRequest> parse_command(const json& arguments) {
    if (!arguments.is_object() || !arguments.contains("command")) {
        return malformed("run_command requires 'command'.");
    }
    auto argv = parse_argv(arguments.at("command"));
    if (core::errors::is_error(argv)) {
        return core::errors::get_error(argv);
    }
    return ActionRequest{CommandAction{core::errors::get_value(argv)}};
}

core::errors::Result<ActionRequest> parse_read(const json& arguments) {
    if (!arguments.is_object() || !arguments.contains("path") ||
        !arguments.at("path").is_string()) {
        return malformed("read_file requires a string 'path'.");
    }
    return ActionRequest{ReadFileAction{arguments.at("path").get<std::string>()}};
}

core::errors::Result<ActionRequest> parse_write(const json& arguments) {
    if (!arguments.is_object() || !arguments.contains("path") ||
        !arguments.at("path").is_string()) {
        return malformed("write_file requires a string 'path'.");
    }
    if (!arguments.contains("content") || !arguments.at("content").is_string()) {
        return malformed("write_file requires a string 'content'.");
    }
    return ActionRequest{WriteFileAction{arguments.at("path").get<std::string>(),
                                         arguments.at("content").get<std::string>()}};
}

core::errors::Result<ActionRequest> parse_plan_step(const json& step,
                                                    const std::size_t index) {
    const std::string where = "Plan step " + std::to_string(index) + ": ";
    if (!step.is_object()) {
        return malformed(where + "step is not an object.");
    }

    int keys = 0;
    for (const char* key : {"command", "read_file", "write_file"}) {
        if (step.contains(key)) {
            ++keys;
        }
    }
    if (keys != 1) {
        return malformed(where + "expected exactly one of command/read_file/write_file.");
    }

    core::errors::Result<ActionRequest> parsed = malformed(where + "unreadable step.");
    if (step.contains("command")) {
        parsed = parse_command(step);
    } else if (step.contains("read_file")) {
        const json& node = step.at("read_file");
        parsed = node.is_string() ? parse_read(json{{"path", node}}) : parse_read(node);
    } else {
        parsed = parse_write(step.at("write_file"));
    }
    if (core::errors::is_error(parsed)) {
        return malformed(where + core::errors::get_error(parsed).message);
    }
    return parsed;
}

json step_to_json(const ActionRequest& step) {
    return std::visit(
        [](const auto& action) -> json {
            using T = std::decay_t<decltype(action)>;
            if constexpr (std::is_same_v<T, CommandAction>) {
                return json{{"command", action.argv}};
            } else if constexpr (std::is_same_v<T, ReadFileAction>) {
                return json{{"read_file", action.path}};
            } else if constexpr (std::is_same_v<T, WriteFileAction>) {
                return json{{"write_file", {{"path", action.path}, {"content", action.content}}}};
            } else if constexpr (std::is_same_v<T, PlanAction>) {
                json steps = json::array();
                for (const auto& nested : action.steps) {
                    steps.push_back(step_to_json(nested));
                }
                return json{{"plan", steps}};
            } else {
                static_assert(kAlwaysFalse<T>, "unhandled action kind");
            }
        },
        step.action);
}

}  // namespace

ActionKind kind_of(const ActionRequest& request) {
    return std::visit(
        [](const auto& action) -> ActionKind {
            using T = std::decay_t<decltype(action)>;
            if constexpr (std::is_same_v<T, CommandAction>) {
                return ActionKind::Command;
            } else if constexpr (std::is_same_v<T, ReadFileAction>) {
                return ActionKind::ReadFile;
            } else if constexpr (std::is_same_v<T, WriteFileAction>) {
                return ActionKind::WriteFile;
            } else if constexpr (std::is_same_v<T, PlanAction>) {
                return ActionKind::Plan;
            } else {
                static_assert(kAlwaysFalse<T>, "unhandled action kind");
            }
        },
        request.action);
}

std::string to_string(const ActionKind kind) {
    switch (kind) {
        case ActionKind::Command:
            return "command";
        case ActionKind::ReadFile:
            return "read_file";
        case ActionKind::WriteFile:
            return "write_file";
        case ActionKind::Plan:
            return "plan";
        default:
            return "unknown";
    }
}

core::errors::Result<ActionKind> action_kind_from_string(const std::string& text) {
    if (text == "command") {
        return ActionKind::Command;
    }
    if (text == "read_file") {
        return ActionKind::ReadFile;
    }
    if (text == "write_file") {
        return ActionKind::WriteFile;
    }
    if (text == "plan") {
        return ActionKind::Plan;
    }
    return SafetyError{ErrorCategory::Input, "Unknown job kind: " + text,
                       "invalid_job_kind",
                       "Use one of: command, read_file, write_file, plan."};
}

core::errors::Result<std::vector<std::string>> tokenize_command(const std::string& text) {
    enum class Quote { None, Single, Double };

    std::vector<std::string> tokens;
    std::string current;
    bool in_token = false;
    Quote quote = Quote::None;

    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        switch (quote) {
            case Quote::Single:
                if (c == '\'') {
                    quote = Quote::None;
                } else {
                    current.push_back(c);
                }
                continue;
            case Quote::Double:
                if (c == '"') {
                    quote = Quote::None;
                } else if (c == '\\' && i + 1 < text.size() &&
                           (text[i + 1] == '"' || text[i + 1] == '\\')) {
                    current.push_back(text[++i]);
                } else {
                    current.push_back(c);
                }
                continue;
            case Quote::None:
                break;
        }

        if (c == ' ' || c == '\t') {
            if (in_token) {
                tokens.push_back(current);
                current.clear();
                in_token = false;
            }
            continue;
        }

        in_token = true;
        if (c == '\'') {
            quote = Quote::Single;
        } else if (c == '"') {
            quote = Quote::Double;
        } else if (c == '\\') {
            if (i + 1 >= text.size()) {
                return malformed("Command ends with a dangling escape.");
            }
            current.push_back(text[++i]);
        } else {
            current.push_back(c);
        }
    }

    if (quote != Quote::None) {
        return malformed("Command has an unterminated quote.");
    }
    if (in_token) {
        tokens.push_back(current);
    }
    return tokens;
}

core::errors::Result<ActionRequest> parse_tool_call(const std::string& name,
                                                    const json& arguments) {
    if (name == "run_command") {
        return parse_command(arguments);
    }
    if (name == "read_file") {
        return parse_read(arguments);
    }
    if (name == "write_file") {
        return parse_write(arguments);
    }
    if (name == "run_plan") {
        if (!arguments.is_object() || !arguments.contains("steps")) {
            return malformed("run_plan requires 'steps' as a list.");
        }
        return parse_plan(arguments);
    }
    return malformed("Unknown tool: " + name);
}

core::errors::Result<ActionRequest> parse_plan(const json& document) {
    const json* steps = &document;
    if (document.is_object()) {
        if (!document.contains("steps")) {
            return malformed("Plan object must contain a 'steps' list.");
        }
        steps = &document.at("steps");
    }
    if (!steps->is_array()) {
        return malformed("Plan must be a list or an object containing a 'steps' list.");
    }

    PlanAction plan;
    std::size_t index = 1;
    for (const auto& step : *steps) {
        auto parsed = parse_plan_step(step, index++);
        if (core::errors::is_error(parsed)) {
            return core::errors::get_error(parsed);
        }
        plan.steps.push_back(core::errors::get_value(parsed));
    }
    return ActionRequest{std::move(plan)};
}

json to_payload_json(const ActionRequest& request) {
    return std::visit(
        [](const auto& action) -> json {
            using T = std::decay_t<decltype(action)>;
            if constexpr (std::is_same_v<T, CommandAction>) {
                return json{{"command", action.argv}};
            } else if constexpr (std::is_same_v<T, ReadFileAction>) {
                return json{{"path", action.path}};
            } else if constexpr (std::is_same_v<T, WriteFileAction>) {
                return json{{"path", action.path}, {"content", action.content}};
            } else if constexpr (std::is_same_v<T, PlanAction>) {
                json steps = json::array();
                for (const auto& step : action.steps) {
                    steps.push_back(step_to_json(step));
                }
                return json{{"steps", steps}};
            } else {
                static_assert(kAlwaysFalse<T>, "unhandled action kind");
            }
        },
        request.action);
}

core::errors::Result<ActionRequest> parse_job_payload(const ActionKind kind,
                                                      const json& payload) {
    switch (kind) {
        case ActionKind::Command:
            return parse_command(payload);
        case ActionKind::ReadFile:
            return parse_read(payload);
        case ActionKind::WriteFile:
            return parse_write(payload);
        case ActionKind::Plan:
            return parse_tool_call("run_plan", payload);
    }
    return malformed("Unknown job kind.");
}

std::string describe(const ActionRequest& request) {
    return std::visit(
        [](const auto& action) -> std::string {
            using T = std::decay_t<decltype(action)>;
            if constexpr (std::is_same_v<T, CommandAction>) {
                std::ostringstream out;
                out << "command:";
                for (const auto& token : action.argv) {
                    out << " " << token;
                }
                return out.str();
            } else if constexpr (std::is_same_v<T, ReadFileAction>) {
                return "read_file: " + action.path;
            } else if constexpr (std::is_same_v<T, WriteFileAction>) {
                return "write_file: " + action.path + " (" +
                       std::to_string(action.content.size()) + " bytes)";
            } else if constexpr (std::is_same_v<T, PlanAction>) {
                std::string text =
                    "plan: " + std::to_string(action.steps.size()) + " steps";
                for (const auto& step : action.steps) {
                    text += "\n  - " + describe(step);
                }
                return text;
            } else {
                static_assert(kAlwaysFalse<T>, "unhandled action kind");
            }
        },
        request.action);
}

} // namespace saferclaw::protocol
