#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "app/cli_parser.hpp"
#include "core/config/safety_config.hpp"
#include "core/config/unique_id.hpp"
#include "core/errors/safety_errors.hpp"
#include "core/logging/logger.hpp"
#include "protocol/action_request.hpp"
#include "queue/job_queue.hpp"
#include "queue/queue_worker.hpp"
#include "runtime/action_pipeline.hpp"
#include "runtime/confirmation_gate.hpp"
#include "session/audit_recorder.hpp"

namespace {

using nlohmann::json;
using saferclaw::app::cli::CliOptions;
using saferclaw::app::cli::Subcommand;
using saferclaw::core::config::SafetyConfig;
using saferclaw::core::errors::SafetyError;
using saferclaw::core::errors::get_error;
using saferclaw::core::errors::get_value;
using saferclaw::core::errors::is_error;
using saferclaw::protocol::ActionKind;
using saferclaw::protocol::ActionRequest;
using saferclaw::runtime::ActionOutcome;
using saferclaw::runtime::ActionPipeline;
using saferclaw::runtime::ActionStatus;
using saferclaw::session::AuditRecorder;

constexpr int kExitOk = 0;
constexpr int kExitBlockedOrFailed = 1;
constexpr int kExitInputError = 2;
constexpr int kExitConfigError = 3;
constexpr int kExitQueueError = 4;
constexpr int kExitAuditError = 5;

int exit_code_for(const SafetyError& err) {
    if (err.code.rfind("config_", 0) == 0) {
        return kExitConfigError;
    }
    if (err.code.rfind("audit_", 0) == 0) {
        return kExitAuditError;
    }
    switch (err.category) {
        case saferclaw::core::errors::ErrorCategory::Input:
            return kExitInputError;
        case saferclaw::core::errors::ErrorCategory::Queue:
            return kExitQueueError;
        default:
            return kExitBlockedOrFailed;
    }
}

int report(const std::string& context, const SafetyError& err) {
    LOG_ERROR(context + " [" + err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        LOG_INFO("Hint: " + err.hint);
    }
    return exit_code_for(err);
}

void print_json(const json& payload) {
    std::cout << payload.dump(2, ' ', false, json::error_handler_t::replace) << std::endl;
}

int exit_code_for(const ActionOutcome& outcome) {
    return outcome.status == ActionStatus::Blocked || outcome.status == ActionStatus::Failed
               ? kExitBlockedOrFailed
               : kExitOk;
}

ActionPipeline make_pipeline(const CliOptions& options, const SafetyConfig& config,
                             const AuditRecorder& audit) {
    auto gate = options.assume_yes
                    ? saferclaw::runtime::make_auto_approve_gate()
                    : saferclaw::runtime::make_interactive_gate(std::cin, std::cerr);
    return ActionPipeline(config, audit, gate,
                          saferclaw::runtime::PipelineOptions{options.assume_yes,
                                                              options.dry_run});
}

int print_outcome(const saferclaw::core::errors::Result<ActionOutcome>& outcome) {
    if (is_error(outcome)) {
        return report("Action aborted", get_error(outcome));
    }
    print_json(saferclaw::runtime::to_json(get_value(outcome)));
    return exit_code_for(get_value(outcome));
}

// Decodes `decoded` or audits the raw input as a malformed request.
int run_decoded(const ActionPipeline& pipeline, const ActionKind kind,
                const saferclaw::core::errors::Result<ActionRequest>& decoded,
                const json& raw) {
    if (is_error(decoded)) {
        return print_outcome(pipeline.record_malformed(kind, raw, get_error(decoded).message));
    }
    return print_outcome(pipeline.run(get_value(decoded)));
}

std::optional<ActionKind> tool_kind(const std::string& name) {
    if (name == "run_command") return ActionKind::Command;
    if (name == "read_file") return ActionKind::ReadFile;
    if (name == "write_file") return ActionKind::WriteFile;
    if (name == "run_plan") return ActionKind::Plan;
    return std::nullopt;
}

int handle_run(const CliOptions& options, const ActionPipeline& pipeline) {
    std::string joined;
    for (const auto& part : options.arguments) {
        joined += (joined.empty() ? "" : " ") + part;
    }
    auto argv = saferclaw::protocol::tokenize_command(joined);
    saferclaw::core::errors::Result<ActionRequest> decoded =
        is_error(argv) ? saferclaw::core::errors::Result<ActionRequest>{get_error(argv)}
                       : saferclaw::core::errors::Result<ActionRequest>{
                             ActionRequest{saferclaw::protocol::CommandAction{get_value(argv)}}};
    return run_decoded(pipeline, ActionKind::Command, decoded, json(joined));
}

int handle_run_plan(const CliOptions& options, const ActionPipeline& pipeline) {
    std::ifstream in(options.arguments.front());
    if (!in.is_open()) {
        return report("Unable to read plan",
                      SafetyError{saferclaw::core::errors::ErrorCategory::Input,
                                  "Plan file not found: " + options.arguments.front(),
                                  "plan_not_found"});
    }
    const std::string text((std::istreambuf_iterator<char>(in)),
                           std::istreambuf_iterator<char>());
    const json document = json::parse(text, nullptr, false);
    if (document.is_discarded()) {
        return print_outcome(pipeline.record_malformed(ActionKind::Plan, json(text),
                                                       "Plan file is not valid JSON."));
    }
    return run_decoded(pipeline, ActionKind::Plan, saferclaw::protocol::parse_plan(document),
                       document);
}

int handle_tool(const CliOptions& options, const ActionPipeline& pipeline) {
    const std::string& name = options.arguments[0];
    const auto kind = tool_kind(name);
    if (!kind.has_value()) {
        return report("Unknown tool",
                      SafetyError{saferclaw::core::errors::ErrorCategory::Input,
                                  "Unknown tool: " + name, "unknown_tool",
                                  "Use one of: run_command, read_file, write_file, run_plan."});
    }
    const json arguments = json::parse(options.arguments[1], nullptr, false);
    if (arguments.is_discarded()) {
        return print_outcome(pipeline.record_malformed(kind.value(), json(options.arguments[1]),
                                                       "Tool arguments are not valid JSON."));
    }
    return run_decoded(pipeline, kind.value(),
                       saferclaw::protocol::parse_tool_call(name, arguments), arguments);
}

int handle_enqueue(const CliOptions& options, const SafetyConfig& config) {
    auto kind = saferclaw::protocol::action_kind_from_string(options.arguments[0]);
    if (is_error(kind)) {
        return report("Invalid job kind", get_error(kind));
    }
    const json payload = json::parse(options.arguments[1], nullptr, false);
    if (payload.is_discarded()) {
        return report("Invalid job payload",
                      SafetyError{saferclaw::core::errors::ErrorCategory::Input,
                                  "Job payload is not valid JSON.", "malformed_request"});
    }

    auto opened = saferclaw::queue::JobQueue::open(config.queue_path);
    if (is_error(opened)) {
        return report("Unable to open job queue", get_error(opened));
    }
    auto& queue = *get_value(opened);
    auto id = queue.enqueue(get_value(kind), payload,
                            options.max_attempts.value_or(config.max_job_attempts));
    if (is_error(id)) {
        return report("Unable to enqueue job", get_error(id));
    }
    auto job = queue.get(get_value(id));
    if (is_error(job)) {
        return report("Unable to read enqueued job", get_error(job));
    }
    print_json(saferclaw::queue::to_json(get_value(job)));
    return kExitOk;
}

int handle_work(const CliOptions& options, const SafetyConfig& config,
                const AuditRecorder& audit) {
    auto opened = saferclaw::queue::JobQueue::open(config.queue_path);
    if (is_error(opened)) {
        return report("Unable to open job queue", get_error(opened));
    }
    const saferclaw::queue::WorkerOptions worker_options{options.assume_yes,
                                                         options.dry_run};
    saferclaw::queue::QueueWorker worker(*get_value(opened), config, audit, worker_options);
    auto reports = worker.run(options.max_jobs);
    if (is_error(reports)) {
        return report("Worker stopped", get_error(reports));
    }
    json payload = json::array();
    for (const auto& entry : get_value(reports)) {
        payload.push_back(json{{"job", saferclaw::queue::to_json(entry.job)},
                               {"outcome", saferclaw::runtime::to_json(entry.outcome)}});
    }
    print_json(payload);
    return kExitOk;
}

int handle_jobs(const CliOptions& options, const SafetyConfig& config) {
    auto opened = saferclaw::queue::JobQueue::open(config.queue_path);
    if (is_error(opened)) {
        return report("Unable to open job queue", get_error(opened));
    }
    auto jobs = get_value(opened)->list(
        saferclaw::queue::JobFilter{options.status_filter, options.limit});
    if (is_error(jobs)) {
        return report("Unable to list jobs", get_error(jobs));
    }
    json payload = json::array();
    for (const auto& job : get_value(jobs)) {
        payload.push_back(saferclaw::queue::to_json(job));
    }
    print_json(payload);
    return kExitOk;
}

int handle_requeue(const CliOptions& options, const SafetyConfig& config) {
    auto opened = saferclaw::queue::JobQueue::open(config.queue_path);
    if (is_error(opened)) {
        return report("Unable to open job queue", get_error(opened));
    }
    auto job = get_value(opened)->requeue(options.job_id);
    if (is_error(job)) {
        return report("Unable to requeue job", get_error(job));
    }
    print_json(saferclaw::queue::to_json(get_value(job)));
    return kExitOk;
}

int handle_audit(const CliOptions& options, const AuditRecorder& audit) {
    auto events = audit.read_events(options.tail);
    if (is_error(events)) {
        return report("Unable to read audit trail", get_error(events));
    }
    print_json(json(get_value(events)));
    return kExitOk;
}

}  // namespace

int main(int argc, char* argv[]) {
    // 1. Tag every log line of this invocation
    saferclaw::core::logging::Logger::get().set_session_id(
        saferclaw::core::config::generate_unique_id("session"));

    // 2. Parse CLI input and return normalized input errors
    auto parsed = saferclaw::app::cli::parse_and_validate(argc, argv);
    if (is_error(parsed)) {
        return report("Input error", get_error(parsed));
    }
    const CliOptions& options = get_value(parsed);
    if (options.verbose) {
        saferclaw::core::logging::Logger::get().set_min_level(
            saferclaw::core::logging::LogLevel::DEBUG);
    }
    LOG_DEBUG("saferclaw: bootstrapping");

    if (options.subcommand == Subcommand::InitConfig) {
        auto written = saferclaw::core::config::write_default_config(options.init_path);
        if (is_error(written)) {
            return report("Unable to write config", get_error(written));
        }
        print_json(json{{"config", get_value(written).string()}});
        return kExitOk;
    }

    // 3. Effective config: file over defaults, flags over file
    auto loaded = saferclaw::core::config::load_config(options.config_path);
    if (is_error(loaded)) {
        return report("Config error", get_error(loaded));
    }
    saferclaw::core::config::ConfigOverrides overrides;
    overrides.working_directory = options.working_directory;
    const SafetyConfig config =
        saferclaw::core::config::apply_overrides(get_value(loaded), overrides);
    LOG_DEBUG("Effective config: " + saferclaw::core::config::dump_config(config));

    const AuditRecorder audit(config.audit_file);
    const ActionPipeline pipeline = make_pipeline(options, config, audit);

    // 4. Dispatch
    switch (options.subcommand) {
        case Subcommand::Run:
            return handle_run(options, pipeline);
        case Subcommand::Read:
            return print_outcome(pipeline.run(
                ActionRequest{saferclaw::protocol::ReadFileAction{options.arguments[0]}}));
        case Subcommand::Write:
            return print_outcome(pipeline.run(ActionRequest{saferclaw::protocol::WriteFileAction{
                options.arguments[0], options.content.value_or("")}}));
        case Subcommand::RunPlan:
            return handle_run_plan(options, pipeline);
        case Subcommand::Tool:
            return handle_tool(options, pipeline);
        case Subcommand::Enqueue:
            return handle_enqueue(options, config);
        case Subcommand::Work:
            return handle_work(options, config, audit);
        case Subcommand::Jobs:
            return handle_jobs(options, config);
        case Subcommand::Requeue:
            return handle_requeue(options, config);
        case Subcommand::Audit:
            return handle_audit(options, audit);
        case Subcommand::InitConfig:
            break;
    }
    return kExitOk;
}
