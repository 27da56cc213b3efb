#include "app/cli_parser.hpp"
#include <charconv>
#include <limits>
#include <system_error>

namespace saferclaw::app::cli {

    using namespace saferclaw::core::errors;

    namespace {

        // Raw Options (Internal only): strings exactly as typed.
        struct RawCliOptions {
            std::optional<std::string> content;
            std::optional<std::string> path;
            std::optional<std::string> max_attempts;
            std::optional<std::string> max_jobs;
            std::optional<std::string> status;
            std::optional<std::string> limit;
            std::optional<std::string> tail;
        };

        SafetyError usage_error(const std::string& message, const std::string& code) {
            return SafetyError{ErrorCategory::Input, message, code, usage()};
        }

        // Exception-free integer parsing with inclusive bounds.
        template <typename T>
        Result<T> parse_bounded(const std::string& text, const std::string& flag, T min, T max) {
            T value = 0;
            const char* begin = text.data();
            const char* end = text.data() + text.size();
            auto [ptr, ec] = std::from_chars(begin, end, value);
            if (ec != std::errc() || ptr != end) {
                return SafetyError{ErrorCategory::Input, "Invalid number for " + flag, "invalid_integer", "Provide a non-negative integer."};
            }
            if (value < min || value > max) {
                return SafetyError{ErrorCategory::Input, flag + " out of bounds", "bounds_error",
                                   "Must be between " + std::to_string(min) + " and " + std::to_string(max) + "."};
            }
            return value;
        }

        Result<Subcommand> subcommand_from_string(const std::string& name) {
            if (name == "init-config") return Subcommand::InitConfig;
            if (name == "run") return Subcommand::Run;
            if (name == "read") return Subcommand::Read;
            if (name == "write") return Subcommand::Write;
            if (name == "run-plan") return Subcommand::RunPlan;
            if (name == "tool") return Subcommand::Tool;
            if (name == "enqueue") return Subcommand::Enqueue;
            if (name == "work") return Subcommand::Work;
            if (name == "jobs") return Subcommand::Jobs;
            if (name == "requeue") return Subcommand::Requeue;
            if (name == "audit") return Subcommand::Audit;
            return usage_error("Unknown command: " + name, "unknown_command");
        }

        Result<std::filesystem::path> validate_directory(const std::string& raw) {
            std::filesystem::path p(raw);
            std::error_code path_ec;
            const bool is_dir = std::filesystem::is_directory(p, path_ec);
            if (path_ec || !is_dir) {
                return SafetyError{ErrorCategory::Input, "Working directory does not exist or is not a directory", "invalid_path"};
            }
            std::filesystem::path canonical_path = std::filesystem::canonical(p, path_ec);
            if (path_ec) {
                return SafetyError{ErrorCategory::Input, "Failed to canonicalize working directory", "invalid_path"};
            }
            return canonical_path;
        }

        Result<bool> expect_positional(const CliOptions& options, std::size_t count, const std::string& shape) {
            if (options.arguments.size() != count) {
                return usage_error("Expected: saferclaw " + shape, "missing_argument");
            }
            return true;
        }

    }  // namespace

    std::string usage() {
        return "Usage: saferclaw [--config P] [--dry-run] [--yes] [--cwd D] [--verbose] <command>\n"
               "  init-config [--path P]\n"
               "  run <command...>\n"
               "  read <path>\n"
               "  write <path> --content TEXT\n"
               "  run-plan <file>\n"
               "  tool <name> <json-arguments>\n"
               "  enqueue <kind> <json-payload> [--max-attempts N]\n"
               "  work [--max-jobs N]\n"
               "  jobs [--status S] [--limit N]\n"
               "  requeue <id>\n"
               "  audit [--tail N]";
    }

    Result<CliOptions> parse_and_validate(int argc, char* argv[]) {
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) { // Skip program name
            args.push_back(argv[i]);
        }

        CliOptions options;
        std::optional<std::string> raw_cwd;

        // 1. Global flags up to the first non-flag token
        std::size_t i = 0;
        for (; i < args.size() && args[i].rfind("--", 0) == 0; ++i) {
            if (args[i] == "--config") {
                if (i + 1 < args.size()) options.config_path = std::filesystem::path(args[++i]);
                else return SafetyError{ErrorCategory::Input, "Missing value for --config", "missing_value"};
            } else if (args[i] == "--cwd") {
                if (i + 1 < args.size()) raw_cwd = args[++i];
                else return SafetyError{ErrorCategory::Input, "Missing value for --cwd", "missing_value"};
            } else if (args[i] == "--dry-run") {
                options.dry_run = true;
            } else if (args[i] == "--yes") {
                options.assume_yes = true;
            } else if (args[i] == "--verbose") {
                options.verbose = true;
            } else {
                return usage_error("Unknown argument: " + args[i], "unknown_argument");
            }
        }

        if (i >= args.size()) {
            return usage_error("No command provided.", "missing_command");
        }
        auto subcommand = subcommand_from_string(args[i++]);
        if (is_error(subcommand)) {
            return get_error(subcommand);
        }
        options.subcommand = get_value(subcommand);

        // 2. Subcommand arguments. `run` takes everything verbatim so that
        // flags of the target command are not mistaken for ours.
        RawCliOptions raw;
        for (; i < args.size(); ++i) {
            const std::string& arg = args[i];
            if (options.subcommand == Subcommand::Run || arg.rfind("--", 0) != 0) {
                options.arguments.push_back(arg);
                continue;
            }

            std::optional<std::string>* slot = nullptr;
            if (arg == "--content" && options.subcommand == Subcommand::Write) slot = &raw.content;
            else if (arg == "--path" && options.subcommand == Subcommand::InitConfig) slot = &raw.path;
            else if (arg == "--max-attempts" && options.subcommand == Subcommand::Enqueue) slot = &raw.max_attempts;
            else if (arg == "--max-jobs" && options.subcommand == Subcommand::Work) slot = &raw.max_jobs;
            else if (arg == "--status" && options.subcommand == Subcommand::Jobs) slot = &raw.status;
            else if (arg == "--limit" && options.subcommand == Subcommand::Jobs) slot = &raw.limit;
            else if (arg == "--tail" && options.subcommand == Subcommand::Audit) slot = &raw.tail;
            else return usage_error("Unknown argument: " + arg, "unknown_argument");

            if (i + 1 < args.size()) *slot = args[++i];
            else return SafetyError{ErrorCategory::Input, "Missing value for " + arg, "missing_value"};
        }

        // 3. Validator Phase: Enforce arity and bounds
        Result<bool> arity = true;
        switch (options.subcommand) {
            case Subcommand::InitConfig:
                arity = expect_positional(options, 0, "init-config [--path P]");
                if (raw.path) options.init_path = std::filesystem::path(raw.path.value());
                break;
            case Subcommand::Run:
                if (options.arguments.empty()) {
                    return usage_error("Expected: saferclaw run <command...>", "missing_argument");
                }
                break;
            case Subcommand::Read:
                arity = expect_positional(options, 1, "read <path>");
                break;
            case Subcommand::Write:
                arity = expect_positional(options, 1, "write <path> --content TEXT");
                if (!raw.content) {
                    return SafetyError{ErrorCategory::Input, "write requires --content", "missing_required_flag"};
                }
                options.content = raw.content;
                break;
            case Subcommand::RunPlan:
                arity = expect_positional(options, 1, "run-plan <file>");
                break;
            case Subcommand::Tool:
                arity = expect_positional(options, 2, "tool <name> <json-arguments>");
                break;
            case Subcommand::Enqueue:
                arity = expect_positional(options, 2, "enqueue <kind> <json-payload> [--max-attempts N]");
                if (raw.max_attempts) {
                    auto attempts = parse_bounded<std::uint32_t>(raw.max_attempts.value(), "--max-attempts", 1, 1000);
                    if (is_error(attempts)) return get_error(attempts);
                    options.max_attempts = get_value(attempts);
                }
                break;
            case Subcommand::Work:
                arity = expect_positional(options, 0, "work [--max-jobs N]");
                if (raw.max_jobs) {
                    auto jobs = parse_bounded<std::size_t>(raw.max_jobs.value(), "--max-jobs", 0, 100000);
                    if (is_error(jobs)) return get_error(jobs);
                    options.max_jobs = get_value(jobs);
                }
                break;
            case Subcommand::Jobs:
                arity = expect_positional(options, 0, "jobs [--status S] [--limit N]");
                if (raw.status) {
                    auto status = saferclaw::queue::job_status_from_string(raw.status.value());
                    if (is_error(status)) return get_error(status);
                    options.status_filter = get_value(status);
                }
                if (raw.limit) {
                    auto limit = parse_bounded<std::size_t>(raw.limit.value(), "--limit", 1, 10000);
                    if (is_error(limit)) return get_error(limit);
                    options.limit = get_value(limit);
                }
                break;
            case Subcommand::Requeue: {
                arity = expect_positional(options, 1, "requeue <id>");
                if (is_error(arity)) break;
                auto id = parse_bounded<std::int64_t>(options.arguments.front(), "job id", 1,
                                                      std::numeric_limits<std::int64_t>::max());
                if (is_error(id)) return get_error(id);
                options.job_id = get_value(id);
                break;
            }
            case Subcommand::Audit:
                arity = expect_positional(options, 0, "audit [--tail N]");
                if (raw.tail) {
                    auto tail = parse_bounded<std::size_t>(raw.tail.value(), "--tail", 1, 100000);
                    if (is_error(tail)) return get_error(tail);
                    options.tail = get_value(tail);
                }
                break;
        }
        if (is_error(arity)) {
            return get_error(arity);
        }

        // Path validation
        if (raw_cwd) {
            auto cwd = validate_directory(raw_cwd.value());
            if (is_error(cwd)) return get_error(cwd);
            options.working_directory = get_value(cwd);
        }

        return options;
    }

} // namespace saferclaw::app::cli
