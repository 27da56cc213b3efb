#include <filesystem>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "app/cli_parser.hpp"
#include "core/errors/safety_errors.hpp"

namespace {

using saferclaw::app::cli::CliOptions;
using saferclaw::app::cli::Subcommand;
using saferclaw::app::cli::parse_and_validate;
using saferclaw::core::errors::ErrorCategory;
using saferclaw::core::errors::get_error;
using saferclaw::core::errors::get_value;
using saferclaw::core::errors::is_error;

saferclaw::core::errors::Result<CliOptions> parse_tokens(
    const std::vector<std::string>& tokens) {
    std::vector<std::string> owned_args;
    owned_args.reserve(tokens.size() + 1);
    owned_args.emplace_back("saferclaw");
    for (const auto& token : tokens) {
        owned_args.push_back(token);
    }

    std::vector<char*> argv;
    argv.reserve(owned_args.size());
    for (auto& arg : owned_args) {
        argv.push_back(arg.data());
    }

    return parse_and_validate(static_cast<int>(argv.size()), argv.data());
}

TEST(CliParserTest, FailsWhenCommandMissing) {
    auto result = parse_tokens({"--yes"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(result).code, "missing_command");
    EXPECT_FALSE(get_error(result).hint.empty());
}

TEST(CliParserTest, FailsWhenCommandUnknown) {
    auto result = parse_tokens({"status"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_command");
}

TEST(CliParserTest, ParsesGlobalFlags) {
    auto result = parse_tokens({"--config", "cfg.json", "--dry-run", "--yes", "--verbose",
                                "--cwd", ".", "read", "notes.txt"});
    ASSERT_FALSE(is_error(result));
    const auto& options = get_value(result);
    EXPECT_EQ(options.subcommand, Subcommand::Read);
    ASSERT_TRUE(options.config_path.has_value());
    EXPECT_EQ(options.config_path.value(), std::filesystem::path("cfg.json"));
    EXPECT_TRUE(options.dry_run);
    EXPECT_TRUE(options.assume_yes);
    EXPECT_TRUE(options.verbose);
    ASSERT_TRUE(options.working_directory.has_value());
    EXPECT_EQ(options.working_directory.value(),
              std::filesystem::canonical(std::filesystem::current_path()));
    EXPECT_EQ(options.arguments, (std::vector<std::string>{"notes.txt"}));
}

TEST(CliParserTest, RunKeepsTargetFlagsVerbatim) {
    auto result = parse_tokens({"run", "ls", "-la", "--color=never"});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).subcommand, Subcommand::Run);
    EXPECT_EQ(get_value(result).arguments,
              (std::vector<std::string>{"ls", "-la", "--color=never"}));
}

TEST(CliParserTest, RunRequiresACommand) {
    auto result = parse_tokens({"run"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_argument");
}

TEST(CliParserTest, WriteRequiresContent) {
    auto missing = parse_tokens({"write", "out.txt"});
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "missing_required_flag");

    auto ok = parse_tokens({"write", "out.txt", "--content", "--not-a-flag"});
    ASSERT_FALSE(is_error(ok));
    EXPECT_EQ(get_value(ok).content.value_or(""), "--not-a-flag");
}

TEST(CliParserTest, FlagsAreScopedToTheirSubcommand) {
    auto result = parse_tokens({"read", "a.txt", "--content", "x"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_argument");
}

TEST(CliParserTest, MissingFlagValueIsReported) {
    auto result = parse_tokens({"jobs", "--limit"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_value");
}

TEST(CliParserTest, EnqueueMaxAttemptsIsBounded) {
    auto ok = parse_tokens({"enqueue", "command", R"({"command": "ls"})", "--max-attempts", "5"});
    ASSERT_FALSE(is_error(ok));
    EXPECT_EQ(get_value(ok).max_attempts.value_or(0), 5u);

    auto zero = parse_tokens({"enqueue", "command", "{}", "--max-attempts", "0"});
    ASSERT_TRUE(is_error(zero));
    EXPECT_EQ(get_error(zero).code, "bounds_error");

    auto text = parse_tokens({"enqueue", "command", "{}", "--max-attempts", "three"});
    ASSERT_TRUE(is_error(text));
    EXPECT_EQ(get_error(text).code, "invalid_integer");
}

TEST(CliParserTest, EnqueueNeedsKindAndPayload) {
    auto result = parse_tokens({"enqueue", "command"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_argument");
}

TEST(CliParserTest, JobsStatusMustBeKnown) {
    auto ok = parse_tokens({"jobs", "--status", "failed", "--limit", "5"});
    ASSERT_FALSE(is_error(ok));
    ASSERT_TRUE(get_value(ok).status_filter.has_value());
    EXPECT_EQ(get_value(ok).status_filter.value(), saferclaw::queue::JobStatus::Failed);
    EXPECT_EQ(get_value(ok).limit, 5u);

    auto bad = parse_tokens({"jobs", "--status", "exploded"});
    ASSERT_TRUE(is_error(bad));
    EXPECT_EQ(get_error(bad).code, "invalid_job_status");
}

TEST(CliParserTest, RequeueParsesJobId) {
    auto ok = parse_tokens({"requeue", "17"});
    ASSERT_FALSE(is_error(ok));
    EXPECT_EQ(get_value(ok).job_id, 17);

    auto negative = parse_tokens({"requeue", "-3"});
    ASSERT_TRUE(is_error(negative));
}

TEST(CliParserTest, WorkAndAuditDefaults) {
    auto work = parse_tokens({"work"});
    ASSERT_FALSE(is_error(work));
    EXPECT_EQ(get_value(work).max_jobs, 0u);

    auto audit = parse_tokens({"audit", "--tail", "3"});
    ASSERT_FALSE(is_error(audit));
    EXPECT_EQ(get_value(audit).tail, 3u);
}

TEST(CliParserTest, InitConfigTakesOptionalPath) {
    auto defaults = parse_tokens({"init-config"});
    ASSERT_FALSE(is_error(defaults));
    EXPECT_EQ(get_value(defaults).init_path, std::filesystem::path(".saferclaw.config.json"));

    auto custom = parse_tokens({"init-config", "--path", "conf/x.json"});
    ASSERT_FALSE(is_error(custom));
    EXPECT_EQ(get_value(custom).init_path, std::filesystem::path("conf/x.json"));
}

TEST(CliParserTest, FailsWhenCwdDoesNotExist) {
    auto result = parse_tokens({"--cwd", "/path/that/does/not/exist", "run", "ls"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_path");
}

}  // namespace
