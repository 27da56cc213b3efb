#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/safety_errors.hpp"
#include "queue/job.hpp"

namespace saferclaw::app::cli {

    enum class Subcommand {
        InitConfig,
        Run,
        Read,
        Write,
        RunPlan,
        Tool,
        Enqueue,
        Work,
        Jobs,
        Requeue,
        Audit
    };

    struct CliOptions {
        Subcommand subcommand = Subcommand::Run;

        // Global flags, accepted before the subcommand.
        std::optional<std::filesystem::path> config_path;
        std::optional<std::filesystem::path> working_directory;
        bool dry_run = false;
        bool assume_yes = false;
        bool verbose = false;

        // Positional arguments of the subcommand.
        std::vector<std::string> arguments;

        std::filesystem::path init_path = ".saferclaw.config.json";
        std::optional<std::string> content;
        std::optional<std::uint32_t> max_attempts;
        std::size_t max_jobs = 0;
        std::optional<queue::JobStatus> status_filter;
        std::size_t limit = 50;
        std::size_t tail = 20;
        std::int64_t job_id = 0;
    };

    saferclaw::core::errors::Result<CliOptions> parse_and_validate(int argc, char* argv[]);

    std::string usage();
}
