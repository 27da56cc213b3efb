#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "core/errors/safety_errors.hpp"

namespace saferclaw::core::config {

// Immutable policy and runtime settings. Built once per invocation and passed
// by const reference into every policy and execution call.
struct SafetyConfig {
    std::set<std::string> allowed_commands = {
        "ls", "pwd", "find", "cat", "echo", "git", "head", "tail", "wc"};
    std::set<std::string> denied_commands = {
        "curl", "wget", "ssh",  "nc",     "sudo",    "rm",   "rmdir",
        "bash", "sh",   "zsh",  "python", "python3", "node", "deno"};
    std::vector<std::filesystem::path> allowed_roots = {
        std::filesystem::current_path()};
    std::filesystem::path working_directory = std::filesystem::current_path();
    bool require_confirmation = true;
    std::uint32_t command_timeout_seconds = 10;
    std::size_t max_output_bytes = 12000;
    bool network_access = false;
    std::vector<std::string> allowed_env = {"PATH", "HOME", "LANG", "LC_ALL",
                                            "TERM"};
    std::uint32_t max_job_attempts = 3;
    std::filesystem::path queue_path = ".saferclaw.jobs.sqlite";
    std::filesystem::path audit_file = ".saferclaw.audit.jsonl";
};

// Explicit per-call values; anything set here wins over file and defaults.
struct ConfigOverrides {
    std::optional<std::filesystem::path> working_directory;
    std::optional<bool> require_confirmation;
    std::optional<std::uint32_t> command_timeout_seconds;
    std::optional<std::size_t> max_output_bytes;
    std::optional<bool> network_access;
    std::optional<std::uint32_t> max_job_attempts;
    std::optional<std::filesystem::path> queue_path;
    std::optional<std::filesystem::path> audit_file;
};

core::errors::Result<SafetyConfig> load_config(
    const std::optional<std::filesystem::path>& path);

SafetyConfig apply_overrides(SafetyConfig config, const ConfigOverrides& overrides);

std::string dump_config(const SafetyConfig& config);

core::errors::Result<std::filesystem::path> write_default_config(
    const std::filesystem::path& path);

}  // namespace saferclaw::core::config
