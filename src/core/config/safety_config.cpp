#include "core/config/safety_config.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/util/common.hpp"

namespace saferclaw::core::config {

using core::errors::ErrorCategory;
using core::errors::SafetyError;
using nlohmann::json;
using core::util::lowercase;

namespace {

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

SafetyError invalid_value(const std::string& key, const std::string& expected) {
    return SafetyError{ErrorCategory::Input,
                       "Config key '" + key + "' must be " + expected + ".",
                       "config_invalid_value"};
}

std::filesystem::path anchor(const std::filesystem::path& value) {
    if (value.is_absolute()) {
        return value;
    }
    return std::filesystem::current_path() / value;
}

core::errors::Result<std::vector<std::string>> read_string_list(
    const json& raw, const std::string& key) {
    std::vector<std::string> values;
    if (!raw.contains(key) || raw.at(key).is_null()) {
        return values;
    }
    const json& node = raw.at(key);
    if (!node.is_array()) {
        return invalid_value(key, "a list of strings");
    }
    for (const auto& item : node) {
        if (!item.is_string()) {
            return invalid_value(key, "a list of strings");
        }
        const std::string cleaned = trim(item.get<std::string>());
        if (!cleaned.empty()) {
            values.push_back(cleaned);
        }
    }
    return values;
}

core::errors::Result<bool> read_bool(const json& raw, const std::string& key,
                                     const bool fallback) {
    if (!raw.contains(key) || raw.at(key).is_null()) {
        return fallback;
    }
    const json& node = raw.at(key);
    if (node.is_boolean()) {
        return node.get<bool>();
    }
    if (node.is_number_integer()) {
        return node.get<std::int64_t>() != 0;
    }
    if (node.is_string()) {
        const std::string text = lowercase(trim(node.get<std::string>()));
        if (text == "1" || text == "true" || text == "yes" || text == "on") {
            return true;
        }
        if (text == "0" || text == "false" || text == "no" || text == "off") {
            return false;
        }
    }
    return invalid_value(key, "a boolean");
}

core::errors::Result<std::uint64_t> read_unsigned(const json& raw,
                                                  const std::string& key,
                                                  const std::uint64_t fallback) {
    if (!raw.contains(key) || raw.at(key).is_null()) {
        return fallback;
    }
    const json& node = raw.at(key);
    if (node.is_number_unsigned()) {
        return node.get<std::uint64_t>();
    }
    if (node.is_number_integer()) {
        const auto value = node.get<std::int64_t>();
        if (value < 0) {
            return invalid_value(key, "a non-negative integer");
        }
        return static_cast<std::uint64_t>(value);
    }
    if (node.is_number_float()) {
        const double value = node.get<double>();
        // max() rounds up to 2^64 as a double, so anything at or above it
        // would overflow the conversion.
        constexpr double kUnsignedLimit =
            static_cast<double>(std::numeric_limits<std::uint64_t>::max());
        if (!std::isfinite(value) || value < 0.0 || value >= kUnsignedLimit ||
            std::trunc(value) != value) {
            return invalid_value(key, "a non-negative integer");
        }
        return static_cast<std::uint64_t>(value);
    }
    if (node.is_string()) {
        const std::string text = trim(node.get<std::string>());
        if (!text.empty() &&
            std::all_of(text.begin(), text.end(),
                        [](const unsigned char c) { return std::isdigit(c) != 0; })) {
            try {
                return static_cast<std::uint64_t>(std::stoull(text));
            } catch (const std::out_of_range&) {
                return invalid_value(key, "a non-negative integer");
            }
        }
    }
    return invalid_value(key, "a non-negative integer");
}

std::set<std::string> to_command_set(const std::vector<std::string>& values) {
    std::set<std::string> out;
    for (const auto& value : values) {
        out.insert(lowercase(value));
    }
    return out;
}

}  // namespace

core::errors::Result<SafetyConfig> load_config(
    const std::optional<std::filesystem::path>& path) {
    SafetyConfig config;
    if (!path.has_value()) {
        return config;
    }

    std::error_code ec;
    if (!std::filesystem::exists(path.value(), ec) || ec) {
        return SafetyError{ErrorCategory::Input,
                           "Config file not found: " + path->string(),
                           "config_not_found",
                           "Create one with: saferclaw init-config --path " +
                               path->string()};
    }

    std::ifstream in(path.value());
    if (!in.is_open()) {
        return SafetyError{ErrorCategory::Input,
                           "Unable to open config file: " + path->string(),
                           "config_not_found"};
    }

    const json raw = json::parse(in, nullptr, false);
    if (raw.is_discarded()) {
        return SafetyError{ErrorCategory::Input,
                           "Config file is not valid JSON: " + path->string(),
                           "config_parse_error"};
    }
    if (!raw.is_object()) {
        return SafetyError{ErrorCategory::Input,
                           "Config file must contain a JSON object.",
                           "config_parse_error"};
    }

    auto allowed = read_string_list(raw, "allowed_commands");
    if (core::errors::is_error(allowed)) {
        return core::errors::get_error(allowed);
    }
    if (!core::errors::get_value(allowed).empty()) {
        config.allowed_commands = to_command_set(core::errors::get_value(allowed));
    }

    auto denied = read_string_list(raw, "denied_commands");
    if (core::errors::is_error(denied)) {
        return core::errors::get_error(denied);
    }
    if (!core::errors::get_value(denied).empty()) {
        config.denied_commands = to_command_set(core::errors::get_value(denied));
    }

    auto roots = read_string_list(raw, "allowed_roots");
    if (core::errors::is_error(roots)) {
        return core::errors::get_error(roots);
    }
    if (!core::errors::get_value(roots).empty()) {
        config.allowed_roots.clear();
        for (const auto& root : core::errors::get_value(roots)) {
            config.allowed_roots.push_back(anchor(root));
        }
    }

    auto env = read_string_list(raw, "allowed_env");
    if (core::errors::is_error(env)) {
        return core::errors::get_error(env);
    }
    if (raw.contains("allowed_env") && raw.at("allowed_env").is_array()) {
        config.allowed_env = core::errors::get_value(env);
    }

    auto confirmation =
        read_bool(raw, "require_confirmation", config.require_confirmation);
    if (core::errors::is_error(confirmation)) {
        return core::errors::get_error(confirmation);
    }
    config.require_confirmation = core::errors::get_value(confirmation);

    auto network = read_bool(raw, "network_access", config.network_access);
    if (core::errors::is_error(network)) {
        return core::errors::get_error(network);
    }
    config.network_access = core::errors::get_value(network);

    auto timeout = read_unsigned(raw, "command_timeout_seconds",
                                 config.command_timeout_seconds);
    if (core::errors::is_error(timeout)) {
        return core::errors::get_error(timeout);
    }
    if (core::errors::get_value(timeout) == 0 ||
        core::errors::get_value(timeout) > 86400) {
        return invalid_value("command_timeout_seconds", "between 1 and 86400");
    }
    config.command_timeout_seconds =
        static_cast<std::uint32_t>(core::errors::get_value(timeout));

    auto max_output =
        read_unsigned(raw, "max_output_bytes", config.max_output_bytes);
    if (core::errors::is_error(max_output)) {
        return core::errors::get_error(max_output);
    }
    if (core::errors::get_value(max_output) == 0) {
        return invalid_value("max_output_bytes", "greater than zero");
    }
    config.max_output_bytes =
        static_cast<std::size_t>(core::errors::get_value(max_output));

    auto attempts =
        read_unsigned(raw, "max_job_attempts", config.max_job_attempts);
    if (core::errors::is_error(attempts)) {
        return core::errors::get_error(attempts);
    }
    if (core::errors::get_value(attempts) == 0 ||
        core::errors::get_value(attempts) > 1000) {
        return invalid_value("max_job_attempts", "between 1 and 1000");
    }
    config.max_job_attempts =
        static_cast<std::uint32_t>(core::errors::get_value(attempts));

    for (const char* key : {"working_directory", "queue_path", "audit_file"}) {
        if (!raw.contains(key) || raw.at(key).is_null()) {
            continue;
        }
        if (!raw.at(key).is_string() || raw.at(key).get<std::string>().empty()) {
            return invalid_value(key, "a non-empty string");
        }
        const std::filesystem::path value = anchor(raw.at(key).get<std::string>());
        if (std::string(key) == "working_directory") {
            config.working_directory = value;
        } else if (std::string(key) == "queue_path") {
            config.queue_path = value;
        } else {
            config.audit_file = value;
        }
    }

    return config;
}

SafetyConfig apply_overrides(SafetyConfig config, const ConfigOverrides& overrides) {
    if (overrides.working_directory) {
        config.working_directory = overrides.working_directory.value();
    }
    if (overrides.require_confirmation) {
        config.require_confirmation = overrides.require_confirmation.value();
    }
    if (overrides.command_timeout_seconds) {
        config.command_timeout_seconds = overrides.command_timeout_seconds.value();
    }
    if (overrides.max_output_bytes) {
        config.max_output_bytes = overrides.max_output_bytes.value();
    }
    if (overrides.network_access) {
        config.network_access = overrides.network_access.value();
    }
    if (overrides.max_job_attempts) {
        config.max_job_attempts = overrides.max_job_attempts.value();
    }
    if (overrides.queue_path) {
        config.queue_path = overrides.queue_path.value();
    }
    if (overrides.audit_file) {
        config.audit_file = overrides.audit_file.value();
    }
    return config;
}

std::string dump_config(const SafetyConfig& config) {
    json payload;
    payload["allowed_commands"] = config.allowed_commands;
    payload["denied_commands"] = config.denied_commands;
    json roots = json::array();
    for (const auto& root : config.allowed_roots) {
        roots.push_back(root.string());
    }
    payload["allowed_roots"] = roots;
    payload["working_directory"] = config.working_directory.string();
    payload["require_confirmation"] = config.require_confirmation;
    payload["command_timeout_seconds"] = config.command_timeout_seconds;
    payload["max_output_bytes"] = config.max_output_bytes;
    payload["network_access"] = config.network_access;
    payload["allowed_env"] = config.allowed_env;
    payload["max_job_attempts"] = config.max_job_attempts;
    payload["queue_path"] = config.queue_path.string();
    payload["audit_file"] = config.audit_file.string();
    return payload.dump(2);
}

core::errors::Result<std::filesystem::path> write_default_config(
    const std::filesystem::path& path) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return SafetyError{ErrorCategory::Internal,
                               "Unable to create config directory: " +
                                   path.parent_path().string(),
                               "config_write_failed"};
        }
    }

    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        return SafetyError{ErrorCategory::Internal,
                           "Unable to open config file for writing: " + path.string(),
                           "config_write_failed"};
    }
    out << dump_config(SafetyConfig{}) << "\n";
    if (!out.good()) {
        return SafetyError{ErrorCategory::Internal,
                           "Unable to write config file: " + path.string(),
                           "config_write_failed"};
    }
    return path;
}

}  // namespace saferclaw::core::config
