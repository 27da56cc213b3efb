#include "policy/policy_engine.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <deque>
#include <system_error>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include "core/util/common.hpp"

namespace saferclaw::policy {

using core::config::SafetyConfig;
using core::errors::ErrorCategory;
using core::errors::SafetyError;
using protocol::ActionRequest;
using protocol::CommandAction;
using protocol::PlanAction;
using protocol::ReadFileAction;
using protocol::WriteFileAction;
using core::util::kAlwaysFalse;
using core::util::lowercase;

namespace {

constexpr int kMaxSymlinkHops = 40;

constexpr std::array<const char*, 8> kShellOperators = {
    "&&", "||", "|", ";", "`", "$(", "\n", "\r"};

const std::unordered_set<std::string>& network_executables() {
    static const std::unordered_set<std::string> names = {
        "curl", "wget", "nc", "ncat", "netcat", "ssh", "scp", "sftp", "ftp", "telnet"};
    return names;
}

std::filesystem::path anchored(const std::filesystem::path& base,
                               const std::filesystem::path& path) {
    if (path.is_absolute()) {
        return path;
    }
    return base / path;
}

}  // namespace

std::string to_string(const DenyReason reason) {
    switch (reason) {
        case DenyReason::NotAllowlisted:
            return "not_allowlisted";
        case DenyReason::Denylisted:
            return "denylisted";
        case DenyReason::ShellOperatorPresent:
            return "shell_operator_present";
        case DenyReason::PathOutsideRoots:
            return "path_outside_roots";
        case DenyReason::MalformedRequest:
            return "malformed_request";
        case DenyReason::NetworkDisabled:
            return "network_disabled";
        default:
            return "unknown";
    }
}

bool PolicyEngine::is_within_root(const std::filesystem::path& root,
                                  const std::filesystem::path& child) {
    auto root_it = root.begin();
    auto child_it = child.begin();
    for (; root_it != root.end() && child_it != child.end(); ++root_it, ++child_it) {
        if (*root_it != *child_it) {
            return false;
        }
    }
    return root_it == root.end();
}

core::errors::Result<std::filesystem::path> PolicyEngine::resolve_real_path(
    const std::filesystem::path& absolute) {
    // Walks one component at a time like realpath(3). A missing component
    // does not stop resolution: a later ".." can step back to an existing
    // directory whose symlinks must still be followed.
    std::filesystem::path resolved = absolute.root_path();
    const std::filesystem::path relative = absolute.relative_path();
    std::deque<std::filesystem::path> pending(relative.begin(), relative.end());
    int hops = 0;
    while (!pending.empty()) {
        const std::filesystem::path part = pending.front();
        pending.pop_front();
        if (part.empty() || part == ".") {
            continue;
        }
        if (part == "..") {
            resolved = resolved.parent_path();
            continue;
        }

        const std::filesystem::path next = resolved / part;
        std::error_code ec;
        const auto status = std::filesystem::symlink_status(next, ec);
        if (ec || !std::filesystem::is_symlink(status)) {
            resolved = next;
            continue;
        }

        if (++hops > kMaxSymlinkHops) {
            return SafetyError{ErrorCategory::Policy,
                               "Too many levels of symbolic links: " + absolute.string(),
                               "path_outside_roots"};
        }
        const std::filesystem::path target = std::filesystem::read_symlink(next, ec);
        if (ec) {
            return SafetyError{ErrorCategory::Policy,
                               "Unable to read symbolic link: " + next.string(),
                               "path_outside_roots"};
        }
        if (target.is_absolute()) {
            resolved = target.root_path();
        }
        const std::filesystem::path target_relative = target.relative_path();
        pending.insert(pending.begin(), target_relative.begin(), target_relative.end());
    }
    return resolved;
}

bool PolicyEngine::contains_shell_operator(const std::string& token) {
    return std::any_of(kShellOperators.begin(), kShellOperators.end(),
                       [&token](const char* op) {
                           return token.find(op) != std::string::npos;
                       });
}

std::string PolicyEngine::executable_name(const std::string& token) {
    return lowercase(std::filesystem::path(token).filename().string());
}

bool PolicyEngine::looks_like_path(const std::string& token) {
    return token.find('/') != std::string::npos || token.rfind('~', 0) == 0 ||
           token.rfind('.', 0) == 0;
}

core::errors::Result<std::filesystem::path> PolicyEngine::resolve_allowed_path(
    const std::string& path, const SafetyConfig& config) const {
    if (path.empty() || path.find('\0') != std::string::npos) {
        return SafetyError{ErrorCategory::Policy,
                           "Path is empty or contains a NUL byte.",
                           "malformed_request"};
    }

    std::error_code ec;
    const std::filesystem::path cwd = std::filesystem::current_path(ec);
    if (ec) {
        return SafetyError{ErrorCategory::Input, "Unable to read current directory.",
                           "invalid_working_directory"};
    }
    auto base = resolve_real_path(anchored(cwd, config.working_directory));
    if (core::errors::is_error(base)) {
        return SafetyError{ErrorCategory::Input,
                           "Unable to resolve working directory: " +
                               config.working_directory.string(),
                           "invalid_working_directory"};
    }
    const std::filesystem::path& base_path = core::errors::get_value(base);

    auto candidate = resolve_real_path(anchored(base_path, path));
    if (core::errors::is_error(candidate)) {
        return core::errors::get_error(candidate);
    }
    const std::filesystem::path& canonical_candidate = core::errors::get_value(candidate);

    for (const auto& root : config.allowed_roots) {
        auto canonical_root = resolve_real_path(anchored(base_path, root));
        if (core::errors::is_error(canonical_root)) {
            continue;
        }
        if (is_within_root(core::errors::get_value(canonical_root), canonical_candidate)) {
            return canonical_candidate;
        }
    }

    return SafetyError{ErrorCategory::Policy,
                       "Path is outside allowed roots: " +
                           canonical_candidate.string(),
                       "path_outside_roots"};
}

PolicyDecision PolicyEngine::evaluate_path(const std::string& path,
                                           const SafetyConfig& config) const {
    auto resolved = resolve_allowed_path(path, config);
    if (!core::errors::is_error(resolved)) {
        return PolicyDecision::allow();
    }
    const auto& err = core::errors::get_error(resolved);
    const DenyReason reason = err.code == "malformed_request"
                                  ? DenyReason::MalformedRequest
                                  : DenyReason::PathOutsideRoots;
    return PolicyDecision::deny(reason, err.message);
}

PolicyDecision PolicyEngine::evaluate_command(const CommandAction& command,
                                              const SafetyConfig& config) const {
    if (command.argv.empty() || command.argv.front().empty()) {
        return PolicyDecision::deny(DenyReason::MalformedRequest, "Empty command.");
    }
    for (const auto& token : command.argv) {
        if (token.find('\0') != std::string::npos) {
            return PolicyDecision::deny(DenyReason::MalformedRequest,
                                        "Command contains a NUL byte.");
        }
    }

    for (const auto& token : command.argv) {
        if (contains_shell_operator(token)) {
            return PolicyDecision::deny(DenyReason::ShellOperatorPresent,
                                        "Command separators/operators are not allowed.");
        }
    }

    const std::string executable = executable_name(command.argv.front());
    if (config.denied_commands.count(executable) != 0) {
        return PolicyDecision::deny(DenyReason::Denylisted,
                                    "Executable is denied: " + executable);
    }
    if (!config.network_access && network_executables().count(executable) != 0) {
        return PolicyDecision::deny(DenyReason::NetworkDisabled,
                                    "Network executable blocked by policy: " + executable);
    }
    if (config.allowed_commands.count(executable) == 0) {
        return PolicyDecision::deny(DenyReason::NotAllowlisted,
                                    "Executable is not allowlisted: " + executable);
    }

    const PolicyDecision cwd = evaluate_path(config.working_directory.string(), config);
    if (!cwd.allowed) {
        return PolicyDecision::deny(cwd.reason, "Working directory: " + cwd.detail);
    }

    if (command.argv.front().find('/') != std::string::npos) {
        const PolicyDecision exe = evaluate_path(command.argv.front(), config);
        if (!exe.allowed) {
            return exe;
        }
    }

    for (std::size_t i = 1; i < command.argv.size(); ++i) {
        std::string candidate = command.argv[i];
        if (candidate.rfind('-', 0) == 0) {
            const auto eq = candidate.find('=');
            if (eq == std::string::npos) {
                continue;
            }
            candidate = candidate.substr(eq + 1);
        }
        if (!looks_like_path(candidate)) {
            continue;
        }
        const PolicyDecision arg = evaluate_path(candidate, config);
        if (!arg.allowed) {
            return PolicyDecision::deny(arg.reason, "Argument " + std::to_string(i) +
                                                        ": " + arg.detail);
        }
    }

    return PolicyDecision::allow();
}

PolicyDecision PolicyEngine::evaluate_plan(const PlanAction& plan,
                                           const SafetyConfig& config) const {
    if (plan.steps.empty()) {
        return PolicyDecision::deny(DenyReason::MalformedRequest, "Plan has no steps.");
    }

    std::size_t index = 1;
    for (const auto& step : plan.steps) {
        if (std::holds_alternative<PlanAction>(step.action)) {
            return PolicyDecision::deny(DenyReason::MalformedRequest,
                                        "Plan step " + std::to_string(index) +
                                            ": nested plans are not supported.");
        }
        const PolicyDecision decision = evaluate(step, config);
        if (!decision.allowed) {
            return PolicyDecision::deny(decision.reason, "Plan step " +
                                                             std::to_string(index) +
                                                             ": " + decision.detail);
        }
        ++index;
    }
    return PolicyDecision::allow();
}

PolicyDecision PolicyEngine::evaluate(const ActionRequest& request,
                                      const SafetyConfig& config) const {
    return std::visit(
        [this, &config](const auto& action) -> PolicyDecision {
            using T = std::decay_t<decltype(action)>;
            if constexpr (std::is_same_v<T, CommandAction>) {
                return evaluate_command(action, config);
            } else if constexpr (std::is_same_v<T, ReadFileAction>) {
                return evaluate_path(action.path, config);
            } else if constexpr (std::is_same_v<T, WriteFileAction>) {
                return evaluate_path(action.path, config);
            } else if constexpr (std::is_same_v<T, PlanAction>) {
                return evaluate_plan(action, config);
            } else {
                static_assert(kAlwaysFalse<T>, "unhandled action kind");
            }
        },
        request.action);
}

}  // namespace saferclaw::policy
