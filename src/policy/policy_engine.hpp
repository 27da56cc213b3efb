#pragma once

#include <filesystem>
#include <string>
#include <utility>
#include <vector>
#include "core/config/safety_config.hpp"
#include "core/errors/safety_errors.hpp"
#include "protocol/action_request.hpp"

namespace saferclaw::policy {

enum class DenyReason {
    NotAllowlisted,
    Denylisted,
    ShellOperatorPresent,
    PathOutsideRoots,
    MalformedRequest,
    NetworkDisabled
};

struct PolicyDecision {
    bool allowed = false;
    DenyReason reason = DenyReason::MalformedRequest;
    std::string detail;

    static PolicyDecision allow() { return PolicyDecision{true, DenyReason::MalformedRequest, ""}; }
    static PolicyDecision deny(DenyReason reason, std::string detail) {
        return PolicyDecision{false, reason, std::move(detail)};
    }
};

std::string to_string(DenyReason reason);

// Stateless and side-effect free; safe to share across threads.
class PolicyEngine {
public:
    PolicyDecision evaluate(const protocol::ActionRequest& request,
                            const core::config::SafetyConfig& config) const;

    // Canonical form of `path` if it lies inside an allowed root. Relative
    // paths are anchored at config.working_directory.
    core::errors::Result<std::filesystem::path> resolve_allowed_path(
        const std::string& path, const core::config::SafetyConfig& config) const;

    static bool contains_shell_operator(const std::string& token);
    static std::string executable_name(const std::string& token);

private:
    PolicyDecision evaluate_command(const protocol::CommandAction& command,
                                    const core::config::SafetyConfig& config) const;
    PolicyDecision evaluate_path(const std::string& path,
                                 const core::config::SafetyConfig& config) const;
    PolicyDecision evaluate_plan(const protocol::PlanAction& plan,
                                 const core::config::SafetyConfig& config) const;

    static bool is_within_root(const std::filesystem::path& root,
                               const std::filesystem::path& child);
    static bool looks_like_path(const std::string& token);
    // Absolute, symlink-free form of an absolute path; missing trailing
    // components are kept as written.
    static core::errors::Result<std::filesystem::path> resolve_real_path(
        const std::filesystem::path& absolute);
};

}  // namespace saferclaw::policy
