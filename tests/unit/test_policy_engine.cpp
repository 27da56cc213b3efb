#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "core/config/safety_config.hpp"
#include "core/config/unique_id.hpp"
#include "core/errors/safety_errors.hpp"
#include "policy/policy_engine.hpp"
#include "protocol/action_request.hpp"

namespace {

using saferclaw::core::config::SafetyConfig;
using saferclaw::core::errors::get_error;
using saferclaw::core::errors::get_value;
using saferclaw::core::errors::is_error;
using saferclaw::policy::DenyReason;
using saferclaw::policy::PolicyDecision;
using saferclaw::policy::PolicyEngine;
using saferclaw::protocol::ActionRequest;
using saferclaw::protocol::CommandAction;
using saferclaw::protocol::PlanAction;
using saferclaw::protocol::ReadFileAction;
using saferclaw::protocol::WriteFileAction;

class TempWorkspace {
public:
    explicit TempWorkspace(const std::string& tag = "ws") {
        root_ = std::filesystem::canonical(std::filesystem::current_path()) /
                (".tmp_policy_engine_" + saferclaw::core::config::generate_unique_id(tag));
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

SafetyConfig make_config(const std::filesystem::path& root) {
    SafetyConfig config;
    config.allowed_roots = {root};
    config.working_directory = root;
    return config;
}

ActionRequest command(std::vector<std::string> argv) {
    return ActionRequest{CommandAction{std::move(argv)}};
}

TEST(PolicyEngineTest, AllowsAllowlistedCommandInsideRoot) {
    TempWorkspace workspace;
    const PolicyEngine engine;
    const PolicyDecision decision =
        engine.evaluate(command({"ls", "-la", "./src"}), make_config(workspace.root()));
    EXPECT_TRUE(decision.allowed);
}

TEST(PolicyEngineTest, ShellOperatorsAreRejectedWhateverTheExecutable) {
    TempWorkspace workspace;
    const PolicyEngine engine;
    const SafetyConfig config = make_config(workspace.root());
    const std::vector<std::string> operators = {"&&", "||", "|", ";", "`", "$(", "\n", "\r"};
    for (const auto& op : operators) {
        for (const std::string exe : {"echo", "ls", "rm", "unknown-tool"}) {
            const PolicyDecision decision =
                engine.evaluate(command({exe, "a" + op + "b"}), config);
            EXPECT_FALSE(decision.allowed) << exe << " with operator " << op;
            EXPECT_EQ(decision.reason, DenyReason::ShellOperatorPresent);
        }
    }
}

TEST(PolicyEngineTest, DenylistBeatsAllowlist) {
    TempWorkspace workspace;
    SafetyConfig config = make_config(workspace.root());
    config.allowed_commands.insert("rm");

    const PolicyEngine engine;
    const PolicyDecision decision = engine.evaluate(command({"rm", "-rf", "/"}), config);
    EXPECT_FALSE(decision.allowed);
    EXPECT_EQ(decision.reason, DenyReason::Denylisted);
    EXPECT_EQ(saferclaw::policy::to_string(decision.reason), "denylisted");
}

TEST(PolicyEngineTest, ExecutableIsMatchedByLowercasedBasename) {
    TempWorkspace workspace;
    const PolicyEngine engine;
    const PolicyDecision decision =
        engine.evaluate(command({"/usr/bin/RM", "x"}), make_config(workspace.root()));
    EXPECT_FALSE(decision.allowed);
    EXPECT_EQ(decision.reason, DenyReason::Denylisted);
    EXPECT_EQ(PolicyEngine::executable_name("/usr/bin/RM"), "rm");
}

TEST(PolicyEngineTest, UnknownExecutableIsNotAllowlisted) {
    TempWorkspace workspace;
    const PolicyEngine engine;
    const PolicyDecision decision =
        engine.evaluate(command({"make", "all"}), make_config(workspace.root()));
    EXPECT_FALSE(decision.allowed);
    EXPECT_EQ(decision.reason, DenyReason::NotAllowlisted);
}

TEST(PolicyEngineTest, EmptyAllowlistDeniesEverything) {
    TempWorkspace workspace;
    SafetyConfig config = make_config(workspace.root());
    config.allowed_commands.clear();

    const PolicyEngine engine;
    const PolicyDecision decision = engine.evaluate(command({"ls"}), config);
    EXPECT_FALSE(decision.allowed);
    EXPECT_EQ(decision.reason, DenyReason::NotAllowlisted);
}

TEST(PolicyEngineTest, NetworkExecutablesNeedNetworkAccess) {
    TempWorkspace workspace;
    SafetyConfig config = make_config(workspace.root());
    config.denied_commands.clear();
    config.allowed_commands.insert("curl");

    const PolicyEngine engine;
    const PolicyDecision blocked = engine.evaluate(command({"curl", "example.com"}), config);
    EXPECT_FALSE(blocked.allowed);
    EXPECT_EQ(blocked.reason, DenyReason::NetworkDisabled);

    config.network_access = true;
    EXPECT_TRUE(engine.evaluate(command({"curl", "example.com"}), config).allowed);
}

TEST(PolicyEngineTest, EmptyCommandIsMalformed) {
    TempWorkspace workspace;
    const PolicyEngine engine;
    const PolicyDecision decision = engine.evaluate(command({}), make_config(workspace.root()));
    EXPECT_FALSE(decision.allowed);
    EXPECT_EQ(decision.reason, DenyReason::MalformedRequest);
}

TEST(PolicyEngineTest, PathLikeArgumentsMustStayInsideRoots) {
    TempWorkspace workspace;
    const PolicyEngine engine;
    const SafetyConfig config = make_config(workspace.root());

    for (const std::vector<std::string>& argv :
         std::vector<std::vector<std::string>>{{"cat", "/etc/passwd"},
                                               {"ls", ".."},
                                               {"cat", "../../secret"},
                                               {"find", "--start=/etc"}}) {
        const PolicyDecision decision = engine.evaluate(command(argv), config);
        EXPECT_FALSE(decision.allowed) << argv.back();
        EXPECT_EQ(decision.reason, DenyReason::PathOutsideRoots);
    }
    EXPECT_TRUE(engine.evaluate(command({"find", "--start=./docs"}), config).allowed);
}

TEST(PolicyEngineTest, TraversalOutOfRootIsDenied) {
    TempWorkspace workspace;
    const PolicyEngine engine;
    const PolicyDecision decision = engine.evaluate(
        ActionRequest{ReadFileAction{"sub/../../outside.txt"}}, make_config(workspace.root()));
    EXPECT_FALSE(decision.allowed);
    EXPECT_EQ(decision.reason, DenyReason::PathOutsideRoots);
}

TEST(PolicyEngineTest, SiblingDirectorySharingPrefixIsOutside) {
    TempWorkspace workspace;
    const auto sibling = workspace.root().string() + "-evil";
    const PolicyEngine engine;
    const PolicyDecision decision = engine.evaluate(
        ActionRequest{ReadFileAction{sibling + "/file.txt"}}, make_config(workspace.root()));
    EXPECT_FALSE(decision.allowed);
    EXPECT_EQ(decision.reason, DenyReason::PathOutsideRoots);
}

TEST(PolicyEngineTest, SymlinkEscapeIsDenied) {
    TempWorkspace workspace;
    TempWorkspace outside("outside");
    {
        std::ofstream secret(outside.root() / "secret.txt");
        secret << "secret";
    }
    std::filesystem::create_directory_symlink(outside.root(), workspace.root() / "link");

    const PolicyEngine engine;
    const SafetyConfig config = make_config(workspace.root());
    const PolicyDecision read =
        engine.evaluate(ActionRequest{ReadFileAction{"link/secret.txt"}}, config);
    EXPECT_FALSE(read.allowed);
    EXPECT_EQ(read.reason, DenyReason::PathOutsideRoots);

    const PolicyDecision write =
        engine.evaluate(ActionRequest{WriteFileAction{"link/new.txt", "x"}}, config);
    EXPECT_FALSE(write.allowed);
    EXPECT_EQ(write.reason, DenyReason::PathOutsideRoots);
}

TEST(PolicyEngineTest, SymlinkBehindMissingComponentIsStillResolved) {
    TempWorkspace workspace;
    TempWorkspace outside("outside");
    {
        std::ofstream secret(outside.root() / "secret.txt");
        secret << "secret";
    }
    std::filesystem::create_directory_symlink(outside.root(), workspace.root() / "esc");

    const PolicyEngine engine;
    const SafetyConfig config = make_config(workspace.root());
    const PolicyDecision read = engine.evaluate(
        ActionRequest{ReadFileAction{"missing/../esc/secret.txt"}}, config);
    EXPECT_FALSE(read.allowed);
    EXPECT_EQ(read.reason, DenyReason::PathOutsideRoots);

    const PolicyDecision write = engine.evaluate(
        ActionRequest{WriteFileAction{"missing/../esc/new.txt", "x"}}, config);
    EXPECT_FALSE(write.allowed);
    EXPECT_EQ(write.reason, DenyReason::PathOutsideRoots);

    const PolicyDecision argument =
        engine.evaluate(command({"cat", "./missing/../esc/secret.txt"}), config);
    EXPECT_FALSE(argument.allowed);
    EXPECT_EQ(argument.reason, DenyReason::PathOutsideRoots);
}

TEST(PolicyEngineTest, DotDotAfterSymlinkFollowsTheTarget) {
    TempWorkspace workspace;
    TempWorkspace outside("outside");
    std::filesystem::create_directories(outside.root() / "inner");
    std::filesystem::create_directory_symlink(outside.root() / "inner", workspace.root() / "hop");

    // hop/.. is the parent of the link target, not the workspace root.
    const PolicyEngine engine;
    const PolicyDecision decision = engine.evaluate(
        ActionRequest{ReadFileAction{"hop/../file.txt"}}, make_config(workspace.root()));
    EXPECT_FALSE(decision.allowed);
    EXPECT_EQ(decision.reason, DenyReason::PathOutsideRoots);
}

TEST(PolicyEngineTest, SymlinkLoopIsDenied) {
    TempWorkspace workspace;
    std::filesystem::create_symlink(workspace.root() / "b", workspace.root() / "a");
    std::filesystem::create_symlink(workspace.root() / "a", workspace.root() / "b");

    const PolicyEngine engine;
    const PolicyDecision decision = engine.evaluate(
        ActionRequest{ReadFileAction{"a/file.txt"}}, make_config(workspace.root()));
    EXPECT_FALSE(decision.allowed);
    EXPECT_EQ(decision.reason, DenyReason::PathOutsideRoots);
}

TEST(PolicyEngineTest, NonexistentPathInsideRootIsAllowed) {
    TempWorkspace workspace;
    const PolicyEngine engine;
    auto resolved = engine.resolve_allowed_path("new/dir/file.txt", make_config(workspace.root()));
    ASSERT_FALSE(is_error(resolved));
    EXPECT_EQ(get_value(resolved), workspace.root() / "new/dir/file.txt");
}

TEST(PolicyEngineTest, EmptyPathIsMalformed) {
    TempWorkspace workspace;
    const PolicyEngine engine;
    const PolicyDecision decision =
        engine.evaluate(ActionRequest{ReadFileAction{""}}, make_config(workspace.root()));
    EXPECT_FALSE(decision.allowed);
    EXPECT_EQ(decision.reason, DenyReason::MalformedRequest);
}

TEST(PolicyEngineTest, WorkingDirectoryOutsideRootsBlocksCommands) {
    TempWorkspace workspace;
    TempWorkspace elsewhere("elsewhere");
    SafetyConfig config = make_config(workspace.root());
    config.working_directory = elsewhere.root();

    const PolicyEngine engine;
    const PolicyDecision decision = engine.evaluate(command({"ls"}), config);
    EXPECT_FALSE(decision.allowed);
    EXPECT_EQ(decision.reason, DenyReason::PathOutsideRoots);
}

TEST(PolicyEngineTest, DenialIsIdempotent) {
    TempWorkspace workspace;
    const PolicyEngine engine;
    const SafetyConfig config = make_config(workspace.root());
    const ActionRequest request = command({"cat", "/etc/shadow"});

    const PolicyDecision first = engine.evaluate(request, config);
    const PolicyDecision second = engine.evaluate(request, config);
    EXPECT_FALSE(first.allowed);
    EXPECT_EQ(first.allowed, second.allowed);
    EXPECT_EQ(first.reason, second.reason);
    EXPECT_EQ(first.detail, second.detail);
}

TEST(PolicyEngineTest, PlanIsDeniedWhenAnyStepIsDenied) {
    TempWorkspace workspace;
    const PolicyEngine engine;
    const SafetyConfig config = make_config(workspace.root());

    const ActionRequest plan{PlanAction{{command({"echo", "one"}),
                                         ActionRequest{ReadFileAction{"notes.txt"}},
                                         command({"sudo", "reboot"})}}};
    const PolicyDecision decision = engine.evaluate(plan, config);
    EXPECT_FALSE(decision.allowed);
    EXPECT_EQ(decision.reason, DenyReason::Denylisted);
    EXPECT_EQ(decision.detail.rfind("Plan step 3: ", 0), 0u);

    const ActionRequest clean{PlanAction{{command({"echo", "one"}),
                                          ActionRequest{ReadFileAction{"notes.txt"}}}}};
    EXPECT_TRUE(engine.evaluate(clean, config).allowed);
}

TEST(PolicyEngineTest, EmptyAndNestedPlansAreMalformed) {
    TempWorkspace workspace;
    const PolicyEngine engine;
    const SafetyConfig config = make_config(workspace.root());

    const PolicyDecision empty = engine.evaluate(ActionRequest{PlanAction{}}, config);
    EXPECT_FALSE(empty.allowed);
    EXPECT_EQ(empty.reason, DenyReason::MalformedRequest);

    const ActionRequest inner{PlanAction{{command({"ls"})}}};
    const PolicyDecision nested = engine.evaluate(ActionRequest{PlanAction{{inner}}}, config);
    EXPECT_FALSE(nested.allowed);
    EXPECT_EQ(nested.reason, DenyReason::MalformedRequest);
}

}  // namespace
