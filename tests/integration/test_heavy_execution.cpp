/**
 * Heavy Strategy Integration Tests
 *
 * Runs node programs inside real isolated environments. Every test is
 * skipped when the host cannot build the isolation (no user namespaces,
 * no node binary), since that is an environment property, not a failure.
 */

#include <gtest/gtest.h>
#include "../../src/code_executor.h"
#include "../../src/environment_manager.h"
#include "../../src/sandbox.h"
#include "../../src/errors.h"
#include <filesystem>

using namespace mockrun;

// ============================================================================
// Test Fixture
// ============================================================================

class HeavyExecutionTest : public ::testing::Test {
protected:
    void SetUp() override {
        EnvironmentManager::Config config;
        config.max_environments = 4;
        config.base_dir = (std::filesystem::temp_directory_path() / "mockrun_heavy_test").string();
        environments = std::make_unique<EnvironmentManager>(config);

        EnvironmentHealth health = environments->health_check();
        if (!health.healthy) {
            GTEST_SKIP() << "Heavy isolation unavailable: " << health.reason;
        }

        CodeExecutor::Config exec_config;
        exec_config.strict_isolation = true;
        executor = std::make_unique<CodeExecutor>(*environments, exec_config);
    }

    ExecutionResult run_heavy(const std::string& code,
                              std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
        ExecutionContext context;
        context.request.execution_id = "exec_heavy";
        context.request.code = code;
        context.request.timeout = timeout;
        context.mock_data["users"] = Json::Value(Json::arrayValue);
        context.mock_data["users"].append(Json::Value("alice"));
        context.current_collection["name"] = "users";
        context.current_collection["id"] = "col_users";

        StrategyDecision decision{Strategy::HEAVY, false, "test"};
        return executor->execute(decision, context);
    }

    std::unique_ptr<EnvironmentManager> environments;
    std::unique_ptr<CodeExecutor> executor;
};

// ============================================================================
// Test Contract: Results
// ============================================================================

TEST_F(HeavyExecutionTest, RunsCodeAndReturnsValue) {
    ExecutionResult result = run_heavy(
        "console.log('from node');\n"
        "const value = await Promise.resolve(21);\n"
        "return Response.json({ doubled: value * 2, users: getCollection().length });");

    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(result.strategy, Strategy::HEAVY);
    EXPECT_EQ(result.output["data"]["doubled"].asInt(), 42);
    EXPECT_EQ(result.output["data"]["users"].asInt(), 1);
    ASSERT_EQ(result.logs.size(), 1u);
    EXPECT_EQ(result.logs[0], "from node");
    EXPECT_FALSE(result.environment_id.empty());
}

TEST_F(HeavyExecutionTest, EnvironmentIsDestroyedAfterRun) {
    run_heavy("return 1;");
    EXPECT_EQ(environments->active_count(), 0u);
    auto stats = environments->get_stats();
    EXPECT_EQ(stats.created, stats.destroyed);
}

TEST_F(HeavyExecutionTest, ThrownErrorIsReported) {
    ExecutionResult result = run_heavy("throw new Error('heavy failure');");
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.error.find("heavy failure"), std::string::npos);
}

TEST_F(HeavyExecutionTest, SaveDirectiveSurvivesTheProcessBoundary) {
    ExecutionResult result = run_heavy("return await saveMockData(['alice', 'bob']);");

    ASSERT_TRUE(result.success) << result.error;
    ASSERT_TRUE(result.save_directive.has_value());
    EXPECT_EQ(result.save_directive->items.size(), 2u);
    EXPECT_FALSE(result.output.isMember(SAVE_OPERATION_KEY));
}

TEST_F(HeavyExecutionTest, UnsettledPromiseIsAnError) {
    // node exits cleanly once nothing is pending, without printing a result
    ExecutionResult result = run_heavy("return new Promise(() => {});");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, "Returned promise never settled");
}

TEST_F(HeavyExecutionTest, CacheHitDoesNotAllocateAnEnvironment) {
    // Given: one completed Heavy run
    ExecutionResult first = run_heavy("return { answer: 42 };");
    ASSERT_TRUE(first.success) << first.error;
    EXPECT_FALSE(first.cached);
    auto before = environments->get_stats();

    // When: the identical request runs again
    ExecutionResult second = run_heavy("return { answer: 42 };");

    // Then: served from the cache with no new environment
    EXPECT_TRUE(second.cached);
    EXPECT_EQ(second.output["answer"].asInt(), 42);
    EXPECT_EQ(environments->get_stats().created, before.created);
    EXPECT_EQ(environments->active_count(), 0u);
}

// ============================================================================
// Test Contract: Confinement
// ============================================================================

TEST_F(HeavyExecutionTest, NodeCapabilitiesAreShadowed) {
    ExecutionResult result = run_heavy(
        "return [typeof require, typeof process, typeof module, typeof globalThis.process];");

    ASSERT_TRUE(result.success) << result.error;
    for (const auto& kind : result.output) {
        EXPECT_EQ(kind.asString(), "undefined");
    }
}

TEST_F(HeavyExecutionTest, StringCodeGenerationIsDisabled) {
    ExecutionResult result = run_heavy("return (function () {}).constructor('return 1')();");
    EXPECT_FALSE(result.success);
}

TEST_F(HeavyExecutionTest, DeadlineKillsRunawayProcess) {
    EXPECT_THROW(run_heavy("const s = Date.now(); while (Date.now() - s < 20000) {}",
                           std::chrono::milliseconds(500)),
                 ExecutionTimeout);
    EXPECT_EQ(environments->active_count(), 0u);
    EXPECT_EQ(environments->get_stats().timed_out, 1u);
}

TEST(SandboxIsolationTest, NetworkIsUnavailable) {
    if (!Sandbox::probe_isolation().empty() || Sandbox::find_executable("sh").empty()) {
        GTEST_SKIP() << "Isolation unavailable on this host";
    }

    auto dir = std::filesystem::temp_directory_path() / "mockrun_sandbox_net_test";
    std::filesystem::create_directories(dir);

    SandboxConfig config;
    config.working_directory = dir.string();
    config.timeout = std::chrono::milliseconds(5000);
    Sandbox sandbox(config);

    // Only loopback exists in the fresh network namespace: two header lines plus lo.
    // Shell builtins only, since the filter refuses new processes.
    ProcessResult result = sandbox.run(
        {"sh", "-c", "n=0; while read line; do n=$((n+1)); done < /proc/net/dev; echo $n"});
    EXPECT_EQ(result.exit_code, 0) << result.stderr_output;
    EXPECT_EQ(result.stdout_output, "3\n");

    std::filesystem::remove_all(dir);
}

TEST(SandboxIsolationTest, NewProcessesAreRefused) {
    if (!Sandbox::probe_isolation().empty() || Sandbox::find_executable("sh").empty()) {
        GTEST_SKIP() << "Isolation unavailable on this host";
    }

    auto dir = std::filesystem::temp_directory_path() / "mockrun_sandbox_fork_test";
    std::filesystem::create_directories(dir);

    SandboxConfig config;
    config.working_directory = dir.string();
    Sandbox sandbox(config);

    ProcessResult result = sandbox.run({"sh", "-c", "/bin/true; echo reached"});
    // The shell survives the refused fork and reports it
    EXPECT_EQ(result.stdout_output, "reached\n");
    EXPECT_FALSE(result.stderr_output.empty());

    std::filesystem::remove_all(dir);
}

TEST(SandboxIsolationTest, RootFilesystemIsReadOnly) {
    if (!Sandbox::probe_isolation().empty() || Sandbox::find_executable("sh").empty()) {
        GTEST_SKIP() << "Isolation unavailable on this host";
    }

    auto dir = std::filesystem::temp_directory_path() / "mockrun_sandbox_ro_test";
    std::filesystem::create_directories(dir);

    SandboxConfig config;
    config.working_directory = dir.string();
    Sandbox sandbox(config);

    ProcessResult result = sandbox.run({"sh", "-c", "echo x > /etc/mockrun_probe"});
    EXPECT_NE(result.exit_code, 0);
    EXPECT_FALSE(std::filesystem::exists("/etc/mockrun_probe"));

    std::filesystem::remove_all(dir);
}
