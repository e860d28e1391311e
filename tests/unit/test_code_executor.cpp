/**
 * Unit tests for CodeExecutor
 *
 * Strategy selection, downgrade policy, caching and save-directive extraction.
 * The heavy backend is disabled here so every decision is deterministic.
 */

#include <gtest/gtest.h>
#include "../../src/code_executor.h"
#include "../../src/errors.h"
#include <filesystem>

using namespace mockrun;

// ============================================================================
// Test Fixture
// ============================================================================

class CodeExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        EnvironmentManager::Config env_config;
        env_config.heavy_enabled = false;
        env_config.base_dir = (std::filesystem::temp_directory_path() / "mockrun_executor_test").string();
        environments = std::make_unique<EnvironmentManager>(env_config);

        executor = make_executor(false);
    }

    std::unique_ptr<CodeExecutor> make_executor(bool strict) {
        CodeExecutor::Config config;
        config.strict_isolation = strict;
        config.cache_ttl = std::chrono::milliseconds(5000);
        return std::make_unique<CodeExecutor>(*environments, config);
    }

    ExecutionContext make_context(const std::string& code) {
        ExecutionContext context;
        context.request.execution_id = "exec_test";
        context.request.code = code;
        context.request.timeout = std::chrono::milliseconds(2000);
        context.mock_data["items"] = Json::Value(Json::arrayValue);
        context.current_collection["name"] = "items";
        context.current_collection["id"] = "col_items";
        return context;
    }

    std::unique_ptr<EnvironmentManager> environments;
    std::unique_ptr<CodeExecutor> executor;
};

// ============================================================================
// Test Contract: Strategy Selection
// ============================================================================

TEST_F(CodeExecutorTest, DetectsAsyncConstructs) {
    EXPECT_TRUE(CodeExecutor::uses_async("const x = await load();"));
    EXPECT_TRUE(CodeExecutor::uses_async("return new Promise(r => r(1));"));
    EXPECT_TRUE(CodeExecutor::uses_async("return fetchIt().then(x => x);"));
    EXPECT_TRUE(CodeExecutor::uses_async("const f = async () => 1;"));
    EXPECT_FALSE(CodeExecutor::uses_async("return Response.json({ awaiting: true });"));
}

TEST_F(CodeExecutorTest, SynchronousCodeRunsLight) {
    StrategyDecision decision = executor->select_strategy("return 1;", StrategyOptions());
    EXPECT_EQ(decision.strategy, Strategy::LIGHT);
    EXPECT_FALSE(decision.downgraded);
}

TEST_F(CodeExecutorTest, AsyncCodeDowngradesWhenHeavyUnavailable) {
    StrategyDecision decision = executor->select_strategy("return await Promise.resolve(1);",
                                                          StrategyOptions());
    EXPECT_EQ(decision.strategy, Strategy::LIGHT);
    EXPECT_TRUE(decision.downgraded);
    EXPECT_NE(decision.reason.find("unavailable"), std::string::npos);
}

TEST_F(CodeExecutorTest, IsolationRequestDowngradesWhenLenient) {
    StrategyOptions options;
    options.require_isolation = true;

    StrategyDecision decision = executor->select_strategy("return 1;", options);
    EXPECT_EQ(decision.strategy, Strategy::LIGHT);
    EXPECT_TRUE(decision.downgraded);
}

TEST_F(CodeExecutorTest, StrictModeRefusesToDowngrade) {
    auto strict = make_executor(true);
    StrategyOptions options;
    options.require_isolation = true;

    try {
        strict->select_strategy("return 1;", options);
        FAIL() << "Expected IsolationUnavailable";
    } catch (const IsolationUnavailable& e) {
        EXPECT_EQ(e.code(), "ISOLATION_UNAVAILABLE");
        EXPECT_EQ(e.status(), 503);
    }

    // Code that never wanted Heavy is unaffected
    EXPECT_EQ(strict->select_strategy("return 1;", StrategyOptions()).strategy, Strategy::LIGHT);
}

TEST_F(CodeExecutorTest, NodeLanguageNeverDowngrades) {
    StrategyOptions options;
    options.language = "node";
    EXPECT_THROW(executor->select_strategy("return 1;", options), IsolationUnavailable);
}

TEST_F(CodeExecutorTest, ValidateDelegatesToValidator) {
    EXPECT_THROW(executor->validate("process.exit(0);", "javascript"), ValidationError);
    EXPECT_NO_THROW(executor->validate("return 1;", "javascript"));
}

// ============================================================================
// Test Contract: Execution and Caching
// ============================================================================

TEST_F(CodeExecutorTest, ExecutesLightAndCachesSuccess) {
    StrategyDecision decision{Strategy::LIGHT, false, "default"};
    ExecutionContext context = make_context("console.log('ran'); return { n: 1 };");

    ExecutionResult first = executor->execute(decision, context);
    ASSERT_TRUE(first.success) << first.error;
    EXPECT_FALSE(first.cached);
    EXPECT_EQ(first.output["n"].asInt(), 1);

    // Same inputs under a new execution id hit the cache
    context.request.execution_id = "exec_again";
    ExecutionResult second = executor->execute(decision, context);
    EXPECT_TRUE(second.cached);
    EXPECT_EQ(second.output["n"].asInt(), 1);
    ASSERT_EQ(second.logs.size(), 1u);
    EXPECT_EQ(executor->cache().size(), 1u);
}

TEST_F(CodeExecutorTest, FailuresAreNotCached) {
    StrategyDecision decision{Strategy::LIGHT, false, "default"};
    ExecutionContext context = make_context("throw new Error('bad');");

    ExecutionResult first = executor->execute(decision, context);
    EXPECT_FALSE(first.success);
    ExecutionResult second = executor->execute(decision, context);
    EXPECT_FALSE(second.cached);
    EXPECT_EQ(executor->cache().size(), 0u);
}

TEST_F(CodeExecutorTest, DowngradeFlagIsCarriedOnResult) {
    StrategyDecision decision{Strategy::LIGHT, true, "asynchronous constructs"};
    ExecutionResult result = executor->execute(decision, make_context("return await Promise.resolve(2);"));
    ASSERT_TRUE(result.success) << result.error;
    EXPECT_TRUE(result.downgraded);
    EXPECT_EQ(result.output.asInt(), 2);
}

TEST_F(CodeExecutorTest, CacheHitReportsTheCurrentDowngrade) {
    ExecutionContext context = make_context("return { n: 3 };");

    // Given: a result cached by a request that never asked for isolation
    ExecutionResult first = executor->execute(StrategyDecision{Strategy::LIGHT, false, "default"}, context);
    ASSERT_TRUE(first.success) << first.error;
    EXPECT_FALSE(first.downgraded);

    // When: the same code is requested again with isolation that had to be downgraded
    context.request.execution_id = "exec_isolated";
    ExecutionResult second = executor->execute(
        StrategyDecision{Strategy::LIGHT, true, "isolation requested"}, context);

    // Then: the cached result carries this request's downgrade
    EXPECT_TRUE(second.cached);
    EXPECT_TRUE(second.downgraded);

    // And a later non-isolated hit does not inherit it
    ExecutionResult third = executor->execute(StrategyDecision{Strategy::LIGHT, false, "default"}, context);
    EXPECT_TRUE(third.cached);
    EXPECT_FALSE(third.downgraded);
}

TEST_F(CodeExecutorTest, TimeoutPropagates) {
    StrategyDecision decision{Strategy::LIGHT, false, "default"};
    ExecutionContext context = make_context("const s = Date.now(); while (Date.now() - s < 5000) {}");
    context.request.timeout = std::chrono::milliseconds(150);

    EXPECT_THROW(executor->execute(decision, context), ExecutionTimeout);
}

TEST_F(CodeExecutorTest, SaveDirectiveIsExtracted) {
    StrategyDecision decision{Strategy::LIGHT, false, "default"};
    ExecutionResult result = executor->execute(
        decision, make_context("return await saveMockData([{ id: 1 }, { id: 2 }]);"));

    ASSERT_TRUE(result.success) << result.error;
    ASSERT_TRUE(result.save_directive.has_value());
    EXPECT_EQ(result.save_directive->collection_id, "col_items");
    EXPECT_EQ(result.save_directive->items.size(), 2u);
    EXPECT_FALSE(result.output.isMember(SAVE_OPERATION_KEY));
    EXPECT_EQ(result.output["itemsToSave"].asInt(), 2);
}

// ============================================================================
// Test Contract: Save Directive Extraction
// ============================================================================

TEST(SaveDirectiveExtractionTest, ReadsDirectiveNestedUnderData) {
    ExecutionResult result;
    result.success = true;
    result.output["status"] = 200;
    result.output["data"]["message"] = "saved";
    result.output["data"][SAVE_OPERATION_KEY]["collectionId"] = "col_1";
    result.output["data"][SAVE_OPERATION_KEY]["data"] = Json::Value(Json::arrayValue);

    CodeExecutor::extract_save_directive(result);

    ASSERT_TRUE(result.save_directive.has_value());
    EXPECT_EQ(result.save_directive->collection_id, "col_1");
    EXPECT_FALSE(result.output["data"].isMember(SAVE_OPERATION_KEY));
    EXPECT_EQ(result.output["data"]["message"].asString(), "saved");
}

TEST(SaveDirectiveExtractionTest, IgnoresFailedAndPlainResults) {
    ExecutionResult failed;
    failed.success = false;
    failed.output[SAVE_OPERATION_KEY]["collectionId"] = "col_1";
    CodeExecutor::extract_save_directive(failed);
    EXPECT_FALSE(failed.save_directive.has_value());

    ExecutionResult plain;
    plain.success = true;
    plain.output = Json::Value("text");
    CodeExecutor::extract_save_directive(plain);
    EXPECT_FALSE(plain.save_directive.has_value());
}

TEST(SaveDirectiveExtractionTest, NonArrayPayloadIsKeptForTheStoreToReject) {
    ExecutionResult result;
    result.success = true;
    result.output[SAVE_OPERATION_KEY]["data"]["id"] = 1;

    CodeExecutor::extract_save_directive(result);
    ASSERT_TRUE(result.save_directive.has_value());
    EXPECT_TRUE(result.save_directive->items.isObject());
}
