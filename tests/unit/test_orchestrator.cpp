/**
 * Unit tests for Orchestrator
 *
 * Drives whole requests through validation, authorization, execution,
 * saving and logging against the in-memory store. The heavy backend is
 * disabled, so asynchronous code is downgraded to the light strategy.
 */

#include <gtest/gtest.h>
#include "../../src/orchestrator.h"
#include "../../src/memory_store.h"
#include "../../src/json_utils.h"
#include "../../src/errors.h"
#include <filesystem>
#include <thread>
#include <algorithm>

using namespace mockrun;

// ============================================================================
// Test Fixture
// ============================================================================

class OrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        EnvironmentManager::Config env_config;
        env_config.heavy_enabled = false;
        env_config.base_dir = (std::filesystem::temp_directory_path() / "mockrun_orchestrator_test").string();
        environments = std::make_unique<EnvironmentManager>(env_config);

        CodeExecutor::Config exec_config;
        exec_config.cache_ttl = std::chrono::milliseconds(5000);
        executor = std::make_unique<CodeExecutor>(*environments, exec_config);

        RateLimiter::Config rate_config;
        rate_config.max_executions_per_window = 50;
        rate_limiter = std::make_unique<RateLimiter>(rate_config);

        orchestrator = std::make_unique<Orchestrator>(
            *executor, *environments, *rate_limiter,
            Orchestrator::Collaborators{store, store, store, store, store});

        ProjectRecord project;
        project.id = "proj";
        project.owner_id = "owner";
        project.collaborators["viewer"] = false;
        store.add_project(project);

        ProjectRecord foreign;
        foreign.id = "proj_foreign";
        foreign.owner_id = "someone_else";
        store.add_project(foreign);

        CollectionRecord users;
        users.id = "col_users";
        users.project_id = "proj";
        users.name = "users";
        users.items = JsonUtils::parse_or_throw(R"([{"id":1,"name":"Alice"}])", "items");
        store.add_collection(users);

        CollectionRecord foreign_items;
        foreign_items.id = "col_foreign";
        foreign_items.project_id = "proj_foreign";
        foreign_items.name = "secrets";
        store.add_collection(foreign_items);

        EnvironmentRecord variables;
        variables.id = "env_default";
        variables.project_id = "proj";
        variables.is_default = true;
        variables.variables["API_URL"] = "https://api.example.test";
        store.add_environment(variables);
    }

    void add_endpoint(const std::string& id, const std::string& code) {
        EndpointRecord endpoint;
        endpoint.id = id;
        endpoint.project_id = "proj";
        endpoint.name = id;
        endpoint.method = "POST";
        endpoint.path = "/" + id;
        endpoint.code = code;
        store.add_endpoint(endpoint);
    }

    ExecuteInput with_collection(const std::string& collection_id = "col_users") {
        ExecuteInput input;
        input.mock_data_collection_id = collection_id;
        return input;
    }

    MemoryStore store;
    std::unique_ptr<EnvironmentManager> environments;
    std::unique_ptr<CodeExecutor> executor;
    std::unique_ptr<RateLimiter> rate_limiter;
    std::unique_ptr<Orchestrator> orchestrator;
};

// ============================================================================
// Test Contract: Successful Requests
// ============================================================================

TEST_F(OrchestratorTest, ReturnsHandlerResult) {
    // Given: An endpoint reading the selected collection and a request param
    add_endpoint("get_user",
                 "const user = getCollection().find(u => String(u.id) === request.params.id);\n"
                 "return Response.json(user);");
    ExecuteInput input = with_collection();
    input.request.params["id"] = "1";

    // When: The owner invokes it
    ExecutionResponse response = orchestrator->execute("get_user", "owner", input);

    // Then: The handler's value comes back and nothing was saved
    ASSERT_TRUE(response.success) << response.error;
    EXPECT_EQ(response.status_code(), 200);
    EXPECT_EQ(response.data["data"]["name"].asString(), "Alice");
    EXPECT_TRUE(response.saved_data.isNull());
    EXPECT_EQ(response.strategy, Strategy::LIGHT);
    EXPECT_FALSE(response.isolation_downgraded);
    EXPECT_EQ(response.execution_id.rfind("exec_", 0), 0u);

    Json::Value json = response.to_json();
    EXPECT_TRUE(json["error"].isNull());
    EXPECT_EQ(json["strategy"].asString(), "light");
}

TEST_F(OrchestratorTest, EnvironmentVariablesAreVisible) {
    add_endpoint("env", "return environment.API_URL;");
    ExecutionResponse response = orchestrator->execute("env", "owner", ExecuteInput());
    ASSERT_TRUE(response.success) << response.error;
    EXPECT_EQ(response.data.asString(), "https://api.example.test");
}

TEST_F(OrchestratorTest, SuccessIsLoggedAndCounted) {
    add_endpoint("ok", "console.log('hi'); return 1;");
    orchestrator->execute("ok", "owner", ExecuteInput());

    auto logs = store.recent("ok", 10);
    ASSERT_EQ(logs.size(), 1u);
    EXPECT_EQ(logs[0].status_code, 200);
    EXPECT_EQ(logs[0].user_id, "owner");
    EXPECT_EQ(logs[0].strategy, "light");
    ASSERT_EQ(logs[0].logs.size(), 1u);
    EXPECT_EQ(store.find_endpoint("ok")->call_count, 1);
    EXPECT_EQ(orchestrator->total_executions(), 1u);
}

TEST_F(OrchestratorTest, AsyncCodeIsDowngradedAndFlagged) {
    add_endpoint("async", "const v = await Promise.resolve(3); return v;");
    ExecutionResponse response = orchestrator->execute("async", "owner", ExecuteInput());
    ASSERT_TRUE(response.success) << response.error;
    EXPECT_TRUE(response.isolation_downgraded);
    EXPECT_EQ(response.data.asInt(), 3);
}

// ============================================================================
// Test Contract: Saving
// ============================================================================

TEST_F(OrchestratorTest, SaveReplacesCollectionAfterRun) {
    add_endpoint("add_users",
                 "const users = getCollection();\n"
                 "users.push({ id: 2, name: 'Bob' }, { id: 3, name: 'Carol' });\n"
                 "const saved = await saveMockData(users);\n"
                 "return Response.json(saved);");

    ExecutionResponse response = orchestrator->execute("add_users", "owner", with_collection());

    ASSERT_TRUE(response.success) << response.error;
    EXPECT_EQ(response.saved_data["count"].asInt(), 1);
    EXPECT_TRUE(response.saved_data["results"][0]["success"].asBool());

    auto stored = store.find_collection("col_users");
    EXPECT_EQ(stored->items.size(), 3u);
    EXPECT_EQ(stored->version, 2);

    // The internal operation never reaches the caller
    EXPECT_FALSE(response.data["data"].isMember(SAVE_OPERATION_KEY));
    EXPECT_EQ(response.data["data"]["itemsToSave"].asInt(), 3);
}

TEST_F(OrchestratorTest, CachedRunStillAppliesItsSave) {
    add_endpoint("replace", "return await saveMockData([{ id: 'only' }]);");

    orchestrator->execute("replace", "owner", with_collection());
    ExecutionResponse second = orchestrator->execute("replace", "owner", with_collection());

    EXPECT_TRUE(second.cached);
    EXPECT_EQ(second.saved_data["count"].asInt(), 1);
    EXPECT_EQ(store.find_collection("col_users")->version, 3);
}

TEST_F(OrchestratorTest, SaveWithoutSelectedCollectionDoesNothing) {
    add_endpoint("no_collection", "return await saveMockData([{ id: 1 }]);");

    ExecutionResponse response = orchestrator->execute("no_collection", "owner", ExecuteInput());

    ASSERT_TRUE(response.success) << response.error;
    EXPECT_FALSE(response.data["success"].asBool());
    EXPECT_TRUE(response.saved_data.isNull());
    EXPECT_EQ(store.find_collection("col_users")->version, 1);
}

TEST_F(OrchestratorTest, RejectedSaveIsReportedNotThrown) {
    CollectionRecord typed;
    typed.id = "col_typed";
    typed.project_id = "proj";
    typed.name = "typed";
    typed.schema = JsonUtils::parse_or_throw(
        R"({"items":{"properties":{"id":{"type":"integer"}},"required":["id"]}})", "schema");
    store.add_collection(typed);
    add_endpoint("bad_save", "return await saveMockData([{ id: 'not-a-number' }]);");

    ExecutionResponse response = orchestrator->execute("bad_save", "owner", with_collection("col_typed"));

    ASSERT_TRUE(response.success) << response.error;
    EXPECT_EQ(response.saved_data["count"].asInt(), 0);
    EXPECT_EQ(response.saved_data["results"][0]["error"].asString(), "SCHEMA_VALIDATION_FAILED");
    EXPECT_EQ(store.find_collection("col_typed")->version, 1);
}

TEST_F(OrchestratorTest, ConcurrentSavesAreLastWriterWins) {
    add_endpoint("save_a", "return await saveMockData([{ id: 'a' }]);");
    add_endpoint("save_b", "return await saveMockData([{ id: 'b1' }, { id: 'b2' }]);");

    ExecutionResponse response_a;
    ExecutionResponse response_b;
    std::thread first([&]() { response_a = orchestrator->execute("save_a", "owner", with_collection()); });
    std::thread second([&]() { response_b = orchestrator->execute("save_b", "owner", with_collection()); });
    first.join();
    second.join();

    ASSERT_TRUE(response_a.success) << response_a.error;
    ASSERT_TRUE(response_b.success) << response_b.error;
    int version_a = response_a.saved_data["results"][0]["collection"]["version"].asInt();
    int version_b = response_b.saved_data["results"][0]["collection"]["version"].asInt();
    EXPECT_NE(version_a, version_b);

    // The stored items are exactly those of the save that committed last
    auto stored = store.find_collection("col_users");
    EXPECT_EQ(stored->version, 3);
    EXPECT_EQ(std::max(version_a, version_b), 3);
    if (version_a > version_b) {
        ASSERT_EQ(stored->items.size(), 1u);
        EXPECT_EQ(stored->items[0]["id"].asString(), "a");
    } else {
        ASSERT_EQ(stored->items.size(), 2u);
        EXPECT_EQ(stored->items[0]["id"].asString(), "b1");
        EXPECT_EQ(stored->items[1]["id"].asString(), "b2");
    }
}

// ============================================================================
// Test Contract: Rejections
// ============================================================================

TEST_F(OrchestratorTest, UnknownEndpointIsNotFound) {
    try {
        orchestrator->execute("missing", "owner", ExecuteInput());
        FAIL() << "Expected NotFound";
    } catch (const NotFound& e) {
        EXPECT_EQ(e.code(), "ENDPOINT_NOT_FOUND");
    }
    EXPECT_EQ(store.log_count(), 0u);
}

TEST_F(OrchestratorTest, OversizedCodeIsRejectedAndLogged) {
    add_endpoint("huge", "return 1;" + std::string(60000, ' '));

    EXPECT_THROW(orchestrator->execute("huge", "owner", ExecuteInput()), ValidationError);

    auto logs = store.recent("huge", 1);
    ASSERT_EQ(logs.size(), 1u);
    EXPECT_EQ(logs[0].status_code, 400);
    EXPECT_NE(logs[0].error.find("CODE_VALIDATION_FAILED"), std::string::npos);
    EXPECT_EQ(rate_limiter->tracked_users(), 0u);
    EXPECT_EQ(orchestrator->total_executions(), 0u);
}

TEST_F(OrchestratorTest, OutOfRangeLimitsAreRejected) {
    add_endpoint("limits", "return 1;");

    ExecuteInput slow;
    slow.timeout_ms = 60001;
    EXPECT_THROW(orchestrator->execute("limits", "owner", slow), ValidationError);

    ExecuteInput tiny;
    tiny.memory_limit_mb = 32;
    EXPECT_THROW(orchestrator->execute("limits", "owner", tiny), ValidationError);
}

TEST_F(OrchestratorTest, NonEditorIsDenied) {
    add_endpoint("private", "return 1;");
    EXPECT_THROW(orchestrator->execute("private", "viewer", ExecuteInput()), AccessDenied);
    EXPECT_EQ(store.recent("private", 1)[0].status_code, 403);
}

TEST_F(OrchestratorTest, ForeignCollectionIsDenied) {
    add_endpoint("peek", "return getCollection();");
    EXPECT_THROW(orchestrator->execute("peek", "owner", with_collection("col_foreign")), AccessDenied);
}

TEST_F(OrchestratorTest, UnknownCollectionIsNotFound) {
    add_endpoint("peek", "return getCollection();");
    try {
        orchestrator->execute("peek", "owner", with_collection("col_missing"));
        FAIL() << "Expected NotFound";
    } catch (const NotFound& e) {
        EXPECT_EQ(e.code(), "COLLECTION_NOT_FOUND");
    }
}

TEST_F(OrchestratorTest, RateLimitAppliesPerUser) {
    RateLimiter::Config tight;
    tight.max_executions_per_window = 2;
    RateLimiter limiter(tight);
    Orchestrator limited(*executor, *environments, limiter,
                         Orchestrator::Collaborators{store, store, store, store, store});
    add_endpoint("ping", "return 'pong';");

    limited.execute("ping", "owner", ExecuteInput());
    limited.execute("ping", "owner", ExecuteInput());
    EXPECT_THROW(limited.execute("ping", "owner", ExecuteInput()), RateLimitExceeded);
    EXPECT_EQ(store.recent("ping", 1)[0].status_code, 429);
}

TEST_F(OrchestratorTest, RuntimeErrorComesBackAsFailure) {
    add_endpoint("broken", "throw new Error('handler exploded');");

    ExecutionResponse response = orchestrator->execute("broken", "owner", ExecuteInput());

    EXPECT_FALSE(response.success);
    EXPECT_EQ(response.status_code(), 500);
    EXPECT_NE(response.error.find("handler exploded"), std::string::npos);
    EXPECT_EQ(store.recent("broken", 1)[0].status_code, 500);
    EXPECT_EQ(store.find_endpoint("broken")->call_count, 0);
}

TEST_F(OrchestratorTest, TimeoutIsReportedAndLogged) {
    add_endpoint("spin", "const s = Date.now(); while (Date.now() - s < 5000) {}");
    ExecuteInput input;
    input.timeout_ms = 200;

    EXPECT_THROW(orchestrator->execute("spin", "owner", input), ExecutionTimeout);
    EXPECT_EQ(store.recent("spin", 1)[0].status_code, 504);
}

// ============================================================================
// Test Contract: Logging, History and Health
// ============================================================================

TEST_F(OrchestratorTest, LargeBodiesAreTruncatedInLogs) {
    add_endpoint("echo", "return request.body.size;");
    ExecuteInput input;
    input.request.body["blob"] = std::string(20 * 1024, 'x');
    input.request.body["size"] = 20;

    orchestrator->execute("echo", "owner", input);

    auto logs = store.recent("echo", 1);
    ASSERT_TRUE(logs[0].request_body.isString());
    EXPECT_NE(logs[0].request_body.asString().find("(truncated)"), std::string::npos);
    EXPECT_LE(logs[0].request_body.asString().size(), MAX_LOGGED_BODY_BYTES + 20);
}

TEST_F(OrchestratorTest, HistoryIsNewestFirstAndViewRestricted) {
    add_endpoint("counted", "return request.query.n;");
    for (int i = 0; i < 3; ++i) {
        ExecuteInput input;
        input.request.query["n"] = std::to_string(i);
        orchestrator->execute("counted", "owner", input);
    }

    auto history = orchestrator->history("counted", "viewer", 2);
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0].query_params["n"].asString(), "2");
    EXPECT_EQ(history[1].query_params["n"].asString(), "1");

    EXPECT_THROW(orchestrator->history("counted", "stranger"), AccessDenied);
    EXPECT_THROW(orchestrator->history("missing", "owner"), NotFound);
}

TEST_F(OrchestratorTest, HealthReportsDegradedWithoutHeavy) {
    add_endpoint("ok", "return 1;");
    orchestrator->execute("ok", "owner", ExecuteInput());

    Json::Value health = orchestrator->health();
    EXPECT_EQ(health["status"].asString(), "degraded");
    EXPECT_EQ(health["heavyBackend"]["status"].asString(), "UNHEALTHY");
    EXPECT_EQ(health["totalExecutions"].asUInt(), 1u);
    EXPECT_EQ(health["totalUsers"].asUInt(), 1u);
    EXPECT_EQ(health["rateLimitCeiling"].asInt(), 50);
    EXPECT_EQ(health["activeEnvironments"].asUInt(), 0u);
}
