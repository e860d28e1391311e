#include <gtest/gtest.h>
#include "../../src/result_cache.h"
#include <thread>

namespace mockrun {
namespace {

class ResultCacheTest : public ::testing::Test {
protected:
    ExecutionContext make_context(const std::string& code) {
        ExecutionContext context;
        context.request.execution_id = "exec_1";
        context.request.code = code;
        context.mock_data["users"].append("alice");
        return context;
    }

    ExecutionResult make_result(bool success) {
        ExecutionResult result;
        result.success = success;
        result.output["value"] = 1;
        result.logs.push_back("ran");
        return result;
    }
};

TEST_F(ResultCacheTest, KeyIgnoresExecutionId) {
    ExecutionContext a = make_context("return 1;");
    ExecutionContext b = make_context("return 1;");
    b.request.execution_id = "exec_2";

    EXPECT_EQ(ResultCache::compute_key(a, Strategy::LIGHT), ResultCache::compute_key(b, Strategy::LIGHT));
}

TEST_F(ResultCacheTest, KeyCoversCodeStrategyDataAndRequest) {
    ExecutionContext base = make_context("return 1;");
    std::string key = ResultCache::compute_key(base, Strategy::LIGHT);

    EXPECT_NE(key, ResultCache::compute_key(make_context("return 2;"), Strategy::LIGHT));
    EXPECT_NE(key, ResultCache::compute_key(base, Strategy::HEAVY));

    ExecutionContext other_data = base;
    other_data.mock_data["users"].append("bob");
    EXPECT_NE(key, ResultCache::compute_key(other_data, Strategy::LIGHT));

    ExecutionContext other_query = base;
    other_query.request.request.query["page"] = "2";
    EXPECT_NE(key, ResultCache::compute_key(other_query, Strategy::LIGHT));

    ExecutionContext other_env = base;
    other_env.environment["API_URL"] = "https://example.test";
    EXPECT_NE(key, ResultCache::compute_key(other_env, Strategy::LIGHT));
}

TEST_F(ResultCacheTest, ReturnsCopyFlaggedCached) {
    ResultCache cache(std::chrono::milliseconds(1000));
    cache.put("k", make_result(true));

    auto hit = cache.get("k");
    ASSERT_TRUE(hit.has_value());
    EXPECT_TRUE(hit->cached);
    EXPECT_EQ(hit->output["value"].asInt(), 1);
    ASSERT_EQ(hit->logs.size(), 1u);

    // The stored entry itself is not flagged
    hit->output["value"] = 99;
    EXPECT_EQ(cache.get("k")->output["value"].asInt(), 1);
}

TEST_F(ResultCacheTest, IgnoresFailedResults) {
    ResultCache cache;
    cache.put("k", make_result(false));
    EXPECT_FALSE(cache.get("k").has_value());
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(ResultCacheTest, EntriesExpireAfterTtl) {
    ResultCache cache(std::chrono::milliseconds(50));
    cache.put("k", make_result(true));
    EXPECT_EQ(cache.size(), 1u);

    std::this_thread::sleep_for(std::chrono::milliseconds(80));

    EXPECT_FALSE(cache.get("k").has_value());
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(ResultCacheTest, ClearDropsEverything) {
    ResultCache cache;
    cache.put("a", make_result(true));
    cache.put("b", make_result(true));
    EXPECT_EQ(cache.size(), 2u);

    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_EQ(cache.ttl(), std::chrono::milliseconds(CACHE_TTL_MS));
}

} // namespace
} // namespace mockrun
