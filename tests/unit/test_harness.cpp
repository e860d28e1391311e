#include <gtest/gtest.h>
#include "../../src/harness.h"
#include "../../src/execution_types.h"

namespace mockrun {
namespace {

class HarnessTest : public ::testing::Test {
protected:
    void SetUp() override {
        context.request.execution_id = "exec_42";
        context.request.code = "return Response.json(getCollection());";
        context.request.request.query["page"] = "1";
        context.mock_data["users"].append("alice");
        context.environment["API_URL"] = "https://api.example.test";
        context.current_collection["name"] = "users";
        context.current_collection["id"] = "col_1";
        context.current_collection["canSave"] = true;
    }

    ExecutionContext context;
};

TEST_F(HarnessTest, ContextCarriesEverythingUserCodeSees) {
    Json::Value ctx = Harness::build_context(context);

    EXPECT_EQ(ctx["executionId"].asString(), "exec_42");
    EXPECT_EQ(ctx["mockData"]["users"][0].asString(), "alice");
    EXPECT_EQ(ctx["environment"]["API_URL"].asString(), "https://api.example.test");
    EXPECT_EQ(ctx["request"]["query"]["page"].asString(), "1");
    EXPECT_EQ(ctx["request"]["collection"].asString(), "users");
    EXPECT_EQ(ctx["currentCollection"]["id"].asString(), "col_1");
}

TEST_F(HarnessTest, WrapsUserCodeInAsyncFunction) {
    std::string wrapped = Harness::wrap_user_code("return 1;");
    EXPECT_EQ(wrapped.rfind("async function () {", 0), 0u);
    EXPECT_NE(wrapped.find("return 1;"), std::string::npos);
}

TEST_F(HarnessTest, PreludeInstallsSandboxGlobals) {
    const std::string& prelude = Harness::prelude();
    for (const char* name : {"mockData", "environment", "request", "currentCollection", "Response",
                             "getCollection", "getCollectionByName", "generateId", "generateToken",
                             "getTimestamp", "saveMockData", "updateAndSave", "createAndSave",
                             "updateAndSaveItem", "deleteAndSave", "_saveOperation"}) {
        EXPECT_NE(prelude.find(name), std::string::npos) << name;
    }
}

TEST_F(HarnessTest, NodeProgramEmbedsUserCodeAsStringLiteral) {
    // Given: code that would break out of a naive template
    context.request.code = "return \"});process.exit(1);//\";";

    std::string program = Harness::build_node_program(context);

    // Then: quotes arrive escaped inside a JSON string literal
    EXPECT_NE(program.find("const userFunction = \"async function () {\\n"
                           "return \\\"});process.exit(1);//\\\";\\n}\";"),
              std::string::npos);
    EXPECT_NE(program.find("const context = {"), std::string::npos);
    EXPECT_NE(program.find("vm.compileFunction"), std::string::npos);
    EXPECT_NE(program.find(ENVELOPE_MARKER), std::string::npos);
}

TEST_F(HarnessTest, NodeProgramRemovesProcessBeforeUserCodeRuns) {
    std::string program = Harness::build_node_program(context);
    size_t removal = program.find("delete globalThis.process");
    size_t invocation = program.find("then(() => run())");
    ASSERT_NE(removal, std::string::npos);
    ASSERT_NE(invocation, std::string::npos);
    EXPECT_LT(removal, invocation);
}

} // namespace
} // namespace mockrun
