#include <nlohmann/json.hpp>
#include "gtest/gtest.h"
#include "sandbox/facade.hpp"
#include "test/assertions.hpp"

using namespace std;
using namespace sandbox;
using namespace nlohmann;

class FacadeTest : public ::testing::Test {
protected:
    static void SetUpTestCase() {
        tool = make_tool_function();
    }

    static void TearDownTestCase() {
        tool = nullptr;
    }

    static function<json(const string &)> tool;
};

function<json(const string &)> FacadeTest::tool;

TEST_F(FacadeTest, RunsStructuredRequest) {
    json result = tool(json{{"code", "print(2+2)"}}.dump());
    EXPECT_EQ(true, result["execution_success"]);
    EXPECT_EQ("4\n", result["output"]);
    EXPECT_EQ("", result["errors"]);
    EXPECT_EQ("Code executed successfully", result["message"]);
    EXPECT_EQ("print(2+2)", result["code"]);
    EXPECT_JSON_EQ(json(nullptr), result["expected_output"]);
    EXPECT_JSON_EQ(json(nullptr), result["comparison"]);
}

TEST_F(FacadeTest, RejectsBlockedCode) {
    json result = tool(R"js({"code": "import os"})js");
    EXPECT_EQ(false, result["execution_success"]);
    EXPECT_EQ("Blocked operation detected: os", result["message"]);
    EXPECT_EQ("", result["output"]);
    EXPECT_JSON_EQ(json(nullptr), result["comparison"]);
}

TEST_F(FacadeTest, ComparesExpectedOutput) {
    json result = tool(R"js({"code": "print('hi')", "expected_output": "hi", "compare_mode": "exact"})js");
    EXPECT_EQ(true, result["execution_success"]);
    EXPECT_EQ("hi", result["expected_output"]);
    json expected = {{"mode", "exact"}, {"match", true}, {"similarity", 1.0}, {"details", "Output matches exactly!"}};
    EXPECT_JSON_EQ(expected, result["comparison"]);
}

TEST_F(FacadeTest, DefaultsToExactComparison) {
    json result = tool(R"js({"code": "print('hi')", "expected_output": "bye"})js");
    ASSERT_TRUE(result["comparison"].is_object());
    EXPECT_EQ("exact", result["comparison"]["mode"]);
    EXPECT_EQ(false, result["comparison"]["match"]);
}

TEST_F(FacadeTest, FallsBackToRawCode) {
    json result = tool("print(1)");
    EXPECT_EQ(true, result["execution_success"]);
    EXPECT_EQ("1\n", result["output"]);
    EXPECT_EQ("print(1)", result["code"]);
    EXPECT_FALSE(result.contains("expected_output"));
    EXPECT_FALSE(result.contains("comparison"));
}

TEST_F(FacadeTest, NonObjectJsonIsRawCode) {
    json result = tool("[1, 2]");
    EXPECT_EQ(true, result["execution_success"]);
    EXPECT_EQ("", result["output"]);
    EXPECT_EQ("[1, 2]", result["code"]);
    EXPECT_FALSE(result.contains("comparison"));
}

TEST_F(FacadeTest, SkipsComparisonAfterFailure) {
    json result = tool(R"js({"code": "print(1/0)", "expected_output": "1"})js");
    EXPECT_EQ(false, result["execution_success"]);
    EXPECT_EQ("Execution error: ZeroDivisionError: division by zero", result["message"]);
    EXPECT_EQ("1", result["expected_output"]);
    EXPECT_JSON_EQ(json(nullptr), result["comparison"]);
}

TEST_F(FacadeTest, MissingCodeIsInvalidInput) {
    json result = tool(R"js({"expected_output": "1"})js");
    EXPECT_EQ(false, result["execution_success"]);
    EXPECT_EQ("Invalid code input", result["message"]);
    EXPECT_EQ("", result["code"]);

    result = tool(R"js({"code": 42})js");
    EXPECT_EQ("Invalid code input", result["message"]);
}

TEST_F(FacadeTest, NonStringExpectedOutputUsesJsonText) {
    json result = tool(R"js({"code": "print(4)", "expected_output": 4, "compare_mode": "contains"})js");
    EXPECT_EQ("4", result["expected_output"]);
    EXPECT_EQ("contains", result["comparison"]["mode"]);
    EXPECT_EQ(true, result["comparison"]["match"]);
}

TEST_F(FacadeTest, UnknownModeIsReported) {
    json result = tool(R"js({"code": "print(4)", "expected_output": "4", "compare_mode": "regex"})js");
    json expected = {{"mode", "regex"}, {"match", false}, {"similarity", 0.0},
                     {"details", "Unknown comparison mode: regex"}};
    EXPECT_JSON_EQ(expected, result["comparison"]);
}

TEST_F(FacadeTest, NullModeIsUnknown) {
    json result = tool(R"js({"code": "print(4)", "expected_output": "4", "compare_mode": null})js");
    EXPECT_EQ("null", result["comparison"]["mode"]);
    EXPECT_EQ(false, result["comparison"]["match"]);
    EXPECT_EQ("Unknown comparison mode: null", result["comparison"]["details"]);
}

TEST_F(FacadeTest, InvalidUtf8InputStillSerializes) {
    json result = tool("print('\xff')");
    EXPECT_EQ(false, result["execution_success"]);
    EXPECT_EQ("print('\xef\xbf\xbd')", result["code"]);
    EXPECT_NO_THROW(result.dump());
}

TEST(FacadeLimitTest, TruncatedMultiByteOutputSerializes) {
    resource_limits limits = resource_limits::defaults();
    limits.output_limit = 1024;
    auto tool = make_tool_function(limits);

    json result = tool("print('\\u20ac' * 1000)");
    EXPECT_EQ(true, result["execution_success"]);
    EXPECT_EQ(true, result["output_truncated"]);
    string dumped;
    ASSERT_NO_THROW(dumped = result.dump());
    EXPECT_EQ(result, json::parse(dumped));
    EXPECT_EQ(1023u, result["output"].get<string>().size());
}

TEST(ExecutionRequestTest, ParsesFields) {
    auto request = execution_request::parse(R"js({"code": "print(1)", "expected_output": "1", "compare_mode": "fuzzy"})js");
    ASSERT_TRUE(request);
    EXPECT_EQ("print(1)", request->code);
    ASSERT_TRUE(request->expected_output);
    EXPECT_EQ("1", *request->expected_output);
    EXPECT_EQ("fuzzy", request->compare_mode);
}

TEST(ExecutionRequestTest, RejectsNonObjects) {
    EXPECT_FALSE(execution_request::parse("print(1)"));
    EXPECT_FALSE(execution_request::parse("\"print(1)\""));
    EXPECT_FALSE(execution_request::parse("12"));
    EXPECT_FALSE(execution_request::parse(""));
}

TEST(ExecutionRequestTest, NullExpectedOutputIsAbsent) {
    auto request = execution_request::parse(R"js({"code": "print(1)", "expected_output": null})js");
    ASSERT_TRUE(request);
    EXPECT_FALSE(request->expected_output);
    EXPECT_EQ("exact", request->compare_mode);
}

TEST(ExecutionRequestTest, NullModeIsKeptAsText) {
    auto request = execution_request::parse(R"js({"code": "print(1)", "expected_output": "1", "compare_mode": null})js");
    ASSERT_TRUE(request);
    EXPECT_EQ("null", request->compare_mode);
}

TEST(ExecutionResultTest, SimpleResultHasFixedKeys) {
    execution_result result;
    result.code = "print(1)";
    result.outcome.result = status::SUCCESS;
    result.outcome.output = "1\n";
    result.outcome.message = "Code executed successfully";
    result.outcome.memory_limit_enforced = true;

    json expected = {{"code", "print(1)"},
                     {"execution_success", true},
                     {"output", "1\n"},
                     {"errors", ""},
                     {"message", "Code executed successfully"},
                     {"memory_limit_enforced", true}};
    EXPECT_JSON_EQ(expected, result.to_json());
}
