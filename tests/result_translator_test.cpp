#include <gtest/gtest.h>

#include "capsule/core/execute_request.hpp"
#include "capsule/core/result_translator.hpp"

#include <thread>

using namespace capsule::core;
using json = nlohmann::json;

TEST(ResultTranslatorTest, CompletedRunCarriesOutputAndNoError) {
    auto started = std::chrono::steady_clock::now();
    OutputCollector output;
    output.AppendLine("hello");

    RunOutcome outcome;
    outcome.state = RunState::COMPLETED;

    auto result = ResultTranslator::Translate(outcome, output, started);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.output, "hello");
    EXPECT_FALSE(result.error.has_value());
    EXPECT_EQ(result.error_kind, ErrorKind::NONE);

    json j = ResultTranslator::ToJson(result);
    EXPECT_EQ(j["success"], true);
    EXPECT_EQ(j["output"], "hello");
    EXPECT_FALSE(j.contains("error"));
    EXPECT_TRUE(j["executionTimeMs"].is_number_integer());
}

TEST(ResultTranslatorTest, FailedRunKeepsPartialOutput) {
    auto started = std::chrono::steady_clock::now();
    OutputCollector output;
    output.AppendLine("step 1");

    RunOutcome outcome;
    outcome.state = RunState::FAILED;
    outcome.error_kind = ErrorKind::RUNTIME;
    outcome.error = "boom";

    auto result = ResultTranslator::Translate(outcome, output, started);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.output, "step 1");
    EXPECT_EQ(result.error.value_or(""), "boom");
    EXPECT_EQ(result.error_kind, ErrorKind::RUNTIME);
    EXPECT_EQ(ResultTranslator::ToJson(result)["error"], "boom");
}

TEST(ResultTranslatorTest, FailureWithoutKindIsInternal) {
    auto result = ResultTranslator::Failure(ErrorKind::NONE, "lost", "", std::chrono::steady_clock::now());
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::INTERNAL);
}

TEST(ResultTranslatorTest, MeasuresFromStart) {
    auto started = std::chrono::steady_clock::now();
    std::this_thread::sleep_for(std::chrono::milliseconds(30));

    auto result = ResultTranslator::Failure(ErrorKind::TIMEOUT, "late", "", started);
    EXPECT_GE(result.execution_time_ms, 30);

    std::string text = ResultTranslator::ToJsonString(result);
    EXPECT_NE(text.find("\"executionTimeMs\":"), std::string::npos);
    EXPECT_EQ(text.find('\n'), std::string::npos);
}

TEST(ExecuteRequestTest, ParsesEnvelope) {
    auto request = ParseExecuteRequest(json{{"code", "log(1)"}, {"projectId", "P"},
                                            {"meetingId", "m-1"}, {"userId", nullptr}});
    EXPECT_EQ(request.code, "log(1)");
    EXPECT_EQ(request.context.project_id, "P");
    EXPECT_EQ(request.context.meeting_id.value_or(""), "m-1");
    EXPECT_FALSE(request.context.user_id.has_value());

    EXPECT_EQ(ToJson(request)["userId"], nullptr);
}

TEST(ExecuteRequestTest, MissingFieldsUseTheContractMessage) {
    const std::string expected = "Missing required fields: code, projectId";

    for (const json& body : {json{{"code", "log(1)"}}, json{{"projectId", "P"}},
                             json{{"code", ""}, {"projectId", "P"}}, json::array()}) {
        try {
            ParseExecuteRequest(body);
            FAIL() << "accepted " << body.dump();
        }
        catch (const RequestError& e) {
            EXPECT_EQ(e.what(), expected);
        }
    }

    EXPECT_THROW(ParseExecuteRequest(json{{"code", "x"}, {"projectId", 7}}), RequestError);
}
