/**
 * @file test_worker_protocol.cpp
 * @brief Unit tests for worker message encoding and lenient decoding.
 * @author AnalyzerOrchestrator Team
 */

#include "protocol/worker_protocol.hpp"

#include <gtest/gtest.h>

using namespace analyzer_orchestrator;

namespace {

Json::Value parse(const std::string& text) {
    auto parsed = parse_json(text);
    EXPECT_TRUE(parsed.has_value()) << text;
    return parsed.value_or(Json::Value{});
}

}  // namespace

TEST(WorkerStatusTest, AcceptsSynonyms) {
    EXPECT_EQ(parse_worker_status("success"), WorkerStatus::Success);
    EXPECT_EQ(parse_worker_status("completed"), WorkerStatus::Success);
    EXPECT_EQ(parse_worker_status("failed"), WorkerStatus::Error);
    EXPECT_EQ(parse_worker_status("partial"), WorkerStatus::Partial);
    EXPECT_EQ(parse_worker_status("timeout"), WorkerStatus::Timeout);
    EXPECT_FALSE(parse_worker_status("done").has_value());
}

TEST(AnalysisProtocolTest, RequestCarriesBothFieldStyles) {
    AnalysisRequest request{"task_abc", ServiceType::PerformanceTester, "anthropic_claude", 4,
                            {"locust", "ab"}};
    auto msg = encode_analysis_request(request);
    EXPECT_EQ(msg["type"].asString(), "analysis_request");
    EXPECT_EQ(msg["service"].asString(), "performance-tester");
    EXPECT_EQ(msg["targetModel"].asString(), "anthropic_claude");
    EXPECT_EQ(msg["model_slug"].asString(), "anthropic_claude");
    EXPECT_EQ(msg["app_number"].asInt64(), 4);
    ASSERT_EQ(msg["tools"].size(), 2u);
    EXPECT_EQ(msg["tools"][1].asString(), "ab");
}

TEST(AnalysisProtocolTest, DecodesNestedCamelCaseBody) {
    auto msg = parse(R"({
        "type": "analysis_result", "status": "success",
        "analysis": {
            "findings": [{"tool": "bandit", "severity": "high"}],
            "toolsUsed": ["bandit"],
            "severityBreakdown": {"high": 1, "low": 0},
            "toolStatus": {"bandit": "ok"}
        }
    })");
    auto response = decode_analysis_response(msg);
    ASSERT_TRUE(response.has_value());
    EXPECT_TRUE(response->succeeded());
    EXPECT_EQ(response->findings.size(), 1u);
    EXPECT_EQ(response->tools_used, std::vector<ToolName>{"bandit"});
    EXPECT_TRUE(response->has_severity_breakdown);
    EXPECT_EQ(response->severity_breakdown.at("high"), 1);
    EXPECT_EQ(response->tool_status["bandit"].asString(), "ok");
    EXPECT_FALSE(response->error.has_value());
}

TEST(AnalysisProtocolTest, DecodesFlatSnakeCaseBody) {
    auto msg = parse(R"({
        "status": "partial",
        "issues": [{"rule": "x"}, {"rule": "y"}],
        "tools_used": ["eslint"],
        "severity_breakdown": {"medium": 2.0}
    })");
    auto response = decode_analysis_response(msg);
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(response->status, WorkerStatus::Partial);
    EXPECT_EQ(response->findings.size(), 2u);
    EXPECT_EQ(response->severity_breakdown.at("medium"), 2);
}

TEST(AnalysisProtocolTest, ErrorStatusCarriesMessage) {
    auto with_error = decode_analysis_response(
        parse(R"({"status":"error","error":{"message":"tool crashed"}})"));
    ASSERT_TRUE(with_error.has_value());
    EXPECT_FALSE(with_error->succeeded());
    EXPECT_EQ(with_error->error, "tool crashed");

    auto bare = decode_analysis_response(parse(R"({"status":"timeout"})"));
    ASSERT_TRUE(bare.has_value());
    EXPECT_EQ(bare->error, "Worker reported timeout");

    auto error_frame = decode_analysis_response(parse(R"({"type":"error","message":"busy"})"));
    ASSERT_TRUE(error_frame.has_value());
    EXPECT_EQ(error_frame->status, WorkerStatus::Error);
    EXPECT_EQ(error_frame->error, "busy");
}

TEST(AnalysisProtocolTest, MissingOrUnknownStatusIsProtocolError) {
    EXPECT_EQ(decode_analysis_response(parse(R"({"findings":[]})")).error().kind,
              ErrorKind::Protocol);
    EXPECT_EQ(decode_analysis_response(parse(R"({"status":"maybe"})")).error().kind,
              ErrorKind::Protocol);
    EXPECT_EQ(decode_analysis_response(Json::Value("text")).error().kind, ErrorKind::Protocol);
}

TEST(AnalysisProtocolTest, NonStringTypeIsProtocolErrorNotException) {
    Json::Value reply;
    EXPECT_NO_THROW(reply = parse(R"({"type":{"kind":"error"},"findings":[]})"));
    auto decoded = decode_analysis_response(reply);
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().kind, ErrorKind::Protocol);

    auto generated = decode_generation_response(parse(R"({"type":["error"]})"));
    ASSERT_FALSE(generated.has_value());
    EXPECT_EQ(generated.error().kind, ErrorKind::Protocol);

    auto counted = decode_analysis_response(
        parse(R"({"status":"success","severityBreakdown":{"high":18446744073709551615,"low":2}})"));
    ASSERT_TRUE(counted.has_value());
    EXPECT_EQ(counted->severity_breakdown.count("high"), 0u);
    EXPECT_EQ(counted->severity_breakdown.at("low"), 2);
}

TEST(GenerationProtocolTest, EncodesAndDecodes) {
    GenerationRequest request{"openai_gpt-4", "crud_todo", 7, 2, std::string{"run_1"}};
    auto msg = encode_generation_request(request);
    EXPECT_EQ(msg["type"].asString(), "generation_request");
    EXPECT_EQ(msg["template"].asString(), "crud_todo");
    EXPECT_EQ(msg["appNumber"].asInt64(), 7);
    EXPECT_EQ(msg["batchId"].asString(), "run_1");

    auto ok = decode_generation_response(
        parse(R"({"type":"generation_result","status":"completed","app_dir":"out/app7"})"));
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(ok->status, WorkerStatus::Success);
    EXPECT_EQ(ok->app_dir, "out/app7");

    auto failed = decode_generation_response(parse(R"({"status":"failed"})"));
    ASSERT_TRUE(failed.has_value());
    EXPECT_EQ(failed->error, "Generation worker reported error");
}

TEST(MessagePlumbingTest, TerminalMessageDetection) {
    EXPECT_TRUE(is_terminal_message(parse(R"({"type":"analysis_result"})")));
    EXPECT_TRUE(is_terminal_message(parse(R"({"type":"error"})")));
    EXPECT_TRUE(is_terminal_message(parse(R"({"status":"healthy"})")));
    EXPECT_FALSE(is_terminal_message(parse(R"({"type":"progress_update","status":"running"})")));
    EXPECT_FALSE(is_terminal_message(parse(R"({"type":"request_queued"})")));
    EXPECT_FALSE(is_terminal_message(parse("[1,2]")));
}

TEST(MessagePlumbingTest, CompactAndPrettyJson) {
    auto msg = make_health_check();
    EXPECT_EQ(to_json_string(msg), R"({"type":"health_check"})");
    EXPECT_NE(to_pretty_json(msg).find('\n'), std::string::npos);
    EXPECT_EQ(parse_json("{broken").error().kind, ErrorKind::Protocol);
}
