/*
 * dummyllm - Deterministic Job Simulator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include "dummyllm/view.hpp"

using namespace dummyllm;
using namespace std::chrono_literals;

namespace {

JobRecord sampleRecord() {
    JobRecord job;
    job.id = "job_000000000001";
    job.state = State::Ok;
    job.mode = Mode::Echo;
    job.createdAt = Clock::time_point(1000ms);
    job.updatedAt = Clock::time_point(1250ms);
    job.op = "llm.chat";
    job.result = JobOutput{"[]", {0, 1}};
    return job;
}

}

TEST(ViewTest, StatusCarriesResultAndNullError) {
    auto job = sampleRecord();
    Json out = renderStatus(job, Clock::time_point(0ms));

    EXPECT_EQ(out["id"], "job_000000000001");
    EXPECT_EQ(out["state"], "ok");
    EXPECT_EQ(out["mode"], "echo");
    EXPECT_EQ(out["created_at"], 1000);
    EXPECT_EQ(out["updated_at"], 1250);
    EXPECT_EQ(out["result"]["text"], "[]");
    EXPECT_EQ(out["result"]["usage"]["prompt_tokens"], 0);
    EXPECT_EQ(out["result"]["usage"]["completion_tokens"], 1);
    EXPECT_TRUE(out["error"].is_null());
}

TEST(ViewTest, StatusCarriesErrorAndNullResult) {
    auto job = sampleRecord();
    job.state = State::Fail;
    job.mode = Mode::Fail;
    job.result.reset();
    job.error = JobError{ERR_SIM_FAIL, "simulated error"};

    Json out = renderStatus(job, Clock::time_point(1000ms));
    EXPECT_EQ(out["state"], "fail");
    EXPECT_EQ(out["created_at"], 0);
    EXPECT_TRUE(out["result"].is_null());
    EXPECT_EQ(out["error"]["code"], "SIM_FAIL");
    EXPECT_EQ(out["error"]["message"], "simulated error");
}

TEST(ViewTest, CreatedAndCancelShapes) {
    auto job = sampleRecord();
    job.state = State::Queued;
    job.result.reset();
    Json created = renderCreated(job, Clock::time_point(0ms));
    EXPECT_EQ(created.size(), 3u);
    EXPECT_EQ(created["state"], "queued");

    job.state = State::Cancelled;
    Json cancel = renderCancel(job);
    EXPECT_EQ(cancel, Json({{"id", "job_000000000001"}, {"state", "cancelled"}}));
}

TEST(ViewTest, RequestViewWeightsOnlyUnderRandom) {
    RequestView view;
    view.op = "llm.chat";
    view.args = Json{{"messages", Json::array()}};
    view.timeoutMs = 8000;
    view.mode = Mode::Fail;
    view.policy = Policy::Flaky;
    view.baseLatencyMs = 250;
    view.seed = 1337;

    Json out = renderRequest(view);
    EXPECT_EQ(out["chosen_mode"], "fail");
    EXPECT_EQ(out["policy"], "flaky");
    EXPECT_TRUE(out["random_weights"].is_null());
    EXPECT_TRUE(out["trace_id"].is_null());
    EXPECT_EQ(out["seed"], 1337);

    view.policy = Policy::Random;
    view.weights = WeightTable{{Policy::Ok, 5}, {Policy::Hang, 1}};
    view.traceId = "t-1";
    out = renderRequest(view);
    EXPECT_EQ(out["random_weights"]["ok"], 5);
    EXPECT_EQ(out["random_weights"]["hang"], 1);
    EXPECT_EQ(out["trace_id"], "t-1");
}

TEST(ViewTest, ErrorEnvelopeUsesStoreErrorName) {
    Json out = renderError(StoreError::AlreadyTerminal, "Job is already ok");
    EXPECT_EQ(out["error"]["code"], "ALREADY_TERMINAL");
    EXPECT_EQ(out["error"]["message"], "Job is already ok");
}

TEST(ParseJobRequestTest, AcceptsFullRequest) {
    auto body = Json::parse(R"({"op":"llm.chat","args":{"messages":[]},"timeout_ms":500,"trace_id":"abc"})");
    auto parsed = parseJobRequest(body);
    ASSERT_TRUE(parsed) << parsed.message;
    EXPECT_EQ(parsed.request.op, "llm.chat");
    EXPECT_TRUE(parsed.request.args.contains("messages"));
    EXPECT_EQ(parsed.request.timeoutMs.value_or(-1), 500);
    EXPECT_EQ(parsed.request.traceId.value_or(""), "abc");
}

TEST(ParseJobRequestTest, OptionalFieldsMayBeAbsentOrNull) {
    auto parsed = parseJobRequest(Json::parse(R"({"op":"tool.search","args":null})"));
    ASSERT_TRUE(parsed);
    EXPECT_TRUE(parsed.request.args.is_object());
    EXPECT_TRUE(parsed.request.args.empty());
    EXPECT_FALSE(parsed.request.timeoutMs.has_value());
    EXPECT_FALSE(parsed.request.traceId.has_value());
}

TEST(ParseJobRequestTest, RejectsMalformedRequests) {
    EXPECT_EQ(parseJobRequest(Json::array()).message, "Request must be a JSON object");
    EXPECT_EQ(parseJobRequest(Json::parse(R"({"args":{}})")).message, "Missing op");
    EXPECT_EQ(parseJobRequest(Json::parse(R"({"op":""})")).message, "Missing op");
    EXPECT_EQ(parseJobRequest(Json::parse(R"({"op":7})")).message, "Missing op");
    EXPECT_FALSE(parseJobRequest(Json::parse(R"({"op":"x","args":[1]})")));
    EXPECT_FALSE(parseJobRequest(Json::parse(R"({"op":"x","timeout_ms":-1})")));
    EXPECT_FALSE(parseJobRequest(Json::parse(R"({"op":"x","timeout_ms":"soon"})")));
    EXPECT_FALSE(parseJobRequest(Json::parse(R"({"op":"x","trace_id":3})")));
}
