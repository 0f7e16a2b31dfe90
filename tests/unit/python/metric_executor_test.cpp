/// @file metric_executor_test.cpp
/// @brief Tests for the python metric backend client

#include <gtest/gtest.h>

#include <thread>

#include <httplib.h>

#include "python/metric_executor.h"

namespace tracescore::python {
namespace {

using json = nlohmann::json;

TEST(ParsePythonScoresTest, NumbersAndBooleans) {
    auto scores = ParsePythonScores(R"({"scores": [
        {"name": "length", "value": 12, "reason": "twelve words"},
        {"name": "polite", "value": true},
        {"name": "broken", "value": "n/a"},
        {"value": 3}
    ]})");
    ASSERT_TRUE(scores.ok()) << scores.status();
    ASSERT_EQ(scores->size(), 2u);
    EXPECT_EQ((*scores)[0].name, "length");
    EXPECT_DOUBLE_EQ((*scores)[0].value, 12.0);
    EXPECT_EQ((*scores)[0].reason, "twelve words");
    EXPECT_DOUBLE_EQ((*scores)[1].value, 1.0);
}

TEST(ParsePythonScoresTest, MissingScoresIsAParseError) {
    EXPECT_EQ(ParsePythonScores(R"({"error": "boom"})").status().code(), absl::StatusCode::kInternal);
    EXPECT_EQ(ParsePythonScores("<html>").status().code(), absl::StatusCode::kInternal);
}

TEST(HttpPythonMetricExecutorTest, EmptyDataIsRejected) {
    HttpPythonMetricExecutor executor(HttpPythonExecutorConfig{});
    auto scores = executor.Evaluate("def score(): return 1", json::object(), std::chrono::seconds(1));
    EXPECT_EQ(scores.status().code(), absl::StatusCode::kInvalidArgument);
}

TEST(HttpPythonMetricExecutorTest, PostsCodeAndData) {
    httplib::Server server;
    std::string received;
    server.Post("/v1/private/evaluators/python", [&received](const httplib::Request& req,
                                                              httplib::Response& res) {
        received = req.body;
        res.set_content(R"({"scores": [{"name": "length", "value": 5}]})", "application/json");
    });
    int port = server.bind_to_any_port("127.0.0.1");
    std::thread listener([&server]() { server.listen_after_bind(); });
    server.wait_until_ready();

    HttpPythonExecutorConfig config;
    config.url = "http://127.0.0.1:" + std::to_string(port);
    HttpPythonMetricExecutor executor(config);
    auto scores = executor.Evaluate("def score(output): return len(output)",
                                    json::parse(R"({"output": "Paris"})"), std::chrono::seconds(5));

    server.stop();
    listener.join();

    ASSERT_TRUE(scores.ok()) << scores.status();
    ASSERT_EQ(scores->size(), 1u);
    EXPECT_DOUBLE_EQ(scores->front().value, 5.0);
    auto body = json::parse(received);
    EXPECT_EQ(body["code"], "def score(output): return len(output)");
    EXPECT_EQ(body["data"]["output"], "Paris");
}

}  // namespace
}  // namespace tracescore::python
