/// @file envelope_codec_test.cpp
/// @brief Tests for decoding "entity created" stream records

#include <gtest/gtest.h>

#include "consumer/envelope_codec.h"

namespace tracescore::consumer {
namespace {

using model::EntityType;

model::StreamEntry Record(std::string payload) {
    return model::StreamEntry{"1-0", {{kPayloadField, std::move(payload)}}};
}

TEST(JsonEnvelopeCodecTest, DecodesSingleTrace) {
    JsonEnvelopeCodec codec;
    auto message = codec.Decode(Record(R"({
        "workspaceId": "ws-1", "userName": "alice", "projectId": "proj-1",
        "traces": {"id": "trace-1", "name": "chat", "input": {"q": "hi"},
                   "start_time": "2024-05-01T10:00:00Z"}
    })"),
                                EntityType::kTrace);
    ASSERT_TRUE(message.ok()) << message.status();
    EXPECT_EQ(message->workspace_id, "ws-1");
    EXPECT_EQ(message->user_name, "alice");
    EXPECT_EQ(message->project_id, "proj-1");
    EXPECT_FALSE(message->rule_id.has_value());
    ASSERT_EQ(message->entities.size(), 1u);
    EXPECT_EQ(message->entities[0].id, "trace-1");
    EXPECT_EQ(message->entities[0].project_id, "proj-1");
    EXPECT_EQ(message->entities[0].start_time_ms.value(), 1714557600000);
}

TEST(JsonEnvelopeCodecTest, SpanArraysKeepTheirOwnProjects) {
    JsonEnvelopeCodec codec;
    auto message = codec.Decode(Record(R"({
        "workspaceId": "ws-1", "userName": "alice", "ruleId": "rule-7",
        "spans": [{"id": "span-1", "trace_id": "trace-1", "project_id": "proj-2"},
                  {"id": "span-2", "trace_id": "trace-1"}]
    })"),
                                EntityType::kSpan);
    ASSERT_TRUE(message.ok()) << message.status();
    EXPECT_EQ(message->rule_id.value(), "rule-7");
    EXPECT_EQ(message->project_id, "proj-2");
    ASSERT_EQ(message->entities.size(), 2u);
    EXPECT_EQ(message->entities[0].type, EntityType::kSpan);
    EXPECT_EQ(message->entities[0].trace_id, "trace-1");
}

TEST(JsonEnvelopeCodecTest, DecodesThreadIds) {
    JsonEnvelopeCodec codec;
    auto message = codec.Decode(
        Record(R"({"workspaceId": "ws-1", "userName": "alice", "projectId": "proj-1",
                   "threadIds": ["thread-1", "thread-2"]})"),
        EntityType::kThread);
    ASSERT_TRUE(message.ok()) << message.status();
    EXPECT_EQ(message->thread_ids, (std::vector<std::string>{"thread-1", "thread-2"}));
    EXPECT_TRUE(message->entities.empty());
}

TEST(JsonEnvelopeCodecTest, UndecodableRecordsAreDataLoss) {
    JsonEnvelopeCodec codec;
    const std::vector<std::pair<model::StreamEntry, EntityType>> cases = {
        {model::StreamEntry{"1-0", {{"other", "{}"}}}, EntityType::kTrace},
        {Record("not json"), EntityType::kTrace},
        {Record("[1, 2]"), EntityType::kTrace},
        {Record(R"({"userName": "alice", "traces": []})"), EntityType::kTrace},
        {Record(R"({"workspaceId": "ws-1", "spans": []})"), EntityType::kTrace},
        {Record(R"({"workspaceId": "ws-1", "traces": [{"name": "no id"}]})"), EntityType::kTrace},
        {Record(R"({"workspaceId": "ws-1", "threadIds": ["t1"]})"), EntityType::kThread},
        {Record(R"({"workspaceId": "ws-1", "projectId": "p", "threadIds": [""]})"), EntityType::kThread},
    };
    for (const auto& [entry, type] : cases) {
        auto message = codec.Decode(entry, type);
        EXPECT_EQ(message.status().code(), absl::StatusCode::kDataLoss) << entry.fields.begin()->second;
    }
}

TEST(JsonEnvelopeCodecTest, EncodeProducesDecodableRecord) {
    JsonEnvelopeCodec codec;
    model::StreamMessage message;
    message.workspace_id = "ws-1";
    message.user_name = "alice";
    message.project_id = "proj-1";
    message.entity_type = EntityType::kTrace;
    message.rule_id = "rule-1";
    model::ScoredEntity trace;
    trace.id = "trace-1";
    trace.project_id = "proj-1";
    trace.tags = {"prod"};
    message.entities.push_back(trace);

    auto fields = codec.Encode(message);
    ASSERT_EQ(fields.size(), 1u);
    EXPECT_EQ(fields[0].first, kPayloadField);

    auto decoded = codec.Decode(model::StreamEntry{"9-0", {fields.begin(), fields.end()}}, EntityType::kTrace);
    ASSERT_TRUE(decoded.ok()) << decoded.status();
    EXPECT_EQ(decoded->rule_id.value(), "rule-1");
    EXPECT_EQ(decoded->entities[0].tags, std::vector<std::string>{"prod"});
}

TEST(MakeEnvelopeCodecTest, KnownAndUnknownNames) {
    auto codec = MakeEnvelopeCodec("json");
    ASSERT_TRUE(codec.ok());
    EXPECT_EQ((*codec)->Name(), "json");
    EXPECT_EQ(MakeEnvelopeCodec("protobuf").status().code(), absl::StatusCode::kFailedPrecondition);
}

}  // namespace
}  // namespace tracescore::consumer
