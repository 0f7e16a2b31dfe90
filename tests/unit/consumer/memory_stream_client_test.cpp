/// @file memory_stream_client_test.cpp
/// @brief Tests for the in-process consumer-group stream

#include <gtest/gtest.h>

#include <thread>

#include "consumer/memory_stream_client.h"

namespace tracescore::consumer {
namespace {

using std::chrono::milliseconds;

constexpr const char* kStream = "online_scoring:llm_as_judge";
constexpr const char* kGroup = "online_scoring";

class MemoryStreamClientTest : public ::testing::Test {
protected:
    std::string Add(const std::string& value) {
        auto id = client_.Append(kStream, {{"payload", value}});
        EXPECT_TRUE(id.ok());
        return id.value_or("");
    }

    MemoryStreamClient client_;
};

TEST_F(MemoryStreamClientTest, GroupStartsAtTheEndOfTheStream) {
    Add("before");
    ASSERT_TRUE(client_.CreateGroup(kStream, kGroup).ok());
    ASSERT_TRUE(client_.CreateGroup(kStream, kGroup).ok());
    Add("after");

    auto entries = client_.ReadGroup(kStream, kGroup, "c1", 10, milliseconds(0));
    ASSERT_TRUE(entries.ok());
    ASSERT_EQ(entries->size(), 1u);
    EXPECT_EQ(entries->front().fields.at("payload"), "after");
}

TEST_F(MemoryStreamClientTest, MissingGroupIsAnError) {
    EXPECT_EQ(client_.ReadGroup(kStream, kGroup, "c1", 1, milliseconds(0)).status().code(),
              absl::StatusCode::kFailedPrecondition);
}

TEST_F(MemoryStreamClientTest, EntriesAreDeliveredOnceAndStayPendingUntilAcked) {
    ASSERT_TRUE(client_.CreateGroup(kStream, kGroup).ok());
    auto first = Add("a");
    Add("b");
    Add("c");

    auto batch = client_.ReadGroup(kStream, kGroup, "c1", 2, milliseconds(0));
    ASSERT_TRUE(batch.ok());
    ASSERT_EQ(batch->size(), 2u);
    EXPECT_EQ(batch->front().id, first);

    auto rest = client_.ReadGroup(kStream, kGroup, "c2", 10, milliseconds(0));
    ASSERT_TRUE(rest.ok());
    ASSERT_EQ(rest->size(), 1u);
    EXPECT_EQ(client_.PendingCount(kStream, kGroup), 3u);
    EXPECT_EQ(client_.DeliveryCount(kStream, kGroup, first).value(), 1);

    EXPECT_EQ(client_.Ack(kStream, kGroup, {first, "999-0"}).value(), 1);
    EXPECT_EQ(client_.PendingCount(kStream, kGroup), 2u);
    EXPECT_EQ(client_.DeliveryCount(kStream, kGroup, first).value(), 0);
    EXPECT_EQ(client_.PendingOwner(kStream, kGroup, first).value(), "");

    EXPECT_EQ(client_.Delete(kStream, {first}).value(), 1);
    EXPECT_EQ(client_.Length(kStream), 2u);
}

TEST_F(MemoryStreamClientTest, AutoClaimTakesIdleEntries) {
    ASSERT_TRUE(client_.CreateGroup(kStream, kGroup).ok());
    auto id = Add("a");
    ASSERT_TRUE(client_.ReadGroup(kStream, kGroup, "c1", 10, milliseconds(0)).ok());

    auto not_idle = client_.AutoClaim(kStream, kGroup, "c2", std::chrono::minutes(1), 10);
    ASSERT_TRUE(not_idle.ok());
    EXPECT_TRUE(not_idle->empty());

    auto claimed = client_.AutoClaim(kStream, kGroup, "c2", milliseconds(0), 10);
    ASSERT_TRUE(claimed.ok());
    ASSERT_EQ(claimed->size(), 1u);
    EXPECT_EQ(claimed->front().id, id);
    EXPECT_EQ(client_.DeliveryCount(kStream, kGroup, id).value(), 2);
    EXPECT_EQ(client_.PendingOwner(kStream, kGroup, id).value(), "c2");

    // c1 no longer owns it, so removing c1 keeps it pending
    ASSERT_TRUE(client_.RemoveConsumer(kStream, kGroup, "c1").ok());
    EXPECT_EQ(client_.PendingCount(kStream, kGroup), 1u);
    ASSERT_TRUE(client_.RemoveConsumer(kStream, kGroup, "c2").ok());
    EXPECT_EQ(client_.PendingCount(kStream, kGroup), 0u);
    EXPECT_TRUE(client_.Consumers(kStream, kGroup).empty());
}

TEST_F(MemoryStreamClientTest, AutoClaimDropsDeletedEntries) {
    ASSERT_TRUE(client_.CreateGroup(kStream, kGroup).ok());
    auto id = Add("a");
    ASSERT_TRUE(client_.ReadGroup(kStream, kGroup, "c1", 10, milliseconds(0)).ok());
    ASSERT_TRUE(client_.Delete(kStream, {id}).ok());

    auto claimed = client_.AutoClaim(kStream, kGroup, "c2", milliseconds(0), 10);
    ASSERT_TRUE(claimed.ok());
    EXPECT_TRUE(claimed->empty());
    EXPECT_EQ(client_.PendingCount(kStream, kGroup), 0u);
}

TEST_F(MemoryStreamClientTest, BlockingReadWakesOnAppend) {
    ASSERT_TRUE(client_.CreateGroup(kStream, kGroup).ok());
    std::thread producer([this]() {
        std::this_thread::sleep_for(milliseconds(50));
        Add("late");
    });

    auto entries = client_.ReadGroup(kStream, kGroup, "c1", 10, milliseconds(2000));
    producer.join();
    ASSERT_TRUE(entries.ok());
    EXPECT_EQ(entries->size(), 1u);
}

TEST_F(MemoryStreamClientTest, InjectedFailure) {
    ASSERT_TRUE(client_.CreateGroup(kStream, kGroup).ok());
    client_.SetFailure(absl::UnavailableError("connection reset"));
    EXPECT_EQ(client_.ReadGroup(kStream, kGroup, "c1", 1, milliseconds(0)).status().code(),
              absl::StatusCode::kUnavailable);
    EXPECT_FALSE(client_.Append(kStream, {{"payload", "x"}}).ok());

    client_.SetFailure(absl::OkStatus());
    EXPECT_TRUE(client_.ReadGroup(kStream, kGroup, "c1", 1, milliseconds(0)).ok());
}

}  // namespace
}  // namespace tracescore::consumer
