/// @file metrics_test.cpp
/// @brief Tests for in-process metrics

#include <gtest/gtest.h>

#include "common/metrics.h"

namespace tracescore {
namespace {

class MetricsTest : public ::testing::Test {
protected:
    void SetUp() override {
        MetricsRegistry::Instance().Reset();
    }
};

TEST_F(MetricsTest, CounterIncrement) {
    auto& counter = MetricsRegistry::Instance().GetCounter("test_counter");

    EXPECT_EQ(counter.Value(), 0);

    counter.Increment();
    EXPECT_EQ(counter.Value(), 1);

    counter.Add(5);
    EXPECT_EQ(counter.Value(), 6);
}

TEST_F(MetricsTest, CounterNegativeIgnored) {
    auto& counter = MetricsRegistry::Instance().GetCounter("test_counter");

    counter.Add(10);
    counter.Add(-5);

    EXPECT_EQ(counter.Value(), 10);
}

TEST_F(MetricsTest, GaugeKeepsLastValue) {
    auto& gauge = TRACESCORE_GAUGE("tracescore_stream_test_pending");

    gauge.Set(4.0);
    gauge.Set(2.0);
    EXPECT_EQ(gauge.Value(), 2.0);
}

TEST_F(MetricsTest, HistogramObservations) {
    auto& histogram = MetricsRegistry::Instance().GetHistogram("test_histogram");

    histogram.Observe(5.0);
    histogram.Observe(50.0);
    histogram.Observe(1000.0);

    EXPECT_EQ(histogram.Count(), 3);
    EXPECT_NEAR(histogram.Sum(), 1055.0, 0.001);
}

TEST_F(MetricsTest, HistogramBuckets) {
    Histogram histogram("test", {10.0, 100.0, 1000.0, 10000.0}, "");

    histogram.Observe(5.0);
    histogram.Observe(50.0);
    histogram.Observe(500.0);
    histogram.Observe(5000.0);
    histogram.Observe(50000.0);

    auto bucket_counts = histogram.Buckets();
    ASSERT_EQ(bucket_counts.size(), 5);  // 4 buckets + Inf

    // Cumulative counts
    EXPECT_EQ(bucket_counts[0].second, 1);
    EXPECT_EQ(bucket_counts[1].second, 2);
    EXPECT_EQ(bucket_counts[2].second, 3);
    EXPECT_EQ(bucket_counts[3].second, 4);
    EXPECT_EQ(bucket_counts[4].second, 5);
}

TEST_F(MetricsTest, ScopedTimer) {
    auto& histogram = TRACESCORE_HISTOGRAM("timer_test");

    {
        ScopedTimer timer(histogram);
    }

    EXPECT_EQ(histogram.Count(), 1);
    EXPECT_GE(histogram.Sum(), 0);
}

TEST_F(MetricsTest, RegistryReturnsSameInstance) {
    auto& counter1 = TRACESCORE_COUNTER("same_counter");
    auto& counter2 = TRACESCORE_COUNTER("same_counter");

    counter1.Increment();
    EXPECT_EQ(counter2.Value(), 1);
    EXPECT_EQ(&counter1, &counter2);
}

TEST_F(MetricsTest, ResetKeepsReferencesValid) {
    auto& counter = TRACESCORE_COUNTER("reset_counter");
    counter.Add(3);

    MetricsRegistry::Instance().Reset();
    EXPECT_EQ(counter.Value(), 0);

    counter.Increment();
    EXPECT_EQ(TRACESCORE_COUNTER("reset_counter").Value(), 1);
}

TEST_F(MetricsTest, ExportText) {
    auto& counter = MetricsRegistry::Instance().GetCounter("my_counter", "A test counter");
    counter.Add(42);

    auto& gauge = MetricsRegistry::Instance().GetGauge("my_gauge", "A test gauge");
    gauge.Set(3.14);

    std::string output = MetricsRegistry::Instance().ExportText();

    EXPECT_NE(output.find("my_counter"), std::string::npos);
    EXPECT_NE(output.find("42"), std::string::npos);
    EXPECT_NE(output.find("my_gauge"), std::string::npos);
}

}  // namespace
}  // namespace tracescore
