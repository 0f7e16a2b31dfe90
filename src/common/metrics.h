#pragma once

/// @file metrics.h
/// @brief In-process counters, gauges and histograms for self-monitoring

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tracescore {

/// @brief Monotonic counter
class Counter {
public:
    explicit Counter(std::string name, std::string description = "");

    void Increment() { Add(1); }

    /// @param delta Ignored when negative
    void Add(int64_t delta);

    int64_t Value() const { return value_.load(std::memory_order_relaxed); }

    void Reset() { value_.store(0, std::memory_order_relaxed); }

    const std::string& Name() const { return name_; }
    const std::string& Description() const { return description_; }

private:
    std::string name_;
    std::string description_;
    std::atomic<int64_t> value_{0};
};

/// @brief Last-value gauge
class Gauge {
public:
    explicit Gauge(std::string name, std::string description = "");

    void Set(double value) { value_.store(value, std::memory_order_relaxed); }

    double Value() const { return value_.load(std::memory_order_relaxed); }

    const std::string& Name() const { return name_; }
    const std::string& Description() const { return description_; }

private:
    std::string name_;
    std::string description_;
    std::atomic<double> value_{0.0};
};

/// @brief Histogram of millisecond latencies with fixed bucket bounds
class Histogram {
public:
    explicit Histogram(std::string name, std::string description = "");
    Histogram(std::string name, std::vector<double> bounds, std::string description);

    void Observe(double value);

    int64_t Count() const;
    double Sum() const;

    /// @return Cumulative (upper bound, count) pairs, last bound is +Inf
    std::vector<std::pair<double, int64_t>> Buckets() const;

    void Reset();

    const std::string& Name() const { return name_; }
    const std::string& Description() const { return description_; }

private:
    std::string name_;
    std::string description_;
    std::vector<double> bounds_;
    std::vector<int64_t> counts_;  // bounds_.size() + 1 entries
    int64_t count_ = 0;
    double sum_ = 0.0;
    mutable std::mutex mutex_;
};

/// @brief Records elapsed milliseconds into a histogram on destruction
class ScopedTimer {
public:
    explicit ScopedTimer(Histogram& histogram);
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// @brief Process-wide metric registry. Metrics live as long as the process.
class MetricsRegistry {
public:
    static MetricsRegistry& Instance();

    Counter& GetCounter(const std::string& name, const std::string& description = "");
    Gauge& GetGauge(const std::string& name, const std::string& description = "");
    Histogram& GetHistogram(const std::string& name, const std::string& description = "");

    /// @brief Prometheus text exposition of every registered metric
    std::string ExportText() const;

    /// @brief Zero every metric without invalidating references held elsewhere
    void Reset();

private:
    MetricsRegistry() = default;

    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<Counter>> counters_;
    std::map<std::string, std::unique_ptr<Gauge>> gauges_;
    std::map<std::string, std::unique_ptr<Histogram>> histograms_;
};

#define TRACESCORE_COUNTER(name) \
    ::tracescore::MetricsRegistry::Instance().GetCounter(name)

#define TRACESCORE_GAUGE(name) \
    ::tracescore::MetricsRegistry::Instance().GetGauge(name)

#define TRACESCORE_HISTOGRAM(name) \
    ::tracescore::MetricsRegistry::Instance().GetHistogram(name)

}  // namespace tracescore
