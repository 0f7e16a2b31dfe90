#include "metrics.h"

#include <algorithm>
#include <limits>
#include <sstream>

namespace tracescore {

namespace {

// Milliseconds, from a fast Redis round trip to a slow LLM call
const std::vector<double> kDefaultBoundsMs = {
    1, 5, 10, 25, 50, 100, 250, 500, 1000, 2500, 5000, 10000, 30000, 60000
};

}  // namespace

Counter::Counter(std::string name, std::string description)
    : name_(std::move(name)), description_(std::move(description)) {}

void Counter::Add(int64_t delta) {
    if (delta > 0) {
        value_.fetch_add(delta, std::memory_order_relaxed);
    }
}

Gauge::Gauge(std::string name, std::string description)
    : name_(std::move(name)), description_(std::move(description)) {}

Histogram::Histogram(std::string name, std::string description)
    : Histogram(std::move(name), kDefaultBoundsMs, std::move(description)) {}

Histogram::Histogram(std::string name, std::vector<double> bounds, std::string description)
    : name_(std::move(name)),
      description_(std::move(description)),
      bounds_(std::move(bounds)) {
    std::sort(bounds_.begin(), bounds_.end());
    counts_.assign(bounds_.size() + 1, 0);
}

void Histogram::Observe(double value) {
    auto it = std::lower_bound(bounds_.begin(), bounds_.end(), value);
    size_t index = static_cast<size_t>(std::distance(bounds_.begin(), it));

    std::lock_guard<std::mutex> lock(mutex_);
    ++counts_[index];
    ++count_;
    sum_ += value;
}

int64_t Histogram::Count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_;
}

double Histogram::Sum() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sum_;
}

std::vector<std::pair<double, int64_t>> Histogram::Buckets() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::pair<double, int64_t>> result;
    result.reserve(counts_.size());

    int64_t cumulative = 0;
    for (size_t i = 0; i < bounds_.size(); ++i) {
        cumulative += counts_[i];
        result.emplace_back(bounds_[i], cumulative);
    }
    cumulative += counts_.back();
    result.emplace_back(std::numeric_limits<double>::infinity(), cumulative);
    return result;
}

void Histogram::Reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fill(counts_.begin(), counts_.end(), 0);
    count_ = 0;
    sum_ = 0.0;
}

ScopedTimer::ScopedTimer(Histogram& histogram)
    : histogram_(histogram), start_(std::chrono::steady_clock::now()) {}

ScopedTimer::~ScopedTimer() {
    std::chrono::duration<double, std::milli> elapsed =
        std::chrono::steady_clock::now() - start_;
    histogram_.Observe(elapsed.count());
}

MetricsRegistry& MetricsRegistry::Instance() {
    static MetricsRegistry instance;
    return instance;
}

Counter& MetricsRegistry::GetCounter(const std::string& name, const std::string& description) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = counters_[name];
    if (!slot) {
        slot = std::make_unique<Counter>(name, description);
    }
    return *slot;
}

Gauge& MetricsRegistry::GetGauge(const std::string& name, const std::string& description) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = gauges_[name];
    if (!slot) {
        slot = std::make_unique<Gauge>(name, description);
    }
    return *slot;
}

Histogram& MetricsRegistry::GetHistogram(const std::string& name, const std::string& description) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = histograms_[name];
    if (!slot) {
        slot = std::make_unique<Histogram>(name, description);
    }
    return *slot;
}

std::string MetricsRegistry::ExportText() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream out;

    for (const auto& [name, counter] : counters_) {
        out << "# HELP " << name << " " << counter->Description() << "\n"
            << "# TYPE " << name << " counter\n"
            << name << " " << counter->Value() << "\n";
    }
    for (const auto& [name, gauge] : gauges_) {
        out << "# HELP " << name << " " << gauge->Description() << "\n"
            << "# TYPE " << name << " gauge\n"
            << name << " " << gauge->Value() << "\n";
    }
    for (const auto& [name, histogram] : histograms_) {
        out << "# HELP " << name << " " << histogram->Description() << "\n"
            << "# TYPE " << name << " histogram\n";
        for (const auto& [bound, count] : histogram->Buckets()) {
            out << name << "_bucket{le=\"";
            if (bound == std::numeric_limits<double>::infinity()) {
                out << "+Inf";
            } else {
                out << bound;
            }
            out << "\"} " << count << "\n";
        }
        out << name << "_sum " << histogram->Sum() << "\n"
            << name << "_count " << histogram->Count() << "\n";
    }
    return out.str();
}

void MetricsRegistry::Reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [name, counter] : counters_) {
        counter->Reset();
    }
    for (auto& [name, gauge] : gauges_) {
        gauge->Set(0.0);
    }
    for (auto& [name, histogram] : histograms_) {
        histogram->Reset();
    }
}

}  // namespace tracescore
