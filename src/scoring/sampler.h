#pragma once

/// @file sampler.h
/// @brief Per-(entity, rule) sampling decisions

#include <functional>
#include <memory>

namespace tracescore::scoring {

/// @brief Source of uniform draws in [0, 1)
class RandomSource {
public:
    virtual ~RandomSource() = default;
    virtual double NextUniform() = 0;
};

/// @brief Thread-local mt19937_64 seeded from std::random_device
class DefaultRandomSource : public RandomSource {
public:
    double NextUniform() override;
};

/// @brief Draws from a caller-supplied function, for tests
class FunctionRandomSource : public RandomSource {
public:
    explicit FunctionRandomSource(std::function<double()> draw) : draw_(std::move(draw)) {}

    double NextUniform() override { return draw_(); }

private:
    std::function<double()> draw_;
};

/// @brief Decides whether one (entity, rule) pair is evaluated
///
/// Every call is an independent draw; nothing is seeded per entity or rule,
/// so decisions are not reproducible across runs or redeliveries.
class Sampler {
public:
    Sampler();
    explicit Sampler(std::shared_ptr<RandomSource> source);

    /// @return true when a fresh draw falls below rate
    bool ShouldSample(double rate);

private:
    std::shared_ptr<RandomSource> source_;
};

}  // namespace tracescore::scoring
