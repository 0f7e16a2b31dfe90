#include "scoring/sampler.h"

#include <random>

namespace tracescore::scoring {

double DefaultRandomSource::NextUniform() {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    thread_local std::uniform_real_distribution<double> distribution(0.0, 1.0);
    return distribution(engine);
}

Sampler::Sampler() : source_(std::make_shared<DefaultRandomSource>()) {}

Sampler::Sampler(std::shared_ptr<RandomSource> source) : source_(std::move(source)) {}

bool Sampler::ShouldSample(double rate) {
    if (rate <= 0.0) {
        return false;
    }
    return source_->NextUniform() < rate;
}

}  // namespace tracescore::scoring
