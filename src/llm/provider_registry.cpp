#include "llm/provider_registry.h"

#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>

#include "common/error.h"

namespace tracescore::llm {

void ProviderRegistry::Register(std::string prefix, std::shared_ptr<LlmProvider> provider) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& route : routes_) {
        if (route.prefix == prefix) {
            route.provider = std::move(provider);
            return;
        }
    }
    routes_.push_back(Route{std::move(prefix), std::move(provider)});
}

void ProviderRegistry::SetDefault(std::shared_ptr<LlmProvider> provider) {
    std::lock_guard<std::mutex> lock(mutex_);
    default_ = std::move(provider);
}

absl::StatusOr<std::shared_ptr<LlmProvider>> ProviderRegistry::Resolve(
    const std::string& model) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Route* best = nullptr;
    for (const auto& route : routes_) {
        if (absl::StartsWith(model, route.prefix) &&
            (best == nullptr || route.prefix.size() > best->prefix.size())) {
            best = &route;
        }
    }
    if (best != nullptr) {
        return best->provider;
    }
    if (default_) {
        return default_;
    }
    return MakeError(ErrorCode::kConfigurationError,
                     absl::StrCat("No LLM provider configured for model '", model, "'"));
}

size_t ProviderRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return routes_.size() + (default_ ? 1 : 0);
}

}  // namespace tracescore::llm
