#pragma once

/// @file provider_registry.h
/// @brief Routes a model name to the provider that serves it

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <absl/status/statusor.h>

#include "llm/llm_provider.h"

namespace tracescore::llm {

class ProviderRegistry {
public:
    /// @brief Serve every model whose name starts with prefix
    void Register(std::string prefix, std::shared_ptr<LlmProvider> provider);

    /// @brief Provider for models no prefix claims
    void SetDefault(std::shared_ptr<LlmProvider> provider);

    /// @brief Longest matching prefix wins, then the default
    /// @return kFailedPrecondition when nothing serves the model
    absl::StatusOr<std::shared_ptr<LlmProvider>> Resolve(const std::string& model) const;

    size_t Size() const;

private:
    struct Route {
        std::string prefix;
        std::shared_ptr<LlmProvider> provider;
    };

    mutable std::mutex mutex_;
    std::vector<Route> routes_;
    std::shared_ptr<LlmProvider> default_;
};

}  // namespace tracescore::llm
