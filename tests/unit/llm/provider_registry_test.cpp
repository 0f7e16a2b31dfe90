/// @file provider_registry_test.cpp
/// @brief Tests for model to provider routing

#include <gtest/gtest.h>

#include "llm/provider_registry.h"

namespace tracescore::llm {
namespace {

class NamedProvider : public LlmProvider {
public:
    explicit NamedProvider(std::string name) : name_(std::move(name)) {}

    absl::StatusOr<ChatResponse> Chat(const ChatRequest&, std::chrono::milliseconds) override {
        return absl::UnimplementedError("not used");
    }
    bool SupportsStructuredOutput(const std::string&) const override { return false; }
    std::string Name() const override { return name_; }

private:
    std::string name_;
};

TEST(ProviderRegistryTest, EmptyRegistryIsAConfigurationError) {
    ProviderRegistry registry;
    auto provider = registry.Resolve("gpt-4o");
    EXPECT_EQ(provider.status().code(), absl::StatusCode::kFailedPrecondition);
    EXPECT_EQ(registry.Size(), 0u);
}

TEST(ProviderRegistryTest, LongestPrefixWinsThenDefault) {
    ProviderRegistry registry;
    registry.Register("claude", std::make_shared<NamedProvider>("anthropic"));
    registry.Register("gpt", std::make_shared<NamedProvider>("openai"));
    registry.Register("gpt-4o-mini", std::make_shared<NamedProvider>("mini"));
    registry.SetDefault(std::make_shared<NamedProvider>("fallback"));

    EXPECT_EQ((*registry.Resolve("gpt-4o"))->Name(), "openai");
    EXPECT_EQ((*registry.Resolve("gpt-4o-mini-2024"))->Name(), "mini");
    EXPECT_EQ((*registry.Resolve("claude-3-5-sonnet"))->Name(), "anthropic");
    EXPECT_EQ((*registry.Resolve("llama3"))->Name(), "fallback");
    EXPECT_EQ(registry.Size(), 4u);
}

TEST(ProviderRegistryTest, RegisteringSamePrefixReplaces) {
    ProviderRegistry registry;
    registry.Register("gpt", std::make_shared<NamedProvider>("old"));
    registry.Register("gpt", std::make_shared<NamedProvider>("new"));

    EXPECT_EQ((*registry.Resolve("gpt-4"))->Name(), "new");
    EXPECT_EQ(registry.Size(), 1u);
}

}  // namespace
}  // namespace tracescore::llm
