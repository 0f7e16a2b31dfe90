#include "registry/rule_registry.h"

#include <absl/strings/str_cat.h>
#include <nlohmann/json.hpp>

#include "common/logging.h"

namespace tracescore::registry {

std::string RuleCacheKey(const std::string& project_id, model::EvaluatorKind kind) {
    return absl::StrCat(kRuleCachePrefix, ":", project_id, ":", std::string(model::ToString(kind)));
}

RuleRegistry::RuleRegistry(std::shared_ptr<RuleStore> store, std::shared_ptr<CachePort> cache)
    : store_(std::move(store)), cache_(std::move(cache)) {}

absl::StatusOr<std::vector<model::Rule>> RuleRegistry::FindEnabled(const std::string& project_id,
                                                                   model::EvaluatorKind kind) {
    auto cached = cache_->GetOrLoad(
        RuleCacheKey(project_id, kind), [this, &project_id, kind]() -> absl::StatusOr<CachePort::Value> {
            auto rules = store_->FindEnabled(project_id, kind);
            if (!rules.ok()) {
                return rules.status();
            }
            if (rules->empty()) {
                return CachePort::Value();
            }
            return CachePort::Value(model::RulesToJson(*rules).dump());
        });
    if (!cached.ok()) {
        return cached.status();
    }
    if (!cached->has_value()) {
        return std::vector<model::Rule>{};
    }

    auto document = nlohmann::json::parse(**cached, nullptr, /*allow_exceptions=*/false);
    if (document.is_discarded()) {
        TRACESCORE_LOG_ERROR("Cached rules for project '{}' are corrupt, dropping them", project_id);
        auto status = cache_->Invalidate(RuleCacheKey(project_id, kind));
        if (!status.ok()) {
            return status;
        }
        return absl::InternalError("cached rules are not valid JSON");
    }
    return model::ParseRules(document);
}

absl::Status RuleRegistry::InvalidateProject(const std::string& project_id) {
    return cache_->Invalidate(absl::StrCat(kRuleCachePrefix, ":", project_id, ":*"));
}

absl::Status RuleRegistry::InvalidateAll() {
    return cache_->Invalidate(absl::StrCat(kRuleCachePrefix, ":*"));
}

}  // namespace tracescore::registry
