#pragma once

/// @file rule_registry.h
/// @brief Cached lookup of enabled rules per (project, kind)

#include <memory>
#include <string>
#include <vector>

#include <absl/status/statusor.h>

#include "model/rule.h"
#include "registry/cache_port.h"
#include "registry/rule_store.h"

namespace tracescore::registry {

inline constexpr const char* kRuleCachePrefix = "automation_rule";

/// @brief "automation_rule:<project_id>:<kind wire name>"
std::string RuleCacheKey(const std::string& project_id, model::EvaluatorKind kind);

/// @brief Read side of the rule registry
///
/// Rules are cached as one serialized JSON array per key and decoded per call,
/// so callers always get a complete snapshot they own. The management layer
/// calls InvalidateProject after mutating a project's rules.
class RuleRegistry {
public:
    RuleRegistry(std::shared_ptr<RuleStore> store, std::shared_ptr<CachePort> cache);

    /// @return kUnavailable (or the store/cache error) when rules cannot be resolved
    absl::StatusOr<std::vector<model::Rule>> FindEnabled(const std::string& project_id,
                                                         model::EvaluatorKind kind);

    absl::Status InvalidateProject(const std::string& project_id);

    absl::Status InvalidateAll();

private:
    std::shared_ptr<RuleStore> store_;
    std::shared_ptr<CachePort> cache_;
};

}  // namespace tracescore::registry
