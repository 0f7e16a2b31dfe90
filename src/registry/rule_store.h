#pragma once

/// @file rule_store.h
/// @brief Where rules are persisted; the registry caches in front of it

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <absl/status/statusor.h>

#include "model/rule.h"

namespace tracescore::registry {

class RuleStore {
public:
    virtual ~RuleStore() = default;

    /// @brief Enabled rules of a kind that apply to a project
    virtual absl::StatusOr<std::vector<model::Rule>> FindEnabled(const std::string& project_id,
                                                                 model::EvaluatorKind kind) = 0;
};

/// @brief True when the rule is enabled, of the kind and owned by the project
bool AppliesTo(const model::Rule& rule, const std::string& project_id, model::EvaluatorKind kind);

/// @brief Rules held in memory, replaced wholesale
class StaticRuleStore : public RuleStore {
public:
    StaticRuleStore() = default;
    explicit StaticRuleStore(std::vector<model::Rule> rules);

    void SetRules(std::vector<model::Rule> rules);

    absl::StatusOr<std::vector<model::Rule>> FindEnabled(const std::string& project_id,
                                                         model::EvaluatorKind kind) override;

private:
    std::mutex mutex_;
    std::vector<model::Rule> rules_;
};

/// @brief Rules read from a JSON array file, reloaded when its mtime changes
///
/// A file that fails to parse on reload keeps the previous rules in service.
class FileRuleStore : public RuleStore {
public:
    explicit FileRuleStore(std::filesystem::path path);

    /// @brief Load now, so a broken file is reported at startup
    absl::Status Load();

    absl::StatusOr<std::vector<model::Rule>> FindEnabled(const std::string& project_id,
                                                         model::EvaluatorKind kind) override;

    size_t RuleCount();

private:
    absl::Status ReloadIfChangedLocked();

    std::filesystem::path path_;
    std::mutex mutex_;
    std::optional<std::filesystem::file_time_type> loaded_mtime_;
    std::vector<model::Rule> rules_;
};

}  // namespace tracescore::registry
