#include "registry/rule_store.h"

#include <algorithm>
#include <fstream>
#include <sstream>

#include <absl/strings/str_cat.h>
#include <nlohmann/json.hpp>

#include "common/logging.h"

namespace tracescore::registry {

namespace {

std::vector<model::Rule> Select(const std::vector<model::Rule>& rules,
                                const std::string& project_id,
                                model::EvaluatorKind kind) {
    std::vector<model::Rule> selected;
    for (const auto& rule : rules) {
        if (AppliesTo(rule, project_id, kind)) {
            selected.push_back(rule);
        }
    }
    return selected;
}

}  // namespace

bool AppliesTo(const model::Rule& rule, const std::string& project_id, model::EvaluatorKind kind) {
    return rule.enabled && rule.kind == kind &&
           std::find(rule.project_ids.begin(), rule.project_ids.end(), project_id) !=
               rule.project_ids.end();
}

// =============================================================================
// StaticRuleStore
// =============================================================================

StaticRuleStore::StaticRuleStore(std::vector<model::Rule> rules) : rules_(std::move(rules)) {}

void StaticRuleStore::SetRules(std::vector<model::Rule> rules) {
    std::lock_guard<std::mutex> lock(mutex_);
    rules_ = std::move(rules);
}

absl::StatusOr<std::vector<model::Rule>> StaticRuleStore::FindEnabled(const std::string& project_id,
                                                                      model::EvaluatorKind kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    return Select(rules_, project_id, kind);
}

// =============================================================================
// FileRuleStore
// =============================================================================

FileRuleStore::FileRuleStore(std::filesystem::path path) : path_(std::move(path)) {}

absl::Status FileRuleStore::Load() {
    std::lock_guard<std::mutex> lock(mutex_);
    return ReloadIfChangedLocked();
}

absl::StatusOr<std::vector<model::Rule>> FileRuleStore::FindEnabled(const std::string& project_id,
                                                                    model::EvaluatorKind kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto status = ReloadIfChangedLocked();
    if (!status.ok()) {
        if (!loaded_mtime_) {
            return status;
        }
        TRACESCORE_LOG_ERROR("Keeping {} previously loaded rules: {}", rules_.size(),
                             status.ToString());
    }
    return Select(rules_, project_id, kind);
}

size_t FileRuleStore::RuleCount() {
    std::lock_guard<std::mutex> lock(mutex_);
    return rules_.size();
}

absl::Status FileRuleStore::ReloadIfChangedLocked() {
    std::error_code ec;
    auto mtime = std::filesystem::last_write_time(path_, ec);
    if (ec) {
        return absl::NotFoundError(
            absl::StrCat("Rules file ", path_.string(), " is not readable: ", ec.message()));
    }
    if (loaded_mtime_ && *loaded_mtime_ == mtime) {
        return absl::OkStatus();
    }

    std::ifstream file(path_);
    if (!file) {
        return absl::NotFoundError(absl::StrCat("Cannot open rules file ", path_.string()));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    auto document = nlohmann::json::parse(buffer.str(), nullptr, /*allow_exceptions=*/false);
    if (document.is_discarded()) {
        return absl::InvalidArgumentError(
            absl::StrCat("Rules file ", path_.string(), " is not valid JSON"));
    }
    // Either a bare array or {"rules": [...]}
    if (document.is_object() && document.contains("rules")) {
        document = document["rules"];
    }

    auto rules = model::ParseRules(document);
    if (!rules.ok()) {
        return rules.status();
    }

    rules_ = std::move(*rules);
    loaded_mtime_ = mtime;
    TRACESCORE_LOG_INFO("Loaded {} rules from {}", rules_.size(), path_.string());
    return absl::OkStatus();
}

}  // namespace tracescore::registry
