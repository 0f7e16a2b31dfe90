#pragma once

/// @file cache_port.h
/// @brief Get-or-load cache used by the rule registry

#include <functional>
#include <optional>
#include <string>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

namespace tracescore::registry {

/// @brief String cache with read-through loading
///
/// Implementations guarantee:
/// - at most one loader runs per key at a time; concurrent callers share its result
/// - loader errors are returned to every waiting caller and never cached
/// - nullopt or empty values are returned but never cached
class CachePort {
public:
    using Value = std::optional<std::string>;
    using Loader = std::function<absl::StatusOr<Value>()>;

    virtual ~CachePort() = default;

    virtual absl::StatusOr<Value> GetOrLoad(const std::string& key, const Loader& loader) = 0;

    /// @brief Drop one key, or every key matching a glob with '*' wildcards
    virtual absl::Status Invalidate(const std::string& key_or_pattern) = 0;
};

/// @brief Glob match where '*' matches any run of characters
bool MatchesPattern(const std::string& pattern, const std::string& key);

}  // namespace tracescore::registry
