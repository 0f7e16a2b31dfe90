#include "registry/redis_cache.h"

#include "common/logging.h"

namespace tracescore::registry {

RedisCache::RedisCache(std::shared_ptr<storage::RedisClient> client, std::chrono::seconds ttl)
    : client_(std::move(client)), ttl_(ttl) {}

absl::StatusOr<CachePort::Value> RedisCache::GetOrLoad(const std::string& key,
                                                       const Loader& loader) {
    auto cached = client_->Get(key);
    if (!cached.ok()) {
        return cached.status();
    }
    if (cached->has_value()) {
        return *cached;
    }

    return flights_.Do(key, loader, [this, &key](const SingleFlight::Result& result) {
        if (!result.ok() || !result->has_value() || (*result)->empty()) {
            return;
        }
        auto status = client_->Set(key, **result, ttl_);
        if (!status.ok()) {
            // The loaded value is still returned; only the write-back failed
            TRACESCORE_LOG_WARN("Failed to cache '{}': {}", key, status.ToString());
        }
    });
}

absl::Status RedisCache::Invalidate(const std::string& key_or_pattern) {
    if (key_or_pattern.find('*') == std::string::npos) {
        auto deleted = client_->Delete(key_or_pattern);
        return deleted.ok() ? absl::OkStatus() : deleted.status();
    }

    auto keys = client_->Scan(key_or_pattern);
    if (!keys.ok()) {
        return keys.status();
    }
    for (const auto& key : *keys) {
        auto deleted = client_->Delete(key);
        if (!deleted.ok()) {
            return deleted.status();
        }
    }
    TRACESCORE_LOG_DEBUG("Invalidated {} cache keys matching '{}'", keys->size(), key_or_pattern);
    return absl::OkStatus();
}

}  // namespace tracescore::registry
