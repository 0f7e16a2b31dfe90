#include "registry/memory_cache.h"

namespace tracescore::registry {

MemoryCache::MemoryCache(std::chrono::milliseconds ttl) : ttl_(ttl) {}

absl::StatusOr<CachePort::Value> MemoryCache::GetOrLoad(const std::string& key,
                                                        const Loader& loader) {
    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            if (it->second.expires_at > std::chrono::steady_clock::now()) {
                hits_.fetch_add(1);
                return Value(it->second.value);
            }
            entries_.erase(it);
        }
        generation = generation_;
    }
    misses_.fetch_add(1);

    return flights_.Do(key, loader, [this, &key, generation](const SingleFlight::Result& result) {
        if (!result.ok() || !result->has_value() || (*result)->empty()) {
            return;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        // An invalidation during the load makes the result stale
        if (generation_ != generation) {
            return;
        }
        entries_[key] = Entry{**result, std::chrono::steady_clock::now() + ttl_};
    });
}

absl::Status MemoryCache::Invalidate(const std::string& key_or_pattern) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++generation_;
    if (key_or_pattern.find('*') == std::string::npos) {
        entries_.erase(key_or_pattern);
        return absl::OkStatus();
    }
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (MatchesPattern(key_or_pattern, it->first)) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
    return absl::OkStatus();
}

size_t MemoryCache::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

}  // namespace tracescore::registry
