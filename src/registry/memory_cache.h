#pragma once

/// @file memory_cache.h
/// @brief In-process CachePort with TTL expiry

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>

#include "registry/cache_port.h"
#include "registry/single_flight.h"

namespace tracescore::registry {

class MemoryCache : public CachePort {
public:
    explicit MemoryCache(std::chrono::milliseconds ttl = std::chrono::minutes(5));

    absl::StatusOr<Value> GetOrLoad(const std::string& key, const Loader& loader) override;

    absl::Status Invalidate(const std::string& key_or_pattern) override;

    size_t Size() const;

    int64_t Hits() const { return hits_.load(); }
    int64_t Misses() const { return misses_.load(); }

private:
    struct Entry {
        std::string value;
        std::chrono::steady_clock::time_point expires_at;
    };

    std::chrono::milliseconds ttl_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    uint64_t generation_ = 0;  // bumped by Invalidate, guarded by mutex_
    SingleFlight flights_;

    std::atomic<int64_t> hits_{0};
    std::atomic<int64_t> misses_{0};
};

}  // namespace tracescore::registry
