#pragma once

/// @file redis_cache.h
/// @brief CachePort over Redis strings, shared by every engine instance

#include <chrono>
#include <memory>
#include <string>

#include "registry/cache_port.h"
#include "registry/single_flight.h"
#include "storage/redis/client.h"

namespace tracescore::registry {

/// @brief GET / SET EX cache; pattern invalidation walks the keyspace with SCAN
///
/// Single-flight is per process: instances on other hosts may load the same
/// key concurrently, which is harmless because loads are idempotent.
class RedisCache : public CachePort {
public:
    RedisCache(std::shared_ptr<storage::RedisClient> client, std::chrono::seconds ttl);

    absl::StatusOr<Value> GetOrLoad(const std::string& key, const Loader& loader) override;

    absl::Status Invalidate(const std::string& key_or_pattern) override;

private:
    std::shared_ptr<storage::RedisClient> client_;
    std::chrono::seconds ttl_;
    SingleFlight flights_;
};

}  // namespace tracescore::registry
