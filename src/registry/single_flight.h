#pragma once

/// @file single_flight.h
/// @brief Collapses concurrent loads of the same key into one call

#include <exception>
#include <future>
#include <mutex>
#include <string>
#include <unordered_map>

#include "registry/cache_port.h"

namespace tracescore::registry {

class SingleFlight {
public:
    using Result = absl::StatusOr<CachePort::Value>;

    /// @brief Run loader unless a load for key is in flight, then wait for that one
    /// @param on_loaded Called once by the leader with the fresh result, before
    ///        waiters are released
    template <typename OnLoaded>
    Result Do(const std::string& key, const CachePort::Loader& loader, OnLoaded&& on_loaded);

private:
    std::mutex mutex_;
    std::unordered_map<std::string, std::shared_future<Result>> in_flight_;
};

template <typename OnLoaded>
SingleFlight::Result SingleFlight::Do(const std::string& key, const CachePort::Loader& loader,
                                      OnLoaded&& on_loaded) {
    std::promise<Result> promise;
    std::shared_future<Result> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = in_flight_.find(key);
        if (it != in_flight_.end()) {
            pending = it->second;
        } else {
            in_flight_.emplace(key, promise.get_future().share());
        }
    }
    if (pending.valid()) {
        return pending.get();
    }

    Result result = absl::InternalError("cache loader did not run");
    try {
        result = loader();
    } catch (const std::exception& e) {
        result = absl::InternalError(std::string("cache loader threw: ") + e.what());
    }
    on_loaded(result);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        in_flight_.erase(key);
    }
    promise.set_value(result);
    return result;
}

}  // namespace tracescore::registry
