#pragma once

/// @file thread_loader.h
/// @brief Resolves thread ids to the traces of the conversation

#include <memory>
#include <string>
#include <vector>

#include <absl/status/statusor.h>

#include "model/entity.h"

namespace tracescore::storage {
class ClickHouseClient;
}

namespace tracescore::consumer {

class ThreadLoader {
public:
    virtual ~ThreadLoader() = default;

    /// @return Traces of the thread, oldest first; empty for an unknown thread
    virtual absl::StatusOr<std::vector<model::ScoredEntity>> LoadTraces(
        const std::string& workspace_id,
        const std::string& project_id,
        const std::string& thread_id) = 0;
};

/// @brief Reads thread traces from the analytics store
class ClickHouseThreadLoader : public ThreadLoader {
public:
    explicit ClickHouseThreadLoader(std::shared_ptr<storage::ClickHouseClient> client);

    absl::StatusOr<std::vector<model::ScoredEntity>> LoadTraces(
        const std::string& workspace_id,
        const std::string& project_id,
        const std::string& thread_id) override;

private:
    std::shared_ptr<storage::ClickHouseClient> client_;
};

}  // namespace tracescore::consumer
