#include "consumer/thread_loader.h"

#include "storage/clickhouse/client.h"

namespace tracescore::consumer {

ClickHouseThreadLoader::ClickHouseThreadLoader(std::shared_ptr<storage::ClickHouseClient> client)
    : client_(std::move(client)) {}

absl::StatusOr<std::vector<model::ScoredEntity>> ClickHouseThreadLoader::LoadTraces(
    const std::string& workspace_id,
    const std::string& project_id,
    const std::string& thread_id) {
    return client_->QueryThreadTraces(workspace_id, project_id, thread_id);
}

}  // namespace tracescore::consumer
