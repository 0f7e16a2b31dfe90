#pragma once

/// @file stream_message.h
/// @brief Raw stream records and the decoded scoring envelope

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "model/entity.h"

namespace tracescore::model {

/// @brief One record of a stream as delivered to a consumer group
struct StreamEntry {
    std::string id;  ///< e.g. "1700000000000-0"
    std::unordered_map<std::string, std::string> fields;
};

/// @brief Decoded "entity created" event
///
/// Trace and span streams carry the entities themselves; thread streams carry
/// thread ids that are resolved to conversations before scoring.
struct StreamMessage {
    std::string workspace_id;
    std::string user_name;
    std::string project_id;
    EntityType entity_type = EntityType::kTrace;
    std::vector<ScoredEntity> entities;
    std::vector<std::string> thread_ids;
    std::optional<std::string> rule_id;  ///< Route to this rule only
};

}  // namespace tracescore::model
