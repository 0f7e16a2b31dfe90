#include "consumer/envelope_codec.h"

#include <absl/strings/str_cat.h>
#include <nlohmann/json.hpp>

#include "common/error.h"

namespace tracescore::consumer {

using json = nlohmann::json;

namespace {

const char* EntityArrayKey(model::EntityType type) {
    switch (type) {
        case model::EntityType::kTrace:
            return "traces";
        case model::EntityType::kSpan:
            return "spans";
        case model::EntityType::kThread:
            return "threadIds";
    }
    return "";
}

absl::Status DecodeFailure(const model::StreamEntry& entry, const std::string& reason) {
    return MakeError(ErrorCode::kDeserializationError,
                     absl::StrCat("Cannot decode stream entry ", entry.id, ": ", reason));
}

}  // namespace

absl::StatusOr<model::StreamMessage> JsonEnvelopeCodec::Decode(const model::StreamEntry& entry,
                                                               model::EntityType type) const {
    auto field = entry.fields.find(kPayloadField);
    if (field == entry.fields.end()) {
        return DecodeFailure(entry, absl::StrCat("missing '", kPayloadField, "' field"));
    }
    auto envelope = json::parse(field->second, nullptr, /*allow_exceptions=*/false);
    if (envelope.is_discarded() || !envelope.is_object()) {
        return DecodeFailure(entry, "payload is not a JSON object");
    }

    model::StreamMessage message;
    message.entity_type = type;
    try {
        message.workspace_id = envelope.value("workspaceId", "");
        message.user_name = envelope.value("userName", "");
        message.project_id = envelope.value("projectId", "");
        if (envelope.contains("ruleId") && envelope["ruleId"].is_string()) {
            message.rule_id = envelope["ruleId"].get<std::string>();
        }
    } catch (const json::exception& e) {
        return DecodeFailure(entry, e.what());
    }
    if (message.workspace_id.empty()) {
        return DecodeFailure(entry, "missing workspaceId");
    }

    const char* key = EntityArrayKey(type);
    auto payload = envelope.find(key);
    if (payload == envelope.end()) {
        return DecodeFailure(entry, absl::StrCat("missing '", key, "'"));
    }

    if (type == model::EntityType::kThread) {
        if (!payload->is_array()) {
            return DecodeFailure(entry, "threadIds must be an array");
        }
        for (const auto& id : *payload) {
            if (!id.is_string() || id.get<std::string>().empty()) {
                return DecodeFailure(entry, "thread ids must be non-empty strings");
            }
            message.thread_ids.push_back(id.get<std::string>());
        }
        if (message.project_id.empty()) {
            return DecodeFailure(entry, "thread envelopes need a projectId");
        }
        return message;
    }

    std::vector<json> items;
    if (payload->is_array()) {
        items.assign(payload->begin(), payload->end());
    } else {
        items.push_back(*payload);
    }
    for (const auto& item : items) {
        auto entity = model::DecodeEntity(type, item);
        if (!entity.ok()) {
            return DecodeFailure(entry, std::string(entity.status().message()));
        }
        if (entity->project_id.empty()) {
            entity->project_id = message.project_id;
        }
        message.entities.push_back(std::move(*entity));
    }
    if (message.project_id.empty() && !message.entities.empty()) {
        message.project_id = message.entities.front().project_id;
    }
    return message;
}

std::vector<std::pair<std::string, std::string>> JsonEnvelopeCodec::Encode(
    const model::StreamMessage& message) const {
    json envelope = {
        {"workspaceId", message.workspace_id},
        {"userName", message.user_name},
        {"projectId", message.project_id},
    };
    if (message.rule_id) {
        envelope["ruleId"] = *message.rule_id;
    }
    if (message.entity_type == model::EntityType::kThread) {
        envelope[EntityArrayKey(message.entity_type)] = message.thread_ids;
    } else {
        json entities = json::array();
        for (const auto& entity : message.entities) {
            entities.push_back(model::EntityToJson(entity));
        }
        envelope[EntityArrayKey(message.entity_type)] = std::move(entities);
    }
    return {{kPayloadField, envelope.dump()}};
}

absl::StatusOr<std::unique_ptr<EnvelopeCodec>> MakeEnvelopeCodec(const std::string& name) {
    if (name == "json") {
        return std::unique_ptr<EnvelopeCodec>(std::make_unique<JsonEnvelopeCodec>());
    }
    return MakeError(ErrorCode::kConfigurationError,
                     absl::StrCat("Unknown stream codec '", name, "'"));
}

}  // namespace tracescore::consumer
