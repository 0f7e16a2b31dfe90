#pragma once

/// @file envelope_codec.h
/// @brief Decoding of "entity created" stream records

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <absl/status/statusor.h>

#include "model/stream_message.h"

namespace tracescore::consumer {

/// @brief Field of a stream record that holds the encoded envelope
inline constexpr const char* kPayloadField = "payload";

class EnvelopeCodec {
public:
    virtual ~EnvelopeCodec() = default;

    /// @return kDataLoss when the record can never be decoded
    virtual absl::StatusOr<model::StreamMessage> Decode(const model::StreamEntry& entry,
                                                        model::EntityType type) const = 0;

    /// @brief Record fields for a message, used by producers and tests
    virtual std::vector<std::pair<std::string, std::string>> Encode(
        const model::StreamMessage& message) const = 0;

    virtual std::string Name() const = 0;
};

/// @brief Envelope as a JSON object in the payload field
///
/// {"workspaceId", "userName", "projectId", "ruleId"?, and one of
/// "traces"/"spans" (object or array of entities) or "threadIds"}.
/// Entities without a project_id take the envelope's projectId; an
/// envelope without projectId takes the first entity's.
class JsonEnvelopeCodec : public EnvelopeCodec {
public:
    absl::StatusOr<model::StreamMessage> Decode(const model::StreamEntry& entry,
                                                model::EntityType type) const override;

    std::vector<std::pair<std::string, std::string>> Encode(
        const model::StreamMessage& message) const override;

    std::string Name() const override { return "json"; }
};

/// @return kFailedPrecondition for an unknown codec name
absl::StatusOr<std::unique_ptr<EnvelopeCodec>> MakeEnvelopeCodec(const std::string& name);

}  // namespace tracescore::consumer
