#include "scoring/request_builder.h"

#include <absl/strings/str_cat.h>

namespace tracescore::scoring {

using json = nlohmann::json;

namespace {

const char* JsonSchemaType(model::ScoreType type) {
    switch (type) {
        case model::ScoreType::kInteger:
            return "integer";
        case model::ScoreType::kDouble:
            return "number";
        case model::ScoreType::kBoolean:
            return "boolean";
    }
    return "number";
}

}  // namespace

json RequestBuilder::BuildSchema(const std::vector<model::OutputSchemaField>& fields) {
    json properties = json::object();
    json required = json::array();

    for (const auto& field : fields) {
        json score = {{"type", JsonSchemaType(field.type)}};
        if (!field.description.empty()) {
            score["description"] = field.description;
        }
        properties[field.name] = {
            {"type", "object"},
            {"properties", {{"score", score}, {"reason", {{"type", "string"}}}}},
            {"required", json::array({"score", "reason"})},
            {"additionalProperties", false},
        };
        required.push_back(field.name);
    }

    return {
        {"type", "object"},
        {"properties", properties},
        {"required", required},
        {"additionalProperties", false},
    };
}

std::string RequestBuilder::BuildInstruction(const std::vector<model::OutputSchemaField>& fields) {
    return absl::StrCat(
        "Respond with a single JSON object and nothing else. The object must match this "
        "JSON schema, with one entry per metric holding a \"score\" and a \"reason\":\n",
        BuildSchema(fields).dump(2));
}

llm::ChatRequest RequestBuilder::Build(const model::LlmJudgeCode& code,
                                       const std::vector<model::PromptMessage>& rendered_messages,
                                       StructuredOutputStrategy strategy) {
    llm::ChatRequest request;
    request.model = code.model.name;
    request.temperature = code.model.temperature;
    request.seed = code.model.seed;
    request.custom_parameters = code.model.custom_parameters;

    for (const auto& message : rendered_messages) {
        request.messages.push_back(llm::ChatMessage{message.role, message.content});
    }

    switch (strategy) {
        case StructuredOutputStrategy::kNativeSchema:
            request.response_format = json{
                {"type", "json_schema"},
                {"json_schema",
                 {{"name", kScoringSchemaName}, {"strict", true}, {"schema", BuildSchema(code.schema)}}},
            };
            break;
        case StructuredOutputStrategy::kInstructionInjection: {
            std::string instruction = BuildInstruction(code.schema);
            if (!request.messages.empty() && request.messages.back().role == "user") {
                request.messages.back().content += "\n\n" + instruction;
            } else {
                request.messages.push_back(llm::ChatMessage{"user", instruction});
            }
            break;
        }
    }
    return request;
}

}  // namespace tracescore::scoring
