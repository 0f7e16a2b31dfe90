#pragma once

/// @file request_builder.h
/// @brief Builds chat requests with a structured-output schema

#include <vector>

#include <nlohmann/json.hpp>

#include "llm/llm_provider.h"
#include "model/rule.h"

namespace tracescore::scoring {

/// @brief How the output schema reaches the model
enum class StructuredOutputStrategy {
    kNativeSchema,          ///< response_format json_schema, decoding constrained by the provider
    kInstructionInjection,  ///< schema spelled out in the prompt
};

inline constexpr const char* kScoringSchemaName = "scoring_schema";

class RequestBuilder {
public:
    /// @brief JSON schema with one {score, reason} object per field
    static nlohmann::json BuildSchema(const std::vector<model::OutputSchemaField>& fields);

    /// @brief Directive appended to the prompt for kInstructionInjection
    static std::string BuildInstruction(const std::vector<model::OutputSchemaField>& fields);

    static llm::ChatRequest Build(const model::LlmJudgeCode& code,
                                  const std::vector<model::PromptMessage>& rendered_messages,
                                  StructuredOutputStrategy strategy);
};

}  // namespace tracescore::scoring
