#pragma once

/// @file variable_resolver.h
/// @brief Resolve rule variables against an entity's JSON trees

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "model/entity.h"
#include "model/rule.h"

namespace tracescore::scoring {

/// @brief Walk a JSON tree by a "$.a.b[0].c" style path
///
/// The leading "$" is optional. A numeric dotted segment indexes into an
/// array, so "messages.0.content" and "messages[0].content" are equivalent.
/// @return The node at the path, or nullopt if any step is missing
std::optional<nlohmann::json> LookupJsonPath(const nlohmann::json& root, std::string_view path);

/// @brief Name of the built-in thread variable holding the conversation
inline constexpr const char* kThreadContextVariable = "context";

/// @brief Turns VariableMappings into template values
class VariableResolver {
public:
    /// @brief Rendered value of every mapping
    ///
    /// Strings are inserted raw, other JSON values serialized compactly. A
    /// path that does not resolve yields the configured path text, so a
    /// missing field never aborts rendering. For threads the "context"
    /// variable is the rendered conversation and input paths resolve against
    /// the message array.
    static std::unordered_map<std::string, std::string> Resolve(
        const std::vector<model::VariableMapping>& variables,
        const model::ScoredEntity& entity);

    /// @brief Like Resolve, but keeps JSON types for metric arguments
    static nlohmann::json ResolveJson(const std::vector<model::VariableMapping>& variables,
                                      const model::ScoredEntity& entity);

    /// @brief The tree a section refers to
    static nlohmann::json SectionTree(model::Section section, const model::ScoredEntity& entity);

    /// @brief The conversation as a [{role, content}] array
    static nlohmann::json ThreadMessagesJson(const model::ScoredEntity& entity);
};

}  // namespace tracescore::scoring
