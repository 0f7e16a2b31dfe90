#pragma once

/// @file template_renderer.h
/// @brief {{variable}} substitution in prompt messages

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "model/entity.h"
#include "model/rule.h"

namespace tracescore::scoring {

class TemplateRenderer {
public:
    /// @brief Replace {{ name }} tokens; whitespace inside the braces is ignored
    /// and unknown names are left as written
    static std::string Render(std::string_view text,
                              const std::unordered_map<std::string, std::string>& values);

    static std::vector<model::PromptMessage> RenderMessages(
        const std::vector<model::PromptMessage>& messages,
        const std::unordered_map<std::string, std::string>& values);

    /// @brief One "role: content" line per message, in the given order
    ///
    /// Callers pass messages already in chronological order.
    static std::string RenderThreadContext(const std::vector<model::ThreadMessage>& messages);
};

}  // namespace tracescore::scoring
