#include "scoring/template_renderer.h"

#include <regex>

namespace tracescore::scoring {

namespace {

const std::regex& TokenPattern() {
    static const std::regex pattern(R"(\{\{\s*([^{}\s]+)\s*\}\})");
    return pattern;
}

}  // namespace

std::string TemplateRenderer::Render(std::string_view text,
                                     const std::unordered_map<std::string, std::string>& values) {
    std::string source(text);
    std::string rendered;
    rendered.reserve(source.size());

    auto begin = std::sregex_iterator(source.begin(), source.end(), TokenPattern());
    auto end = std::sregex_iterator();

    size_t last = 0;
    for (auto it = begin; it != end; ++it) {
        const std::smatch& match = *it;
        rendered.append(source, last, static_cast<size_t>(match.position(0)) - last);

        auto value = values.find(match[1].str());
        if (value != values.end()) {
            rendered += value->second;
        } else {
            rendered += match.str(0);
        }
        last = static_cast<size_t>(match.position(0) + match.length(0));
    }
    rendered.append(source, last, std::string::npos);
    return rendered;
}

std::vector<model::PromptMessage> TemplateRenderer::RenderMessages(
    const std::vector<model::PromptMessage>& messages,
    const std::unordered_map<std::string, std::string>& values) {
    std::vector<model::PromptMessage> rendered;
    rendered.reserve(messages.size());
    for (const auto& message : messages) {
        rendered.push_back(model::PromptMessage{message.role, Render(message.content, values)});
    }
    return rendered;
}

std::string TemplateRenderer::RenderThreadContext(const std::vector<model::ThreadMessage>& messages) {
    std::string context;
    for (const auto& message : messages) {
        if (!context.empty()) {
            context += "\n";
        }
        context += message.role;
        context += ": ";
        context += message.content;
    }
    return context;
}

}  // namespace tracescore::scoring
