#include "scoring/variable_resolver.h"

#include <cctype>
#include <cstdint>

#include <absl/strings/numbers.h>

#include "model/entity.h"
#include "scoring/template_renderer.h"

namespace tracescore::scoring {

using json = nlohmann::json;

namespace {

bool IsIndex(std::string_view segment) {
    if (segment.empty()) {
        return false;
    }
    for (char c : segment) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

// Splits "a.b[0][\"c d\"].e" into a, b, 0, c d, e
bool SplitPath(std::string_view path, std::vector<std::string>& segments) {
    if (!path.empty() && path.front() == '$') {
        path.remove_prefix(1);
    }
    std::string current;
    size_t i = 0;
    while (i < path.size()) {
        char c = path[i];
        if (c == '.') {
            if (!current.empty()) {
                segments.push_back(std::move(current));
                current.clear();
            }
            ++i;
        } else if (c == '[') {
            if (!current.empty()) {
                segments.push_back(std::move(current));
                current.clear();
            }
            size_t close = path.find(']', i);
            if (close == std::string_view::npos) {
                return false;
            }
            std::string_view inner = path.substr(i + 1, close - i - 1);
            if (inner.size() >= 2 && (inner.front() == '"' || inner.front() == '\'') &&
                inner.back() == inner.front()) {
                inner = inner.substr(1, inner.size() - 2);
            }
            segments.emplace_back(inner);
            i = close + 1;
        } else {
            current.push_back(c);
            ++i;
        }
    }
    if (!current.empty()) {
        segments.push_back(std::move(current));
    }
    return true;
}

}  // namespace

std::optional<json> LookupJsonPath(const json& root, std::string_view path) {
    std::vector<std::string> segments;
    if (!SplitPath(path, segments)) {
        return std::nullopt;
    }

    const json* node = &root;
    for (const auto& segment : segments) {
        if (node->is_object()) {
            auto it = node->find(segment);
            if (it == node->end()) {
                return std::nullopt;
            }
            node = &*it;
        } else if (node->is_array() && IsIndex(segment)) {
            // An index too large for uint64_t cannot be in range either
            uint64_t index = 0;
            if (!absl::SimpleAtoi(segment, &index) || index >= node->size()) {
                return std::nullopt;
            }
            node = &(*node)[index];
        } else {
            return std::nullopt;
        }
    }
    return *node;
}

json VariableResolver::ThreadMessagesJson(const model::ScoredEntity& entity) {
    json messages = json::array();
    for (const auto& message : entity.messages) {
        messages.push_back({{"role", message.role}, {"content", message.content}});
    }
    return messages;
}

json VariableResolver::SectionTree(model::Section section, const model::ScoredEntity& entity) {
    if (entity.type == model::EntityType::kThread) {
        // Threads expose the conversation as their only tree
        return ThreadMessagesJson(entity);
    }
    switch (section) {
        case model::Section::kInput:
            return entity.input;
        case model::Section::kOutput:
            return entity.output;
        case model::Section::kMetadata:
            return entity.metadata;
    }
    return json::object();
}

std::unordered_map<std::string, std::string> VariableResolver::Resolve(
    const std::vector<model::VariableMapping>& variables,
    const model::ScoredEntity& entity) {
    std::unordered_map<std::string, std::string> values;

    if (entity.type == model::EntityType::kThread) {
        values[kThreadContextVariable] = TemplateRenderer::RenderThreadContext(entity.messages);
    }

    for (const auto& mapping : variables) {
        if (!mapping.section) {
            values[mapping.name] = mapping.configured;
            continue;
        }
        auto found = LookupJsonPath(SectionTree(*mapping.section, entity), mapping.json_path);
        values[mapping.name] = found ? model::JsonToText(*found) : mapping.configured;
    }
    return values;
}

json VariableResolver::ResolveJson(const std::vector<model::VariableMapping>& variables,
                                   const model::ScoredEntity& entity) {
    json values = json::object();
    for (const auto& mapping : variables) {
        if (!mapping.section) {
            values[mapping.name] = mapping.configured;
            continue;
        }
        auto found = LookupJsonPath(SectionTree(*mapping.section, entity), mapping.json_path);
        values[mapping.name] = found ? *found : json(mapping.configured);
    }
    return values;
}

}  // namespace tracescore::scoring
