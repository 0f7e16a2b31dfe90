#include "model/rule.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <set>

#include <absl/strings/str_cat.h>

#include "common/logging.h"

namespace tracescore::model {

using json = nlohmann::json;

namespace {

constexpr std::pair<FilterOperator, std::string_view> kOperatorNames[] = {
    {FilterOperator::kEqual, "="},
    {FilterOperator::kNotEqual, "!="},
    {FilterOperator::kContains, "contains"},
    {FilterOperator::kNotContains, "not_contains"},
    {FilterOperator::kStartsWith, "starts_with"},
    {FilterOperator::kEndsWith, "ends_with"},
    {FilterOperator::kGreaterThan, ">"},
    {FilterOperator::kGreaterThanEqual, ">="},
    {FilterOperator::kLessThan, "<"},
    {FilterOperator::kLessThanEqual, "<="},
    {FilterOperator::kIsEmpty, "is_empty"},
    {FilterOperator::kIsNotEmpty, "is_not_empty"},
};

std::string Lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::optional<std::string> OptionalString(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return std::nullopt;
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    return it->dump();
}

std::vector<VariableMapping> ParseMappings(const json& object) {
    std::vector<VariableMapping> mappings;
    if (!object.is_object()) {
        return mappings;
    }
    for (const auto& [name, value] : object.items()) {
        std::string configured = value.is_string() ? value.get<std::string>() : value.dump();
        mappings.push_back(ParseVariableMapping(name, std::move(configured)));
    }
    return mappings;
}

json MappingsToJson(const std::vector<VariableMapping>& mappings) {
    json object = json::object();
    for (const auto& mapping : mappings) {
        object[mapping.name] = mapping.configured;
    }
    return object;
}

absl::StatusOr<Filter> ParseFilter(const json& object) {
    if (!object.is_object()) {
        return absl::InvalidArgumentError("filter must be an object");
    }
    Filter filter;
    filter.field = Lower(object.value("field", ""));
    std::string op_text = Lower(object.value("operator", ""));
    auto op = ParseFilterOperator(op_text);
    if (!op) {
        return absl::InvalidArgumentError(absl::StrCat("unknown filter operator '", op_text, "'"));
    }
    filter.op = *op;
    filter.key = OptionalString(object, "key");
    filter.value = OptionalString(object, "value");
    if (filter.key && filter.key->empty()) {
        filter.key.reset();
    }
    return filter;
}

absl::StatusOr<LlmJudgeCode> ParseLlmJudgeCode(const json& object) {
    LlmJudgeCode code;

    const json& model = object.at("model");
    code.model.name = model.at("name").get<std::string>();
    if (model.contains("temperature") && model["temperature"].is_number()) {
        code.model.temperature = model["temperature"].get<double>();
    }
    if (model.contains("seed") && model["seed"].is_number_integer()) {
        code.model.seed = model["seed"].get<int64_t>();
    }
    if (model.contains("custom_parameters") && model["custom_parameters"].is_object()) {
        code.model.custom_parameters = model["custom_parameters"];
    }

    for (const auto& message : object.at("messages")) {
        code.messages.push_back(PromptMessage{Lower(message.at("role").get<std::string>()),
                                              message.at("content").get<std::string>()});
    }

    code.variables = ParseMappings(object.value("variables", json::object()));

    for (const auto& field : object.value("schema", json::array())) {
        std::string type_text = field.at("type").get<std::string>();
        auto type = ParseScoreType(type_text);
        if (!type) {
            return absl::InvalidArgumentError(
                absl::StrCat("unknown schema type '", type_text, "'"));
        }
        code.schema.push_back(OutputSchemaField{field.at("name").get<std::string>(), *type,
                                                field.value("description", "")});
    }
    return code;
}

PythonMetricCode ParsePythonMetricCode(const json& object) {
    PythonMetricCode code;
    code.metric = object.at("metric").get<std::string>();
    code.arguments = ParseMappings(object.value("arguments", json::object()));
    return code;
}

}  // namespace

std::string_view ToString(FilterOperator op) {
    for (const auto& [candidate, name] : kOperatorNames) {
        if (candidate == op) {
            return name;
        }
    }
    return "?";
}

std::optional<FilterOperator> ParseFilterOperator(std::string_view text) {
    for (const auto& [op, name] : kOperatorNames) {
        if (name == text) {
            return op;
        }
    }
    return std::nullopt;
}

bool IsUnary(FilterOperator op) {
    return op == FilterOperator::kIsEmpty || op == FilterOperator::kIsNotEmpty;
}

VariableMapping ParseVariableMapping(std::string name, std::string configured) {
    VariableMapping mapping;
    mapping.name = std::move(name);
    mapping.configured = std::move(configured);

    constexpr std::pair<std::string_view, Section> kPrefixes[] = {
        {"input", Section::kInput},
        {"output", Section::kOutput},
        {"metadata", Section::kMetadata},
    };
    for (const auto& [prefix, section] : kPrefixes) {
        std::string_view text = mapping.configured;
        if (text.substr(0, prefix.size()) != prefix) {
            continue;
        }
        std::string_view rest = text.substr(prefix.size());
        if (rest.empty()) {
            mapping.section = section;
            mapping.json_path = "$";
        } else if (rest.front() == '.' || rest.front() == '[') {
            mapping.section = section;
            mapping.json_path = "$" + std::string(rest);
        }
        break;
    }
    return mapping;
}

std::string_view ToString(ScoreType type) {
    switch (type) {
        case ScoreType::kInteger:
            return "INTEGER";
        case ScoreType::kDouble:
            return "DOUBLE";
        case ScoreType::kBoolean:
            return "BOOLEAN";
    }
    return "DOUBLE";
}

std::optional<ScoreType> ParseScoreType(std::string_view text) {
    std::string upper(text);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "INTEGER") return ScoreType::kInteger;
    if (upper == "DOUBLE") return ScoreType::kDouble;
    if (upper == "BOOLEAN") return ScoreType::kBoolean;
    return std::nullopt;
}

absl::Status ValidateRule(Rule& rule) {
    if (rule.id.empty()) {
        return absl::InvalidArgumentError("rule id is required");
    }

    if (std::isnan(rule.sampling_rate) || rule.sampling_rate < 0.0 || rule.sampling_rate > 1.0) {
        double clamped = std::isnan(rule.sampling_rate)
                             ? 0.0
                             : std::clamp(rule.sampling_rate, 0.0, 1.0);
        TRACESCORE_LOG_WARN("Rule '{}' sampling rate {} outside [0, 1], using {}",
                            rule.id, rule.sampling_rate, clamped);
        rule.sampling_rate = clamped;
    }

    for (const auto& filter : rule.filters) {
        if (!IsUnary(filter.op) && !filter.value) {
            return absl::InvalidArgumentError(absl::StrCat(
                "rule '", rule.id, "': filter on '", filter.field, "' with operator '",
                std::string(ToString(filter.op)), "' requires a value"));
        }
    }

    if (IsLlmJudge(rule.kind)) {
        const auto* code = std::get_if<LlmJudgeCode>(&rule.code);
        if (code == nullptr) {
            return absl::InvalidArgumentError(absl::StrCat(
                "rule '", rule.id, "' of kind ", std::string(ToString(rule.kind)), " needs an LLM judge payload"));
        }
        if (code->model.name.empty()) {
            return absl::InvalidArgumentError(absl::StrCat("rule '", rule.id, "': model name is required"));
        }
        if (code->messages.empty()) {
            return absl::InvalidArgumentError(absl::StrCat("rule '", rule.id, "': messages are required"));
        }
        if (code->schema.empty()) {
            return absl::InvalidArgumentError(absl::StrCat("rule '", rule.id, "': schema is required"));
        }
        std::set<std::string> names;
        for (const auto& field : code->schema) {
            if (field.name.empty() || !names.insert(field.name).second) {
                return absl::InvalidArgumentError(absl::StrCat(
                    "rule '", rule.id, "': schema field names must be unique and non-empty"));
            }
        }
    } else {
        const auto* code = std::get_if<PythonMetricCode>(&rule.code);
        if (code == nullptr) {
            return absl::InvalidArgumentError(absl::StrCat(
                "rule '", rule.id, "' of kind ", std::string(ToString(rule.kind)), " needs a python metric payload"));
        }
        if (code->metric.empty()) {
            return absl::InvalidArgumentError(absl::StrCat("rule '", rule.id, "': metric code is required"));
        }
    }
    return absl::OkStatus();
}

absl::StatusOr<Rule> ParseRule(const json& object) {
    if (!object.is_object()) {
        return absl::InvalidArgumentError("rule must be a JSON object");
    }

    try {
        Rule rule;
        rule.id = object.at("id").get<std::string>();
        rule.name = object.value("name", rule.id);

        std::string kind_text = object.at("type").get<std::string>();
        auto kind = ParseEvaluatorKind(kind_text);
        if (!kind) {
            return absl::InvalidArgumentError(
                absl::StrCat("rule '", rule.id, "': unknown type '", kind_text, "'"));
        }
        rule.kind = *kind;

        // Older rules carry a single project_id
        if (object.contains("project_ids")) {
            rule.project_ids = object["project_ids"].get<std::vector<std::string>>();
        } else if (object.contains("project_id")) {
            rule.project_ids.push_back(object["project_id"].get<std::string>());
        }

        const json& rate = object.value("sampling_rate", json(1.0));
        rule.sampling_rate = rate.is_number() ? rate.get<double>() : 0.0;
        rule.enabled = object.value("enabled", true);

        for (const auto& filter_json : object.value("filters", json::array())) {
            auto filter = ParseFilter(filter_json);
            if (!filter.ok()) {
                return absl::InvalidArgumentError(
                    absl::StrCat("rule '", rule.id, "': ", filter.status().message()));
            }
            rule.filters.push_back(std::move(*filter));
        }

        const json& code = object.at("code");
        if (IsLlmJudge(rule.kind)) {
            auto judge = ParseLlmJudgeCode(code);
            if (!judge.ok()) {
                return absl::InvalidArgumentError(
                    absl::StrCat("rule '", rule.id, "': ", judge.status().message()));
            }
            rule.code = std::move(*judge);
        } else {
            rule.code = ParsePythonMetricCode(code);
        }

        auto status = ValidateRule(rule);
        if (!status.ok()) {
            return status;
        }
        return rule;
    } catch (const json::exception& e) {
        return absl::InvalidArgumentError(absl::StrCat("malformed rule: ", e.what()));
    }
}

absl::StatusOr<std::vector<Rule>> ParseRules(const json& array) {
    if (!array.is_array()) {
        return absl::InvalidArgumentError("rules must be a JSON array");
    }
    std::vector<Rule> rules;
    rules.reserve(array.size());
    for (const auto& item : array) {
        auto rule = ParseRule(item);
        if (!rule.ok()) {
            return rule.status();
        }
        rules.push_back(std::move(*rule));
    }
    return rules;
}

json RuleToJson(const Rule& rule) {
    json object;
    object["id"] = rule.id;
    object["project_ids"] = rule.project_ids;
    object["name"] = rule.name;
    object["type"] = std::string(ToString(rule.kind));
    object["sampling_rate"] = rule.sampling_rate;
    object["enabled"] = rule.enabled;

    json filters = json::array();
    for (const auto& filter : rule.filters) {
        json item;
        item["field"] = filter.field;
        item["operator"] = std::string(ToString(filter.op));
        item["key"] = filter.key ? json(*filter.key) : json(nullptr);
        item["value"] = filter.value ? json(*filter.value) : json(nullptr);
        filters.push_back(std::move(item));
    }
    object["filters"] = std::move(filters);

    std::visit([&object](const auto& code) {
        using T = std::decay_t<decltype(code)>;
        json payload;
        if constexpr (std::is_same_v<T, LlmJudgeCode>) {
            json model;
            model["name"] = code.model.name;
            if (code.model.temperature) {
                model["temperature"] = *code.model.temperature;
            }
            if (code.model.seed) {
                model["seed"] = *code.model.seed;
            }
            model["custom_parameters"] = code.model.custom_parameters;
            payload["model"] = std::move(model);

            payload["messages"] = json::array();
            for (const auto& message : code.messages) {
                payload["messages"].push_back({{"role", message.role}, {"content", message.content}});
            }
            payload["variables"] = MappingsToJson(code.variables);
            payload["schema"] = json::array();
            for (const auto& field : code.schema) {
                payload["schema"].push_back({{"name", field.name},
                                             {"type", std::string(ToString(field.type))},
                                             {"description", field.description}});
            }
        } else {
            payload["metric"] = code.metric;
            payload["arguments"] = MappingsToJson(code.arguments);
        }
        object["code"] = std::move(payload);
    }, rule.code);

    return object;
}

json RulesToJson(const std::vector<Rule>& rules) {
    json array = json::array();
    for (const auto& rule : rules) {
        array.push_back(RuleToJson(rule));
    }
    return array;
}

}  // namespace tracescore::model
