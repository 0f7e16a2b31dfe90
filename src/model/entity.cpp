#include "model/entity.h"

#include <algorithm>
#include <set>

#include <absl/strings/str_cat.h>
#include <absl/time/time.h>

namespace tracescore::model {

using json = nlohmann::json;

namespace {

std::string StringField(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return "";
    }
    return it->is_string() ? it->get<std::string>() : it->dump();
}

json TreeField(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return json::object();
    }
    return *it;
}

std::optional<int64_t> TimeField(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return std::nullopt;
    }
    if (it->is_number_integer()) {
        return it->get<int64_t>();
    }
    if (it->is_string()) {
        return ParseTimestampMs(it->get<std::string>());
    }
    return std::nullopt;
}

// guardrails_validations: [{ "checks": [{ "result": "passed" | "failed" }] }]
std::string GuardrailsResult(const json& object) {
    auto it = object.find("guardrails_validations");
    if (it == object.end() || !it->is_array() || it->empty()) {
        return "";
    }
    for (const auto& validation : *it) {
        for (const auto& check : validation.value("checks", json::array())) {
            if (check.value("result", "") == "failed") {
                return "failed";
            }
        }
    }
    return "passed";
}

}  // namespace

std::optional<int64_t> ScoredEntity::DurationMs() const {
    if (!start_time_ms || !end_time_ms) {
        return std::nullopt;
    }
    return *end_time_ms - *start_time_ms;
}

std::optional<int64_t> ParseTimestampMs(const std::string& text) {
    absl::Time time;
    std::string error;
    if (!absl::ParseTime(absl::RFC3339_full, text, &time, &error)) {
        return std::nullopt;
    }
    return absl::ToUnixMillis(time);
}

std::string JsonToText(const json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_null()) {
        return "";
    }
    return value.dump();
}

absl::StatusOr<ScoredEntity> DecodeEntity(EntityType type, const json& object) {
    if (type == EntityType::kThread) {
        return absl::InvalidArgumentError("threads are assembled from traces, not decoded");
    }
    if (!object.is_object()) {
        return absl::DataLossError(absl::StrCat(std::string(ToString(type)), " payload must be a JSON object"));
    }

    ScoredEntity entity;
    entity.type = type;
    entity.id = StringField(object, "id");
    if (entity.id.empty()) {
        return absl::DataLossError(absl::StrCat(std::string(ToString(type)), " payload has no id"));
    }

    try {
        entity.project_id = StringField(object, "project_id");
        entity.trace_id = StringField(object, "trace_id");
        entity.thread_id = StringField(object, "thread_id");
        entity.name = StringField(object, "name");
        entity.input = TreeField(object, "input");
        entity.output = TreeField(object, "output");
        entity.metadata = TreeField(object, "metadata");

        for (const auto& tag : object.value("tags", json::array())) {
            if (tag.is_string()) {
                entity.tags.push_back(tag.get<std::string>());
            }
        }

        entity.start_time_ms = TimeField(object, "start_time");
        entity.end_time_ms = TimeField(object, "end_time");

        for (const auto& [key, value] : object.value("usage", json::object()).items()) {
            if (value.is_number()) {
                entity.usage[key] = value.get<int64_t>();
            }
        }

        auto cost = object.find("total_estimated_cost");
        if (cost != object.end() && cost->is_number()) {
            entity.total_estimated_cost = cost->get<double>();
        }

        entity.model = StringField(object, "model");
        entity.provider = StringField(object, "provider");
        entity.span_type = StringField(object, "type");
        entity.error_info = StringField(object, "error_info");
        entity.guardrails = GuardrailsResult(object);

        for (const auto& score : object.value("feedback_scores", json::array())) {
            if (score.contains("name") && score.contains("value") && score["value"].is_number()) {
                entity.feedback_scores[score["name"].get<std::string>()] =
                    score["value"].get<double>();
            }
        }
    } catch (const json::exception& e) {
        return absl::DataLossError(absl::StrCat("malformed ", std::string(ToString(type)), " '", entity.id,
                                                "': ", e.what()));
    }

    return entity;
}

json EntityToJson(const ScoredEntity& entity) {
    json object = {
        {"id", entity.id},
        {"name", entity.name},
        {"input", entity.input},
        {"output", entity.output},
        {"metadata", entity.metadata},
        {"tags", entity.tags},
    };
    if (!entity.project_id.empty()) {
        object["project_id"] = entity.project_id;
    }
    if (!entity.trace_id.empty()) {
        object["trace_id"] = entity.trace_id;
    }
    if (!entity.thread_id.empty()) {
        object["thread_id"] = entity.thread_id;
    }
    if (entity.start_time_ms) {
        object["start_time"] = *entity.start_time_ms;
    }
    if (entity.end_time_ms) {
        object["end_time"] = *entity.end_time_ms;
    }
    if (!entity.usage.empty()) {
        object["usage"] = entity.usage;
    }
    if (entity.total_estimated_cost) {
        object["total_estimated_cost"] = *entity.total_estimated_cost;
    }
    if (entity.type == EntityType::kSpan) {
        object["model"] = entity.model;
        object["provider"] = entity.provider;
        object["type"] = entity.span_type;
        if (!entity.error_info.empty()) {
            object["error_info"] = entity.error_info;
        }
    }
    if (!entity.feedback_scores.empty()) {
        json scores = json::array();
        for (const auto& [name, value] : entity.feedback_scores) {
            scores.push_back({{"name", name}, {"value", value}});
        }
        object["feedback_scores"] = std::move(scores);
    }
    return object;
}

ScoredEntity BuildThreadEntity(const std::string& thread_id,
                               const std::string& project_id,
                               std::vector<ScoredEntity> traces) {
    std::stable_sort(traces.begin(), traces.end(),
                     [](const ScoredEntity& a, const ScoredEntity& b) {
                         return a.start_time_ms.value_or(0) < b.start_time_ms.value_or(0);
                     });

    ScoredEntity thread;
    thread.type = EntityType::kThread;
    thread.id = thread_id;
    thread.thread_id = thread_id;
    thread.project_id = project_id;

    std::set<std::string> tags;
    for (const auto& trace : traces) {
        int64_t start = trace.start_time_ms.value_or(0);
        int64_t end = trace.end_time_ms.value_or(start);

        if (!trace.input.empty()) {
            thread.messages.push_back(ThreadMessage{"user", JsonToText(trace.input), start});
        }
        if (!trace.output.empty()) {
            thread.messages.push_back(ThreadMessage{"assistant", JsonToText(trace.output), end});
        }

        if (trace.start_time_ms &&
            (!thread.start_time_ms || *trace.start_time_ms < *thread.start_time_ms)) {
            thread.start_time_ms = trace.start_time_ms;
        }
        if (!thread.end_time_ms || end > *thread.end_time_ms) {
            thread.end_time_ms = end;
        }
        tags.insert(trace.tags.begin(), trace.tags.end());
    }
    thread.tags.assign(tags.begin(), tags.end());
    return thread;
}

}  // namespace tracescore::model
