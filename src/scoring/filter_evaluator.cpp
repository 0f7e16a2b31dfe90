#include "scoring/filter_evaluator.h"

#include <algorithm>
#include <string>

#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <absl/strings/numbers.h>

#include "common/logging.h"
#include "scoring/variable_resolver.h"

namespace tracescore::scoring {

using json = nlohmann::json;
using model::FilterOperator;

namespace {

/// Value of an entity field as seen by one filter
struct FieldValue {
    enum class Kind { kMissing, kText, kNumber, kList };

    Kind kind = Kind::kMissing;
    std::string text;
    double number = 0.0;
    std::vector<std::string> list;
    bool is_time = false;

    static FieldValue Missing() { return {}; }

    static FieldValue Text(std::string value) {
        FieldValue field;
        field.kind = Kind::kText;
        field.text = std::move(value);
        return field;
    }

    static FieldValue Number(double value, bool is_time = false) {
        FieldValue field;
        field.kind = Kind::kNumber;
        field.number = value;
        field.is_time = is_time;
        return field;
    }

    static FieldValue List(std::vector<std::string> values) {
        FieldValue field;
        field.kind = Kind::kList;
        field.list = std::move(values);
        return field;
    }

    template <typename T>
    static FieldValue FromOptional(const std::optional<T>& value, bool is_time = false) {
        return value ? Number(static_cast<double>(*value), is_time) : Missing();
    }

    static FieldValue FromText(const std::string& value) {
        return value.empty() ? Missing() : Text(value);
    }
};

FieldValue FromJson(const std::optional<json>& node) {
    if (!node || node->is_null()) {
        return FieldValue::Missing();
    }
    if (node->is_number()) {
        return FieldValue::Number(node->get<double>());
    }
    if (node->is_boolean()) {
        return FieldValue::Text(node->get<bool>() ? "true" : "false");
    }
    if (node->is_string()) {
        return FieldValue::Text(node->get<std::string>());
    }
    if (node->empty()) {
        return FieldValue::Missing();
    }
    return FieldValue::Text(node->dump());
}

FieldValue TreeField(const json& tree, const std::optional<std::string>& key) {
    if (key) {
        return FromJson(LookupJsonPath(tree, *key));
    }
    return FromJson(tree);
}

template <typename Map>
FieldValue MapField(const Map& map, const std::optional<std::string>& key) {
    if (!key) {
        // Without a key the field is the list of names
        std::vector<std::string> names;
        for (const auto& entry : map) {
            names.push_back(entry.first);
        }
        return FieldValue::List(std::move(names));
    }
    auto it = map.find(*key);
    if (it == map.end()) {
        return FieldValue::Missing();
    }
    return FieldValue::Number(static_cast<double>(it->second));
}

// custom key is "input.<path>" or "output.<path>"
std::optional<FieldValue> CustomField(const model::ScoredEntity& entity,
                                      const std::optional<std::string>& key) {
    if (!key) {
        return std::nullopt;
    }
    size_t dot = key->find('.');
    if (dot == std::string::npos || dot + 1 >= key->size()) {
        return std::nullopt;
    }
    std::string base = key->substr(0, dot);
    std::string path = key->substr(dot + 1);
    if (base == "input") {
        return FromJson(LookupJsonPath(entity.input, path));
    }
    if (base == "output") {
        return FromJson(LookupJsonPath(entity.output, path));
    }
    return std::nullopt;
}

std::optional<FieldValue> TraceOrSpanField(const model::Filter& filter,
                                           const model::ScoredEntity& entity) {
    const std::string& field = filter.field;

    if (field == "id") return FieldValue::FromText(entity.id);
    if (field == "name") return FieldValue::FromText(entity.name);
    if (field == "input") return TreeField(entity.input, filter.key);
    if (field == "output") return TreeField(entity.output, filter.key);
    if (field == "metadata") return TreeField(entity.metadata, filter.key);
    if (field == "tags") return FieldValue::List(entity.tags);
    if (field == "start_time") return FieldValue::FromOptional(entity.start_time_ms, true);
    if (field == "end_time") return FieldValue::FromOptional(entity.end_time_ms, true);
    if (field == "duration") return FieldValue::FromOptional(entity.DurationMs());
    if (field == "total_estimated_cost") return FieldValue::FromOptional(entity.total_estimated_cost);
    if (field == "feedback_scores") return MapField(entity.feedback_scores, filter.key);
    if (field == "usage") return MapField(entity.usage, filter.key);
    if (absl::StartsWith(field, "usage.")) {
        return MapField(entity.usage, std::optional<std::string>(field.substr(6)));
    }
    if (field == "thread_id") return FieldValue::FromText(entity.thread_id);
    if (field == "guardrails") return FieldValue::FromText(entity.guardrails);
    if (field == "custom") return CustomField(entity, filter.key);

    if (entity.type == model::EntityType::kSpan) {
        if (field == "model") return FieldValue::FromText(entity.model);
        if (field == "provider") return FieldValue::FromText(entity.provider);
        if (field == "type") return FieldValue::FromText(entity.span_type);
        if (field == "error_info") return FieldValue::FromText(entity.error_info);
        if (field == "trace_id") return FieldValue::FromText(entity.trace_id);
    }
    return std::nullopt;
}

std::optional<FieldValue> ThreadField(const model::Filter& filter,
                                      const model::ScoredEntity& entity) {
    const std::string& field = filter.field;

    if (field == "id") return FieldValue::FromText(entity.id);
    if (field == "first_message") {
        auto it = std::find_if(entity.messages.begin(), entity.messages.end(),
                               [](const model::ThreadMessage& m) { return m.role == "user"; });
        return it == entity.messages.end() ? FieldValue::Missing() : FieldValue::FromText(it->content);
    }
    if (field == "last_message") {
        auto it = std::find_if(entity.messages.rbegin(), entity.messages.rend(),
                               [](const model::ThreadMessage& m) { return m.role == "assistant"; });
        return it == entity.messages.rend() ? FieldValue::Missing() : FieldValue::FromText(it->content);
    }
    if (field == "number_of_messages") {
        return FieldValue::Number(static_cast<double>(entity.messages.size()));
    }
    if (field == "duration") return FieldValue::FromOptional(entity.DurationMs());
    if (field == "tags") return FieldValue::List(entity.tags);
    if (field == "feedback_scores") return MapField(entity.feedback_scores, filter.key);
    if (field == "created_at") return FieldValue::FromOptional(entity.start_time_ms, true);
    if (field == "last_updated_at") return FieldValue::FromOptional(entity.end_time_ms, true);
    return std::nullopt;
}

bool IsEmpty(const FieldValue& value) {
    switch (value.kind) {
        case FieldValue::Kind::kMissing:
            return true;
        case FieldValue::Kind::kText:
            return value.text.empty();
        case FieldValue::Kind::kNumber:
            return false;
        case FieldValue::Kind::kList:
            return value.list.empty();
    }
    return true;
}

std::optional<double> ParseNumber(const std::string& text, bool is_time) {
    double number = 0.0;
    if (absl::SimpleAtod(text, &number)) {
        return number;
    }
    if (is_time) {
        if (auto ms = model::ParseTimestampMs(text)) {
            return static_cast<double>(*ms);
        }
    }
    return std::nullopt;
}

std::string AsText(const FieldValue& value) {
    if (value.kind == FieldValue::Kind::kNumber) {
        std::string text = std::to_string(value.number);
        // 12.500000 -> 12.5
        if (text.find('.') != std::string::npos) {
            text.erase(text.find_last_not_of('0') + 1);
            if (text.back() == '.') {
                text.pop_back();
            }
        }
        return text;
    }
    return value.text;
}

bool ContainsIgnoreCase(const std::string& haystack, const std::string& needle) {
    return absl::StrContains(absl::AsciiStrToLower(haystack), absl::AsciiStrToLower(needle));
}

bool CompareText(FilterOperator op, const std::string& actual, const std::string& expected) {
    switch (op) {
        case FilterOperator::kEqual:
            return actual == expected;
        case FilterOperator::kNotEqual:
            return actual != expected;
        case FilterOperator::kContains:
            return ContainsIgnoreCase(actual, expected);
        case FilterOperator::kNotContains:
            return !ContainsIgnoreCase(actual, expected);
        case FilterOperator::kStartsWith:
            return absl::StartsWithIgnoreCase(actual, expected);
        case FilterOperator::kEndsWith:
            return absl::EndsWithIgnoreCase(actual, expected);
        case FilterOperator::kGreaterThan:
        case FilterOperator::kGreaterThanEqual:
        case FilterOperator::kLessThan:
        case FilterOperator::kLessThanEqual:
        case FilterOperator::kIsEmpty:
        case FilterOperator::kIsNotEmpty:
            return false;
    }
    return false;
}

bool CompareNumber(FilterOperator op, double actual, double expected) {
    switch (op) {
        case FilterOperator::kEqual:
            return actual == expected;
        case FilterOperator::kNotEqual:
            return actual != expected;
        case FilterOperator::kGreaterThan:
            return actual > expected;
        case FilterOperator::kGreaterThanEqual:
            return actual >= expected;
        case FilterOperator::kLessThan:
            return actual < expected;
        case FilterOperator::kLessThanEqual:
            return actual <= expected;
        case FilterOperator::kContains:
        case FilterOperator::kNotContains:
        case FilterOperator::kStartsWith:
        case FilterOperator::kEndsWith:
        case FilterOperator::kIsEmpty:
        case FilterOperator::kIsNotEmpty:
            return false;
    }
    return false;
}

bool IsNumericOperator(FilterOperator op) {
    return op == FilterOperator::kGreaterThan || op == FilterOperator::kGreaterThanEqual ||
           op == FilterOperator::kLessThan || op == FilterOperator::kLessThanEqual;
}

}  // namespace

bool FilterEvaluator::Matches(const std::vector<model::Filter>& filters,
                              const model::ScoredEntity& entity) {
    return std::all_of(filters.begin(), filters.end(),
                       [&entity](const model::Filter& filter) { return Matches(filter, entity); });
}

bool FilterEvaluator::Matches(const model::Filter& filter, const model::ScoredEntity& entity) {
    std::optional<FieldValue> resolved = entity.type == model::EntityType::kThread
                                             ? ThreadField(filter, entity)
                                             : TraceOrSpanField(filter, entity);
    if (!resolved) {
        TRACESCORE_LOG_WARN("Filter field '{}' (key '{}') is not supported for {} entities",
                            filter.field, filter.key.value_or(""), model::ToString(entity.type));
        return false;
    }
    const FieldValue& value = *resolved;

    if (filter.op == FilterOperator::kIsEmpty) {
        return IsEmpty(value);
    }
    if (filter.op == FilterOperator::kIsNotEmpty) {
        return !IsEmpty(value);
    }

    const std::string expected = filter.value.value_or("");

    if (value.kind == FieldValue::Kind::kMissing) {
        // A missing field only satisfies the negative operators
        return filter.op == FilterOperator::kNotEqual || filter.op == FilterOperator::kNotContains;
    }

    if (value.kind == FieldValue::Kind::kList) {
        bool negative = filter.op == FilterOperator::kNotEqual ||
                        filter.op == FilterOperator::kNotContains;
        FilterOperator positive = filter.op == FilterOperator::kNotEqual      ? FilterOperator::kEqual
                                  : filter.op == FilterOperator::kNotContains ? FilterOperator::kContains
                                                                              : filter.op;
        if (IsNumericOperator(positive)) {
            TRACESCORE_LOG_WARN("Operator '{}' is not supported for list field '{}'",
                                model::ToString(filter.op), filter.field);
            return false;
        }
        bool any = std::any_of(value.list.begin(), value.list.end(), [&](const std::string& item) {
            return positive == FilterOperator::kEqual ? absl::EqualsIgnoreCase(item, expected)
                                                      : CompareText(positive, item, expected);
        });
        return negative ? !any : any;
    }

    if (IsNumericOperator(filter.op) ||
        (value.kind == FieldValue::Kind::kNumber &&
         (filter.op == FilterOperator::kEqual || filter.op == FilterOperator::kNotEqual))) {
        std::optional<double> actual = value.kind == FieldValue::Kind::kNumber
                                           ? std::optional<double>(value.number)
                                           : ParseNumber(value.text, false);
        std::optional<double> wanted = ParseNumber(expected, value.is_time);
        if (!actual || !wanted) {
            TRACESCORE_LOG_WARN("Filter on '{}' compares non-numeric values '{}' {} '{}'",
                                filter.field, AsText(value), model::ToString(filter.op), expected);
            return false;
        }
        return CompareNumber(filter.op, *actual, *wanted);
    }

    return CompareText(filter.op, AsText(value), expected);
}

}  // namespace tracescore::scoring
