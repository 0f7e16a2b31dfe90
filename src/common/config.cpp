#include "config.h"

#include <cstdlib>
#include <functional>

#include <absl/strings/numbers.h>
#include <absl/strings/str_split.h>

namespace tracescore {

namespace {

enum class EnvType { kString, kInt, kList };

struct EnvBinding {
    const char* suffix;
    const char* key;
    EnvType type;
};

// Deployment settings that may be overridden without touching the YAML file
constexpr EnvBinding kEnvBindings[] = {
    {"REDIS_HOST", "redis.host", EnvType::kString},
    {"REDIS_PORT", "redis.port", EnvType::kInt},
    {"REDIS_PASSWORD", "redis.password", EnvType::kString},
    {"CLICKHOUSE_HOST", "clickhouse.host", EnvType::kString},
    {"CLICKHOUSE_PORT", "clickhouse.port", EnvType::kInt},
    {"CLICKHOUSE_DATABASE", "clickhouse.database", EnvType::kString},
    {"CLICKHOUSE_USER", "clickhouse.user", EnvType::kString},
    {"CLICKHOUSE_PASSWORD", "clickhouse.password", EnvType::kString},
    {"LLM_ENDPOINT", "llm.endpoint", EnvType::kString},
    {"LLM_API_KEY", "llm.api_key", EnvType::kString},
    {"LLM_STRUCTURED_OUTPUT_MODELS", "llm.structured_output_models", EnvType::kList},
    {"PYTHON_BACKEND_URL", "python_backend.url", EnvType::kString},
    {"RULES_FILE", "registry.rules_file", EnvType::kString},
    {"WORKER_THREADS", "engine.worker_threads", EnvType::kInt},
    {"LOG_LEVEL", "logging.level", EnvType::kString},
};

// Node handles are passed by value: each call binds a fresh handle to the
// child, so no existing handle is ever reassigned
void SetPath(YAML::Node node, const std::vector<std::string>& parts, size_t index,
             const YAML::Node& value) {
    const std::string& part = parts[index];
    if (index + 1 == parts.size()) {
        node[part] = value;
        return;
    }
    if (!node[part].IsMap()) {
        node[part] = YAML::Node(YAML::NodeType::Map);
    }
    SetPath(node[part], parts, index + 1, value);
}

}  // namespace

absl::StatusOr<Config> Config::LoadFromFile(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return absl::NotFoundError(
            absl::StrCat("Configuration file not found: ", path.string()));
    }

    try {
        Config config;
        config.root_ = YAML::LoadFile(path.string());
        return config;
    } catch (const YAML::Exception& e) {
        return absl::InvalidArgumentError(
            absl::StrCat("Failed to parse YAML configuration: ", e.what()));
    }
}

absl::StatusOr<Config> Config::LoadFromString(std::string_view yaml_content) {
    try {
        Config config;
        config.root_ = YAML::Load(std::string(yaml_content));
        return config;
    } catch (const YAML::Exception& e) {
        return absl::InvalidArgumentError(
            absl::StrCat("Failed to parse YAML content: ", e.what()));
    }
}

Config Config::LoadFromEnvironment(std::string_view prefix) {
    Config config;

    for (const auto& binding : kEnvBindings) {
        std::string name = absl::StrCat(std::string(prefix), binding.suffix);
        const char* raw = std::getenv(name.c_str());
        if (raw == nullptr) {
            continue;
        }
        std::string value(raw);

        switch (binding.type) {
            case EnvType::kString:
                config.Set(binding.key, value);
                break;
            case EnvType::kInt: {
                int64_t parsed = 0;
                if (absl::SimpleAtoi(value, &parsed)) {
                    config.Set(binding.key, parsed);
                }
                break;
            }
            case EnvType::kList: {
                std::vector<std::string> items =
                    absl::StrSplit(value, ',', absl::SkipEmpty());
                config.Set(binding.key, items);
                break;
            }
        }
    }

    return config;
}

void Config::Merge(const Config& other) {
    std::function<void(YAML::Node&, const YAML::Node&)> merge_nodes;
    merge_nodes = [&merge_nodes](YAML::Node& base, const YAML::Node& overlay) {
        if (!overlay.IsMap()) {
            return;
        }
        for (const auto& kv : overlay) {
            const std::string key = kv.first.as<std::string>();
            if (base[key] && base[key].IsMap() && kv.second.IsMap()) {
                YAML::Node base_child = base[key];
                merge_nodes(base_child, kv.second);
            } else {
                base[key] = kv.second;
            }
        }
    };

    if (!root_ || root_.IsNull()) {
        root_ = YAML::Node(YAML::NodeType::Map);
    }
    merge_nodes(root_, other.root_);
}

std::optional<YAML::Node> Config::GetNestedNode(std::string_view key) const {
    std::vector<std::string> parts = absl::StrSplit(std::string(key), '.');
    YAML::Node current;
    current.reset(root_);

    for (const auto& part : parts) {
        if (!current || !current.IsMap()) {
            return std::nullopt;
        }
        // Const lookup never inserts, reset() rebinds instead of assigning
        const YAML::Node& parent = current;
        YAML::Node next = parent[part];
        current.reset(next);
    }

    if (!current || current.IsNull()) {
        return std::nullopt;
    }
    return current;
}

std::string Config::GetString(std::string_view key, std::string_view default_value) const {
    auto node = GetNestedNode(key);
    if (node && node->IsScalar()) {
        return node->as<std::string>();
    }
    return std::string(default_value);
}

int64_t Config::GetInt(std::string_view key, int64_t default_value) const {
    auto node = GetNestedNode(key);
    if (!node || !node->IsScalar()) {
        return default_value;
    }
    try {
        return node->as<int64_t>();
    } catch (const YAML::Exception&) {
        return default_value;
    }
}

double Config::GetDouble(std::string_view key, double default_value) const {
    auto node = GetNestedNode(key);
    if (!node || !node->IsScalar()) {
        return default_value;
    }
    try {
        return node->as<double>();
    } catch (const YAML::Exception&) {
        return default_value;
    }
}

bool Config::GetBool(std::string_view key, bool default_value) const {
    auto node = GetNestedNode(key);
    if (!node || !node->IsScalar()) {
        return default_value;
    }
    try {
        return node->as<bool>();
    } catch (const YAML::Exception&) {
        return default_value;
    }
}

std::vector<std::string> Config::GetStringList(std::string_view key) const {
    std::vector<std::string> result;
    auto node = GetNestedNode(key);
    if (node && node->IsSequence()) {
        for (const auto& item : *node) {
            if (item.IsScalar()) {
                result.push_back(item.as<std::string>());
            }
        }
    }
    return result;
}

bool Config::HasKey(std::string_view key) const {
    return GetNestedNode(key).has_value();
}

std::optional<YAML::Node> Config::Node(std::string_view key) const {
    return GetNestedNode(key);
}

void Config::Set(std::string_view key, ConfigValue value) {
    std::vector<std::string> parts = absl::StrSplit(std::string(key), '.');
    if (!root_ || !root_.IsMap()) {
        root_ = YAML::Node(YAML::NodeType::Map);
    }

    YAML::Node converted = std::visit([](auto&& val) -> YAML::Node {
        using T = std::decay_t<decltype(val)>;
        if constexpr (std::is_same_v<T, std::vector<std::string>>) {
            YAML::Node seq(YAML::NodeType::Sequence);
            for (const auto& item : val) {
                seq.push_back(item);
            }
            return seq;
        } else if constexpr (std::is_same_v<T, std::unordered_map<std::string, std::string>>) {
            YAML::Node map(YAML::NodeType::Map);
            for (const auto& [k, v] : val) {
                map[k] = v;
            }
            return map;
        } else {
            return YAML::Node(val);
        }
    }, value);

    SetPath(root_, parts, 0, converted);
}

nlohmann::json Config::ToJson() const {
    return YamlToJson(root_);
}

nlohmann::json YamlToJson(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Map: {
            nlohmann::json object = nlohmann::json::object();
            for (const auto& kv : node) {
                object[kv.first.as<std::string>()] = YamlToJson(kv.second);
            }
            return object;
        }
        case YAML::NodeType::Sequence: {
            nlohmann::json array = nlohmann::json::array();
            for (const auto& item : node) {
                array.push_back(YamlToJson(item));
            }
            return array;
        }
        case YAML::NodeType::Scalar: {
            const std::string& text = node.Scalar();
            // Quoted scalars carry the "!" tag and stay strings
            if (node.Tag() != "!") {
                int64_t as_int = 0;
                double as_double = 0.0;
                if (absl::SimpleAtoi(text, &as_int)) {
                    return as_int;
                }
                if (absl::SimpleAtod(text, &as_double)) {
                    return as_double;
                }
                if (text == "true" || text == "false") {
                    return text == "true";
                }
            }
            return text;
        }
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            return nullptr;
    }
    return nullptr;
}

}  // namespace tracescore
