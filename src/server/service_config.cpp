#include "server/service_config.h"

#include <set>

#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "consumer/envelope_codec.h"

namespace tracescore::server {

namespace {

constexpr const char* kDefaultConsumerGroup = "online_scoring";

std::chrono::milliseconds Millis(const Config& config, const std::string& key,
                                 std::chrono::milliseconds fallback) {
    return std::chrono::milliseconds(config.GetInt(key, fallback.count()));
}

llm::RetryPolicy ParseRetry(const Config& config, const std::string& prefix,
                            llm::RetryPolicy policy) {
    policy.max_attempts =
        static_cast<int>(config.GetInt(prefix + ".max_attempts", policy.max_attempts));
    policy.initial_backoff = Millis(config, prefix + ".initial_backoff_ms", policy.initial_backoff);
    policy.max_backoff = Millis(config, prefix + ".max_backoff_ms", policy.max_backoff);
    policy.multiplier = config.GetDouble(prefix + ".multiplier", policy.multiplier);
    return policy;
}

template <typename T>
T NodeValue(const YAML::Node& node, const char* key, T fallback) {
    if (!node[key]) {
        return fallback;
    }
    return node[key].as<T>();
}

/// Stream settings inherit the online_scoring section, then the item overrides
absl::StatusOr<consumer::StreamConfig> ParseStream(const YAML::Node& node,
                                                   const consumer::StreamConfig& base) {
    consumer::StreamConfig stream = base;
    try {
        std::string kind_name = NodeValue<std::string>(node, "evaluator_kind", "");
        auto kind = model::ParseEvaluatorKind(kind_name);
        if (!kind) {
            return MakeError(ErrorCode::kConfigurationError,
                             absl::StrCat("Unknown evaluator kind '", kind_name, "'"));
        }
        stream.kind = *kind;
        stream.stream_name =
            NodeValue<std::string>(node, "stream_name", DefaultStreamName(stream.kind));
        stream.consumer_group = NodeValue<std::string>(node, "consumer_group", base.consumer_group);
        stream.batch_size = NodeValue<size_t>(node, "batch_size", base.batch_size);
        stream.polling_interval = std::chrono::milliseconds(
            NodeValue<int64_t>(node, "polling_interval_ms", base.polling_interval.count()));
        stream.codec = NodeValue<std::string>(node, "codec", base.codec);
        stream.pending_message_duration = std::chrono::milliseconds(NodeValue<int64_t>(
            node, "pending_message_duration_ms", base.pending_message_duration.count()));
        stream.claim_interval_ratio =
            NodeValue<int>(node, "claim_interval_ratio", base.claim_interval_ratio);
        stream.max_retries = NodeValue<int>(node, "max_retries", base.max_retries);
        stream.enabled = NodeValue<bool>(node, "enabled", true);
    } catch (const YAML::Exception& e) {
        return MakeError(ErrorCode::kConfigurationError,
                         absl::StrCat("Invalid stream configuration: ", e.what()));
    }
    return stream;
}

absl::Status Invalid(const std::string& message) {
    return MakeError(ErrorCode::kConfigurationError, message);
}

}  // namespace

std::string DefaultStreamName(model::EvaluatorKind kind) {
    return absl::StrCat("online_scoring:", std::string(model::ToString(kind)));
}

ServiceConfig ServiceConfig::Default() {
    ServiceConfig config;
    config.logging.name = "tracescore";

    for (auto kind : model::kAllEvaluatorKinds) {
        consumer::StreamConfig stream;
        stream.kind = kind;
        stream.stream_name = DefaultStreamName(kind);
        stream.consumer_group = kDefaultConsumerGroup;
        config.streams.push_back(std::move(stream));
    }
    return config;
}

absl::StatusOr<ServiceConfig> ServiceConfig::FromConfig(const Config& config) {
    ServiceConfig service = Default();

    service.logging = LogConfigFromConfig(config);

    // Redis
    service.redis.host = config.GetString("redis.host", service.redis.host);
    service.redis.port = static_cast<uint16_t>(config.GetInt("redis.port", service.redis.port));
    service.redis.password = config.GetString("redis.password", "");
    service.redis.database = static_cast<int>(config.GetInt("redis.database", 0));

    // ClickHouse
    service.clickhouse.host = config.GetString("clickhouse.host", service.clickhouse.host);
    service.clickhouse.port =
        static_cast<uint16_t>(config.GetInt("clickhouse.port", service.clickhouse.port));
    service.clickhouse.database =
        config.GetString("clickhouse.database", service.clickhouse.database);
    service.clickhouse.user = config.GetString("clickhouse.user", service.clickhouse.user);
    service.clickhouse.password = config.GetString("clickhouse.password", "");
    service.run_migrations = config.GetBool("clickhouse.run_migrations", false);

    // LLM provider
    service.llm.endpoint = config.GetString("llm.endpoint", service.llm.endpoint);
    service.llm.chat_path = config.GetString("llm.chat_path", service.llm.chat_path);
    service.llm.api_key = config.GetString("llm.api_key", "");
    service.llm.connect_timeout =
        Millis(config, "llm.connect_timeout_ms", service.llm.connect_timeout);
    if (config.HasKey("llm.structured_output_models")) {
        service.llm.structured_output_models = config.GetStringList("llm.structured_output_models");
    }
    service.llm.retry = ParseRetry(config, "llm.retry", service.llm.retry);

    // Python backend
    service.python.url = config.GetString("python_backend.url", service.python.url);
    service.python.path = config.GetString("python_backend.path", service.python.path);
    service.python.connect_timeout =
        Millis(config, "python_backend.connect_timeout_ms", service.python.connect_timeout);
    service.python.retry = ParseRetry(config, "python_backend.retry", service.python.retry);

    // Engine
    service.engine.worker_threads = static_cast<size_t>(
        config.GetInt("engine.worker_threads", static_cast<int64_t>(service.engine.worker_threads)));
    service.engine.options.call_timeout =
        Millis(config, "engine.call_timeout_ms", service.engine.options.call_timeout);
    service.engine.options.batch_timeout =
        Millis(config, "engine.batch_timeout_ms", service.engine.options.batch_timeout);

    // Rule registry
    std::string cache = config.GetString("registry.cache", "redis");
    if (cache == "memory") {
        service.registry.cache = CacheBackend::kMemory;
    } else if (cache == "redis") {
        service.registry.cache = CacheBackend::kRedis;
    } else {
        return Invalid(absl::StrCat("Unknown registry cache '", cache, "', expected memory or redis"));
    }
    service.registry.cache_ttl = std::chrono::seconds(
        config.GetInt("registry.cache_ttl_s", service.registry.cache_ttl.count()));
    service.registry.rules_file = config.GetString("registry.rules_file", service.registry.rules_file);

    // User log buffering
    service.user_log.max_batch_size = static_cast<size_t>(config.GetInt(
        "user_log.max_batch_size", static_cast<int64_t>(service.user_log.max_batch_size)));
    service.user_log.flush_interval =
        Millis(config, "user_log.flush_interval_ms", service.user_log.flush_interval);
    service.user_log.max_buffer_size = static_cast<size_t>(config.GetInt(
        "user_log.max_buffer_size", static_cast<int64_t>(service.user_log.max_buffer_size)));

    // Streams
    consumer::StreamConfig base;
    base.consumer_group = config.GetString("online_scoring.consumer_group", kDefaultConsumerGroup);
    base.batch_size = static_cast<size_t>(
        config.GetInt("online_scoring.batch_size", static_cast<int64_t>(base.batch_size)));
    base.polling_interval =
        Millis(config, "online_scoring.polling_interval_ms", base.polling_interval);
    base.codec = config.GetString("online_scoring.codec", base.codec);
    base.pending_message_duration = Millis(config, "online_scoring.pending_message_duration_ms",
                                           base.pending_message_duration);
    base.claim_interval_ratio = static_cast<int>(
        config.GetInt("online_scoring.claim_interval_ratio", base.claim_interval_ratio));
    base.max_retries =
        static_cast<int>(config.GetInt("online_scoring.max_retries", base.max_retries));

    auto streams = config.Node("online_scoring.streams");
    if (streams && streams->IsSequence()) {
        service.streams.clear();
        for (const auto& item : *streams) {
            TRACESCORE_ASSIGN_OR_RETURN(auto stream, ParseStream(item, base));
            service.streams.push_back(std::move(stream));
        }
    } else {
        for (auto& stream : service.streams) {
            auto kind = stream.kind;
            auto name = stream.stream_name;
            stream = base;
            stream.kind = kind;
            stream.stream_name = name;
        }
    }

    TRACESCORE_RETURN_IF_ERROR(service.Validate());
    return service;
}

absl::StatusOr<ServiceConfig> ServiceConfig::LoadWithEnv(const std::filesystem::path& path,
                                                         const std::string& env_prefix) {
    TRACESCORE_ASSIGN_OR_RETURN(auto config, Config::LoadFromFile(path));
    config.Merge(Config::LoadFromEnvironment(env_prefix));
    return FromConfig(config);
}

absl::Status ServiceConfig::Validate() const {
    if (engine.worker_threads == 0) {
        return Invalid("engine.worker_threads must be at least 1");
    }
    if (engine.options.call_timeout.count() <= 0 || engine.options.batch_timeout.count() <= 0) {
        return Invalid("engine timeouts must be positive");
    }
    if (llm.retry.max_attempts < 1 || python.retry.max_attempts < 1) {
        return Invalid("retry.max_attempts must be at least 1");
    }
    if (registry.cache_ttl.count() <= 0) {
        return Invalid("registry.cache_ttl_s must be positive");
    }
    if (user_log.max_batch_size == 0 || user_log.flush_interval.count() <= 0) {
        return Invalid("user_log batching must have a positive size and interval");
    }

    std::set<std::string> names;
    for (const auto& stream : streams) {
        if (stream.stream_name.empty()) {
            return Invalid("stream_name must not be empty");
        }
        if (!names.insert(stream.stream_name).second) {
            return Invalid(absl::StrCat("Stream '", stream.stream_name, "' is configured twice"));
        }
        if (stream.consumer_group.empty()) {
            return Invalid(absl::StrCat("Stream '", stream.stream_name, "' needs a consumer_group"));
        }
        if (stream.batch_size < 1) {
            return Invalid(absl::StrCat("Stream '", stream.stream_name, "': batch_size must be at least 1"));
        }
        if (stream.polling_interval.count() <= 0) {
            return Invalid(
                absl::StrCat("Stream '", stream.stream_name, "': polling_interval_ms must be positive"));
        }
        if (stream.claim_interval_ratio < 1) {
            return Invalid(absl::StrCat("Stream '", stream.stream_name,
                                        "': claim_interval_ratio must be at least 1"));
        }
        if (stream.max_retries < 1) {
            return Invalid(
                absl::StrCat("Stream '", stream.stream_name, "': max_retries must be at least 1"));
        }
        auto codec = consumer::MakeEnvelopeCodec(stream.codec);
        if (!codec.ok()) {
            return Invalid(absl::StrCat("Stream '", stream.stream_name, "': ",
                                        codec.status().message()));
        }
    }
    return absl::OkStatus();
}

}  // namespace tracescore::server
