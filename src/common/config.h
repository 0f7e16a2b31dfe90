#pragma once

/// @file config.h
/// @brief Layered YAML configuration for tracescore

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace tracescore {

/// @brief Configuration value that can hold different types
using ConfigValue = std::variant<
    bool,
    int64_t,
    double,
    std::string,
    std::vector<std::string>,
    std::unordered_map<std::string, std::string>
>;

/// @brief Configuration tree with dot-notation access
///
/// Values come from a YAML file and are overlaid by environment variables.
/// Lookups never fail: a missing or mistyped key yields the default.
class Config {
public:
    Config() = default;

    /// @brief Load configuration from a YAML file
    static absl::StatusOr<Config> LoadFromFile(const std::filesystem::path& path);

    /// @brief Load configuration from a YAML string
    static absl::StatusOr<Config> LoadFromString(std::string_view yaml_content);

    /// @brief Load the supported settings from environment variables
    /// @param prefix Environment variable prefix (e.g., "TRACESCORE_")
    static Config LoadFromEnvironment(std::string_view prefix = "TRACESCORE_");

    /// @brief Deep-merge another configuration into this one (other wins)
    void Merge(const Config& other);

    /// @param key Dot-separated path, e.g. "redis.port"
    std::string GetString(std::string_view key, std::string_view default_value = "") const;

    int64_t GetInt(std::string_view key, int64_t default_value = 0) const;

    double GetDouble(std::string_view key, double default_value = 0.0) const;

    bool GetBool(std::string_view key, bool default_value = false) const;

    /// @return Scalars of a sequence, or empty if the key is not a sequence
    std::vector<std::string> GetStringList(std::string_view key) const;

    bool HasKey(std::string_view key) const;

    /// @brief Raw node at a key, for structured sections such as lists of maps
    std::optional<YAML::Node> Node(std::string_view key) const;

    /// @brief Set a configuration value, creating intermediate maps
    void Set(std::string_view key, ConfigValue value);

    const YAML::Node& GetNode() const { return root_; }

    /// @brief Export configuration to JSON
    nlohmann::json ToJson() const;

private:
    YAML::Node root_;

    std::optional<YAML::Node> GetNestedNode(std::string_view key) const;
};

/// @brief Convert a YAML node into JSON, keeping scalars typed where possible
nlohmann::json YamlToJson(const YAML::Node& node);

}  // namespace tracescore
