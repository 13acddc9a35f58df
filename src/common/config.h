#pragma once

/// @file config.h
/// @brief TraceLens configuration management

#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace tracelens {

/// @brief Configuration value that can hold different types
using ConfigValue = std::variant<
    bool,
    int64_t,
    double,
    std::string,
    std::vector<std::string>
>;

/// @brief YAML-backed configuration with dot-notation access
///
/// Layers are combined with Merge(); later layers win. The usual stack is
/// built-in defaults, then a YAML file, then TRACELENS_* environment values.
class Config {
public:
    Config() = default;

    /// @brief Load configuration from a YAML file
    /// @param path Path to the YAML configuration file
    static absl::StatusOr<Config> LoadFromFile(const std::filesystem::path& path);

    /// @brief Load configuration from a YAML string
    static absl::StatusOr<Config> LoadFromString(std::string_view yaml_content);

    /// @brief Load the recognised environment variables with a prefix
    /// @param prefix Environment variable prefix (e.g., "TRACELENS_")
    /// @return Configuration, or InvalidArgument if a numeric variable is malformed
    static absl::StatusOr<Config> LoadFromEnvironment(std::string_view prefix = "TRACELENS_");

    /// @brief Load an optional file and overlay the environment on top of it
    static absl::StatusOr<Config> LoadLayered(
        const std::optional<std::filesystem::path>& path,
        std::string_view env_prefix = "TRACELENS_");

    /// @brief Merge another configuration into this one (other takes precedence)
    void Merge(const Config& other);

    /// @brief Get a string value
    /// @param key Configuration key (supports dot notation, e.g., "analytics.max_buckets")
    /// @param default_value Default value if key not found
    std::string GetString(std::string_view key, std::string_view default_value = "") const;

    int64_t GetInt(std::string_view key, int64_t default_value = 0) const;

    double GetDouble(std::string_view key, double default_value = 0.0) const;

    bool GetBool(std::string_view key, bool default_value = false) const;

    /// @brief Get a list of strings, or an empty vector if not found
    std::vector<std::string> GetStringList(std::string_view key) const;

    bool HasKey(std::string_view key) const;

    /// @brief Set a configuration value, creating intermediate maps as needed
    void Set(std::string_view key, ConfigValue value);

    const YAML::Node& GetNode() const { return root_; }

    /// @brief Export configuration to JSON
    nlohmann::json ToJson() const;

private:
    YAML::Node root_;

    std::optional<YAML::Node> GetNestedNode(std::string_view key) const;
};

}  // namespace tracelens
