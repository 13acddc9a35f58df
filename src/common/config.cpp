#include "config.h"

#include <cstdlib>
#include <functional>

#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_split.h>

#include "logging.h"

namespace tracelens {

namespace {

/// Environment variable suffix and the config key it populates.
struct EnvBinding {
    const char* suffix;
    const char* key;
    bool numeric;
};

constexpr EnvBinding kEnvBindings[] = {
    {"DEFAULT_TIME_ZONE", "analytics.default_time_zone", false},
    {"MAX_BUCKETS", "analytics.max_buckets", true},
    {"MAX_FILTER_OPTIONS", "analytics.max_filter_options", true},
    {"TOP_DOCUMENTS_LIMIT", "analytics.top_documents_limit", true},
    {"FEEDBACKS_LIMIT", "analytics.feedbacks_limit", true},
    {"LOG_LEVEL", "logging.level", false},
};

nlohmann::json NodeToJson(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Map: {
            nlohmann::json obj = nlohmann::json::object();
            for (const auto& kv : node) {
                obj[kv.first.as<std::string>()] = NodeToJson(kv.second);
            }
            return obj;
        }
        case YAML::NodeType::Sequence: {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto& item : node) {
                arr.push_back(NodeToJson(item));
            }
            return arr;
        }
        case YAML::NodeType::Scalar: {
            const std::string text = node.Scalar();
            int64_t i = 0;
            double d = 0.0;
            if (absl::SimpleAtoi(text, &i)) return i;
            if (absl::SimpleAtod(text, &d)) return d;
            if (text == "true") return true;
            if (text == "false") return false;
            return text;
        }
        default:
            return nullptr;
    }
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

absl::StatusOr<Config> Config::LoadFromEnvironment(std::string_view prefix) {
    Config config;

    for (const auto& binding : kEnvBindings) {
        std::string name = absl::StrCat(prefix, binding.suffix);
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) {
            continue;
        }
        if (binding.numeric) {
            int64_t parsed = 0;
            if (!absl::SimpleAtoi(value, &parsed)) {
                return absl::InvalidArgumentError(
                    absl::StrCat("Environment variable ", name, " is not an integer: ", value));
            }
            config.Set(binding.key, parsed);
        } else {
            config.Set(binding.key, std::string(value));
        }
    }

    return config;
}

absl::StatusOr<Config> Config::LoadLayered(
    const std::optional<std::filesystem::path>& path,
    std::string_view env_prefix
) {
    Config config;

    if (path.has_value()) {
        auto file_config = LoadFromFile(*path);
        if (!file_config.ok()) {
            return file_config.status();
        }
        config.Merge(*file_config);
        TRACELENS_LOG_DEBUG("Loaded configuration from {}", path->string());
    }

    auto env_config = LoadFromEnvironment(env_prefix);
    if (!env_config.ok()) {
        return env_config.status();
    }
    config.Merge(*env_config);

    return config;
}

void Config::Merge(const Config& other) {
    std::function<void(YAML::Node&, const YAML::Node&)> merge_nodes;
    merge_nodes = [&merge_nodes](YAML::Node& base, const YAML::Node& overlay) {
        if (!overlay.IsMap()) {
            return;
        }
        if (!base.IsMap()) {
            base = YAML::Node(YAML::NodeType::Map);
        }
        for (const auto& kv : overlay) {
            const std::string key = kv.first.as<std::string>();
            if (base[key] && base[key].IsMap() && kv.second.IsMap()) {
                YAML::Node base_child = base[key];
                merge_nodes(base_child, kv.second);
            } else {
                base[key] = YAML::Clone(kv.second);
            }
        }
    };

    merge_nodes(root_, other.root_);
}

std::optional<YAML::Node> Config::GetNestedNode(std::string_view key) const {
    std::vector<std::string> parts = absl::StrSplit(key, '.');
    YAML::Node current;
    current.reset(root_);

    for (const auto& part : parts) {
        if (!current || !current.IsMap()) {
            return std::nullopt;
        }
        YAML::Node next = current[part];
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
    if (node && node->IsScalar()) {
        try {
            return node->as<int64_t>();
        } catch (const YAML::Exception& e) {
            TRACELENS_LOG_WARN("Config key '{}' is not an integer: {}", key, e.what());
        }
    }
    return default_value;
}

double Config::GetDouble(std::string_view key, double default_value) const {
    auto node = GetNestedNode(key);
    if (node && node->IsScalar()) {
        try {
            return node->as<double>();
        } catch (const YAML::Exception& e) {
            TRACELENS_LOG_WARN("Config key '{}' is not a number: {}", key, e.what());
        }
    }
    return default_value;
}

bool Config::GetBool(std::string_view key, bool default_value) const {
    auto node = GetNestedNode(key);
    if (node && node->IsScalar()) {
        try {
            return node->as<bool>();
        } catch (const YAML::Exception& e) {
            TRACELENS_LOG_WARN("Config key '{}' is not a boolean: {}", key, e.what());
        }
    }
    return default_value;
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

void Config::Set(std::string_view key, ConfigValue value) {
    std::vector<std::string> parts = absl::StrSplit(key, '.');

    YAML::Node leaf = std::visit([](auto&& val) -> YAML::Node {
        using T = std::decay_t<decltype(val)>;
        if constexpr (std::is_same_v<T, std::vector<std::string>>) {
            YAML::Node seq(YAML::NodeType::Sequence);
            for (const auto& item : val) {
                seq.push_back(item);
            }
            return seq;
        } else {
            return YAML::Node(val);
        }
    }, value);

    if (!root_.IsMap()) {
        root_ = YAML::Node(YAML::NodeType::Map);
    }
    YAML::Node current;
    current.reset(root_);
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        if (!current[parts[i]].IsMap()) {
            current[parts[i]] = YAML::Node(YAML::NodeType::Map);
        }
        YAML::Node child = current[parts[i]];
        current.reset(child);
    }
    current[parts.back()] = leaf;
}

nlohmann::json Config::ToJson() const {
    if (!root_) {
        return nlohmann::json::object();
    }
    return NodeToJson(root_);
}

}  // namespace tracelens
