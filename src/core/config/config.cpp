#include "promptline/core/config.hpp"
#include "promptline/core/errors.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <limits>

namespace promptline {

namespace {

int ParseInt(const nlohmann::json& value, const std::string& key) {
    if (!value.is_number_integer()) {
        throw ConfigError(fmt::format("`{}` must be an integer", key));
    }
    const bool out_of_range = value.is_number_unsigned()
                                      ? value.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int>::max())
                                      : value.get<int64_t>() < std::numeric_limits<int>::min() ||
                                                value.get<int64_t>() > std::numeric_limits<int>::max();
    if (out_of_range) {
        throw ConfigError(fmt::format("`{}` is out of range, got {}", key, value.dump()));
    }
    return value.get<int>();
}

}// namespace

Config Config::FromJson(const nlohmann::json& config_json) {
    if (!config_json.is_object()) {
        throw ConfigError("configuration must be a JSON object");
    }

    Config config;
    try {
        if (config_json.contains("default_temperature")) {
            config.default_temperature = config_json.at("default_temperature").get<double>();
        }
        if (config_json.contains("default_max_tokens")) {
            config.default_max_tokens = ParseInt(config_json.at("default_max_tokens"), "default_max_tokens");
        }
        if (config_json.contains("invoke_timeout_ms")) {
            config.invoke_timeout = ParseTimeout(config_json.at("invoke_timeout_ms"), "invoke_timeout_ms");
        }
        if (config_json.contains("retrieve_timeout_ms")) {
            config.retrieve_timeout = ParseTimeout(config_json.at("retrieve_timeout_ms"), "retrieve_timeout_ms");
        }
        if (config_json.contains("context_template")) {
            config.context_template = config_json.at("context_template").get<std::string>();
        }
        if (config_json.contains("verbose")) {
            config.verbose = config_json.at("verbose").get<bool>();
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(fmt::format("invalid configuration value: {}", e.what()));
    }
    return config;
}

Config Config::LoadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError(fmt::format("could not open configuration file `{}`", path.string()));
    }

    nlohmann::json config_json;
    try {
        config_json = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError(fmt::format("could not parse `{}`: {}", path.string(), e.what()));
    }
    return FromJson(config_json);
}

void Config::ApplyEnvironment() {
    if (const char* value = std::getenv(ENV_INVOKE_TIMEOUT_MS)) {
        invoke_timeout = ParseTimeout(std::string(value), ENV_INVOKE_TIMEOUT_MS);
    }
    if (const char* value = std::getenv(ENV_RETRIEVE_TIMEOUT_MS)) {
        retrieve_timeout = ParseTimeout(std::string(value), ENV_RETRIEVE_TIMEOUT_MS);
    }
    if (const char* value = std::getenv(ENV_VERBOSE)) {
        std::string flag(value);
        std::transform(flag.begin(), flag.end(), flag.begin(), [](unsigned char c) { return std::tolower(c); });
        verbose = flag == "1" || flag == "true" || flag == "on" || flag == "yes";
    }
}

nlohmann::json Config::ToJson() const {
    return {{"default_temperature", default_temperature},
            {"default_max_tokens", default_max_tokens},
            {"invoke_timeout_ms", invoke_timeout.count()},
            {"retrieve_timeout_ms", retrieve_timeout.count()},
            {"context_template", context_template},
            {"verbose", verbose}};
}

std::chrono::milliseconds Config::ParseTimeout(const nlohmann::json& value, const std::string& key) {
    if (!value.is_number_integer() || value.get<int64_t>() < 0) {
        throw ConfigError(fmt::format("`{}` must be a non-negative integer", key));
    }
    return std::chrono::milliseconds(value.get<int64_t>());
}

std::chrono::milliseconds Config::ParseTimeout(const std::string& value, const std::string& key) {
    try {
        size_t consumed = 0;
        const auto parsed = std::stoll(value, &consumed);
        if (consumed == value.size() && parsed >= 0) {
            return std::chrono::milliseconds(parsed);
        }
    } catch (const std::logic_error&) {
        // reported below
    }
    throw ConfigError(fmt::format("`{}` must be a non-negative integer, got `{}`", key, value));
}

}// namespace promptline
