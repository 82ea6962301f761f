#pragma once

#include "promptline/core/common.hpp"
#include <filesystem>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace promptline {

constexpr auto DEFAULT_CONTEXT_TEMPLATE =
        "Use the following context to answer.\n"
        "\n"
        "## Context\n"
        "{{CONTEXT}}\n"
        "\n"
        "## Question\n"
        "{{USER_PROMPT}}";

class Config {
public:
    double default_temperature = 1.0;
    int default_max_tokens = 100;
    std::chrono::milliseconds invoke_timeout{0};
    std::chrono::milliseconds retrieve_timeout{0};
    std::string context_template = DEFAULT_CONTEXT_TEMPLATE;
    bool verbose = false;

    static Config FromJson(const nlohmann::json& config_json);
    static Config LoadFromFile(const std::filesystem::path& path);

    // Overrides fields from PROMPTLINE_* environment variables.
    void ApplyEnvironment();

    nlohmann::json ToJson() const;

    static constexpr auto ENV_INVOKE_TIMEOUT_MS = "PROMPTLINE_INVOKE_TIMEOUT_MS";
    static constexpr auto ENV_RETRIEVE_TIMEOUT_MS = "PROMPTLINE_RETRIEVE_TIMEOUT_MS";
    static constexpr auto ENV_VERBOSE = "PROMPTLINE_VERBOSE";

private:
    static std::chrono::milliseconds ParseTimeout(const nlohmann::json& value, const std::string& key);
    static std::chrono::milliseconds ParseTimeout(const std::string& value, const std::string& key);
};

}// namespace promptline
