#include "promptline/core/types.hpp"
#include "promptline/core/errors.hpp"
#include "promptline/prompt_manager/request_builder.hpp"
#include <limits>

namespace promptline {

std::string Document::ToString() const {
    if (score.has_value()) {
        return fmt::format("Document(id={:?}, text={:?}, score={})", id, text, *score);
    }
    return fmt::format("Document(id={:?}, text={:?})", id, text);
}

nlohmann::json Document::ToJson() const {
    nlohmann::json result = {{"id", id}, {"text", text}};
    if (score.has_value()) {
        result["score"] = *score;
    }
    return result;
}

Document Document::FromJson(const nlohmann::json& json) {
    if (!json.is_object() || !json.contains("text") || !json["text"].is_string()) {
        throw InvalidArgumentError("Document", "a document record requires a string `text` field");
    }
    Document document;
    document.id = json.contains("id") && json["id"].is_string() ? json["id"].get<std::string>() : "";
    document.text = json["text"].get<std::string>();
    if (json.contains("score") && json["score"].is_number()) {
        document.score = json["score"].get<double>();
    }
    return document;
}

nlohmann::json Request::GetParameters() const {
    return {{"temperature", temperature_}, {"max_tokens", max_tokens_}};
}

std::string Request::ToString() const {
    return fmt::format("Request(prompt_text={:?}, temperature={}, max_tokens={})", prompt_text_, temperature_,
                       max_tokens_);
}

nlohmann::json Request::ToJson() const {
    return {{"prompt_text", prompt_text_}, {"temperature", temperature_}, {"max_tokens", max_tokens_}};
}

Request Request::FromJson(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw InvalidRequestError("a request record must be a JSON object");
    }
    RequestBuilder builder;
    try {
        builder.SetPrompt(json.value("prompt_text", std::string()));
        if (json.contains("temperature")) {
            builder.SetTemperature(json.at("temperature").get<double>());
        }
        if (json.contains("max_tokens")) {
            const auto& max_tokens = json.at("max_tokens");
            if (!max_tokens.is_number_integer()) {
                throw InvalidRequestError("`max_tokens` must be an integer");
            }
            // wider values would wrap when narrowed to int
            if (max_tokens.is_number_unsigned()
                        ? max_tokens.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int>::max())
                        : max_tokens.get<int64_t>() < std::numeric_limits<int>::min() ||
                                  max_tokens.get<int64_t>() > std::numeric_limits<int>::max()) {
                throw InvalidRequestError(fmt::format("`max_tokens` is out of range, got {}", max_tokens.dump()));
            }
            builder.SetMaxTokens(max_tokens.get<int>());
        }
    } catch (const nlohmann::json::exception& e) {
        throw InvalidRequestError(fmt::format("malformed request record: {}", e.what()));
    }
    return builder.Build();
}

nlohmann::json Result::ToJson() const {
    return {{"text", text}, {"raw", raw}};
}

Result Result::FromJson(const nlohmann::json& json) {
    if (!json.is_object() || !json.contains("text") || !json["text"].is_string()) {
        throw InvalidArgumentError("Result", "a result record requires a string `text` field");
    }
    return {json["text"].get<std::string>(), json.contains("raw") ? json["raw"] : nlohmann::json()};
}

}// namespace promptline
