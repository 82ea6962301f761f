#pragma once

#include "promptline/core/common.hpp"
#include <nlohmann/json.hpp>

namespace promptline {

struct Document {
    std::string id;
    std::string text;
    std::optional<double> score;

    bool operator==(const Document& other) const {
        return id == other.id && text == other.text && score == other.score;
    }
    bool operator!=(const Document& other) const { return !(*this == other); }

    std::string ToString() const;
    nlohmann::json ToJson() const;
    static Document FromJson(const nlohmann::json& json);
};

// A single few-shot demonstration.
struct Example {
    std::string input;
    std::string output;

    bool operator==(const Example& other) const { return input == other.input && output == other.output; }
    bool operator!=(const Example& other) const { return !(*this == other); }
};

class RequestBuilder;

// Fully assembled unit sent to a backend. Only RequestBuilder constructs one,
// so every Request in circulation has passed validation.
class Request {
public:
    const std::string& prompt_text() const noexcept { return prompt_text_; }
    double temperature() const noexcept { return temperature_; }
    int max_tokens() const noexcept { return max_tokens_; }

    bool operator==(const Request& other) const {
        return prompt_text_ == other.prompt_text_ && temperature_ == other.temperature_ &&
               max_tokens_ == other.max_tokens_;
    }
    bool operator!=(const Request& other) const { return !(*this == other); }

    // Generation parameters as handed to backend operations.
    nlohmann::json GetParameters() const;

    std::string ToString() const;
    nlohmann::json ToJson() const;
    // Validates through RequestBuilder, so a malformed record raises
    // InvalidRequestError.
    static Request FromJson(const nlohmann::json& json);

private:
    friend class RequestBuilder;

    Request(std::string prompt_text, double temperature, int max_tokens)
        : prompt_text_(std::move(prompt_text)), temperature_(temperature), max_tokens_(max_tokens) {}

    std::string prompt_text_;
    double temperature_;
    int max_tokens_;
};

struct Result {
    std::string text;
    nlohmann::json raw;

    bool operator==(const Result& other) const { return text == other.text && raw == other.raw; }
    bool operator!=(const Result& other) const { return !(*this == other); }

    nlohmann::json ToJson() const;
    static Result FromJson(const nlohmann::json& json);
};

}// namespace promptline
