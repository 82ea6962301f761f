#include "promptline/prompt_manager/request_builder.hpp"
#include "promptline/core/errors.hpp"
#include "promptline/prompt_manager/prompt_manager.hpp"
#include <cmath>

namespace promptline {

RequestBuilder::RequestBuilder(const Config& config)
    : default_temperature_(config.default_temperature), default_max_tokens_(config.default_max_tokens),
      temperature_(config.default_temperature), max_tokens_(config.default_max_tokens) {}

RequestBuilder& RequestBuilder::SetPrompt(std::string prompt) {
    prompt_ = std::move(prompt);
    return *this;
}

RequestBuilder& RequestBuilder::SetTemperature(double temperature) {
    temperature_ = temperature;
    return *this;
}

RequestBuilder& RequestBuilder::SetMaxTokens(int max_tokens) {
    max_tokens_ = max_tokens;
    return *this;
}

RequestBuilder& RequestBuilder::AddExample(std::string input, std::string output) {
    examples_.push_back({std::move(input), std::move(output)});
    return *this;
}

RequestBuilder& RequestBuilder::AddExamples(const std::vector<Example>& examples) {
    examples_.insert(examples_.end(), examples.begin(), examples.end());
    return *this;
}

RequestBuilder& RequestBuilder::Reset() {
    prompt_.clear();
    temperature_ = default_temperature_;
    max_tokens_ = default_max_tokens_;
    examples_.clear();
    return *this;
}

Request RequestBuilder::Build() const {
    if (prompt_.empty()) {
        throw InvalidRequestError("The prompt cannot be empty");
    }
    if (std::isnan(temperature_) || temperature_ < MIN_TEMPERATURE || temperature_ > MAX_TEMPERATURE) {
        throw InvalidRequestError(
                fmt::format("temperature must be within [{}, {}], got {}", MIN_TEMPERATURE, MAX_TEMPERATURE, temperature_));
    }
    if (max_tokens_ <= 0) {
        throw InvalidRequestError(fmt::format("max_tokens must be positive, got {}", max_tokens_));
    }

    return Request(PromptManager::ConstructFewShotPrompt(examples_, prompt_), temperature_, max_tokens_);
}

}// namespace promptline
