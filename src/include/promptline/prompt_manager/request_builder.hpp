#pragma once

#include "promptline/core/config.hpp"
#include "promptline/core/types.hpp"

namespace promptline {

constexpr double MIN_TEMPERATURE = 0.0;
constexpr double MAX_TEMPERATURE = 2.0;

// Accumulates request configuration. Setters chain and may be called any
// number of times (scalars: last write wins, examples: appended). Build()
// validates and leaves the builder untouched, so one builder can serve as a
// reusable recipe.
class RequestBuilder {
public:
    RequestBuilder() = default;
    explicit RequestBuilder(const Config& config);

    RequestBuilder& SetPrompt(std::string prompt);
    RequestBuilder& SetTemperature(double temperature);
    RequestBuilder& SetMaxTokens(int max_tokens);
    RequestBuilder& AddExample(std::string input, std::string output);
    RequestBuilder& AddExamples(const std::vector<Example>& examples);

    // Back to the defaults this builder was constructed with
    RequestBuilder& Reset();

    Request Build() const;

    const std::vector<Example>& examples() const noexcept { return examples_; }

private:
    double default_temperature_ = 1.0;
    int default_max_tokens_ = 100;

    std::string prompt_;
    double temperature_ = 1.0;
    int max_tokens_ = 100;
    std::vector<Example> examples_;
};

}// namespace promptline
