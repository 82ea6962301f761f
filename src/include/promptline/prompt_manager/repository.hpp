#pragma once

#include "promptline/core/common.hpp"
#include <unordered_map>

namespace promptline {

enum class PromptSection { USER_PROMPT,
                           CONTEXT };

enum class ContextFormat { PLAIN,
                           XML,
                           JSON,
                           Markdown };

inline std::unordered_map<std::string, ContextFormat> CONTEXT_FORMAT = {
        {"PLAIN", ContextFormat::PLAIN},
        {"XML", ContextFormat::XML},
        {"JSON", ContextFormat::JSON},
        {"MARKDOWN", ContextFormat::Markdown}};

ContextFormat stringToContextFormat(const std::string& format);

constexpr auto FEW_SHOT_INPUT_LABEL = "Input: ";
constexpr auto FEW_SHOT_OUTPUT_LABEL = "Output:";
constexpr auto FEW_SHOT_SEPARATOR = "\n\n";

}// namespace promptline
