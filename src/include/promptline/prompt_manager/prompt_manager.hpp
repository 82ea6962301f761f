#pragma once

#include <fmt/format.h>

#include "promptline/core/common.hpp"
#include "promptline/core/types.hpp"
#include "promptline/prompt_manager/repository.hpp"
#include <nlohmann/json.hpp>

namespace promptline {

class PromptManager {
public:
    static std::string ReplaceSection(const std::string& prompt_template, const PromptSection section,
                                      const std::string& section_content);
    static std::string ReplaceSection(const std::string& prompt_template, const std::string& replace_string,
                                      const std::string& section_content);
    // Substitutes every section in one left-to-right pass over the template;
    // placeholders appearing inside substituted content are left as text
    static std::string ReplaceSections(const std::string& prompt_template,
                                       const std::vector<std::pair<PromptSection, std::string>>& sections);

    template<typename T>
    static std::string ToString(const T element);

    // "Input: <in>\nOutput: <out>" pairs separated by a blank line, then the
    // trailing "Input: <prompt>\nOutput:" cue. No examples: the prompt as is.
    static std::string ConstructFewShotPrompt(const std::vector<Example>& examples, const std::string& prompt);
    static std::string ConstructExample(const Example& example);

    static std::string ConstructContext(const std::vector<Document>& documents, const std::string& context_format = "PLAIN");
    static std::string ConstructContextPlain(const std::vector<Document>& documents);
    static std::string ConstructContextXML(const std::vector<Document>& documents);
    static std::string EscapeXml(const std::string& text);
    static std::string ConstructContextMarkdown(const std::vector<Document>& documents);
    static std::string ConstructContextJSON(const std::vector<Document>& documents);

    static std::string Render(const std::string& prompt_template, const std::string& user_prompt,
                              const std::vector<Document>& documents, const std::string& context_format = "PLAIN") {
        return PromptManager::ReplaceSections(prompt_template,
                                              {{PromptSection::USER_PROMPT, user_prompt},
                                               {PromptSection::CONTEXT, ConstructContext(documents, context_format)}});
    }
};

template<>
std::string PromptManager::ToString<PromptSection>(const PromptSection section);

}// namespace promptline
