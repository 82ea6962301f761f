#include "promptline/prompt_manager/prompt_manager.hpp"
#include "promptline/core/errors.hpp"
#include <algorithm>
#include <cctype>

namespace promptline {

ContextFormat stringToContextFormat(const std::string& format) {
    auto upper = format;
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) { return std::toupper(c); });
    auto it = CONTEXT_FORMAT.find(upper);
    if (it == CONTEXT_FORMAT.end()) {
        throw InvalidArgumentError("PromptManager", "Invalid context format provided `" + format + "`");
    }
    return it->second;
}

template<>
std::string PromptManager::ToString<PromptSection>(const PromptSection section) {
    switch (section) {
        case PromptSection::USER_PROMPT:
            return "{{USER_PROMPT}}";
        case PromptSection::CONTEXT:
            return "{{CONTEXT}}";
        default:
            return "";
    }
}

std::string PromptManager::ReplaceSection(const std::string& prompt_template, const PromptSection section,
                                          const std::string& section_content) {
    auto replace_string = PromptManager::ToString(section);
    return PromptManager::ReplaceSection(prompt_template, replace_string, section_content);
}

std::string PromptManager::ReplaceSection(const std::string& prompt_template, const std::string& replace_string,
                                          const std::string& section_content) {
    auto prompt = prompt_template;
    if (replace_string.empty()) {
        return prompt;
    }
    auto replace_string_size = replace_string.size();
    auto replace_pos = prompt.find(replace_string);

    while (replace_pos != std::string::npos) {
        prompt.replace(replace_pos, replace_string_size, section_content);
        replace_pos = prompt.find(replace_string, replace_pos + section_content.size());
    }

    return prompt;
}

std::string PromptManager::ReplaceSections(const std::string& prompt_template,
                                           const std::vector<std::pair<PromptSection, std::string>>& sections) {
    std::vector<std::pair<std::string, const std::string*>> placeholders;
    for (const auto& section: sections) {
        if (PromptManager::ToString(section.first).empty()) {
            continue;
        }
        placeholders.emplace_back(PromptManager::ToString(section.first), &section.second);
    }

    auto prompt = std::string("");
    auto pos = std::size_t{0};
    while (pos < prompt_template.size()) {
        auto next_pos = std::string::npos;
        const std::pair<std::string, const std::string*>* next = nullptr;
        for (const auto& placeholder: placeholders) {
            auto found = prompt_template.find(placeholder.first, pos);
            if (found < next_pos) {
                next_pos = found;
                next = &placeholder;
            }
        }
        if (next == nullptr) {
            break;
        }
        prompt.append(prompt_template, pos, next_pos - pos);
        prompt += *next->second;
        pos = next_pos + next->first.size();
    }
    if (pos < prompt_template.size()) {
        prompt.append(prompt_template, pos, std::string::npos);
    }
    return prompt;
}

std::string PromptManager::ConstructExample(const Example& example) {
    return fmt::format("{}{}\n{} {}", FEW_SHOT_INPUT_LABEL, example.input, FEW_SHOT_OUTPUT_LABEL, example.output);
}

std::string PromptManager::ConstructFewShotPrompt(const std::vector<Example>& examples, const std::string& prompt) {
    if (examples.empty()) {
        return prompt;
    }

    auto few_shot_prompt = std::string("");
    for (const auto& example: examples) {
        few_shot_prompt += ConstructExample(example) + FEW_SHOT_SEPARATOR;
    }
    few_shot_prompt += fmt::format("{}{}\n{}", FEW_SHOT_INPUT_LABEL, prompt, FEW_SHOT_OUTPUT_LABEL);
    return few_shot_prompt;
}

std::string PromptManager::ConstructContextPlain(const std::vector<Document>& documents) {
    auto context = std::string("");
    for (const auto& document: documents) {
        if (document.id.empty()) {
            context += "- " + document.text + "\n";
        } else {
            context += "- [" + document.id + "] " + document.text + "\n";
        }
    }
    return context;
}

std::string PromptManager::EscapeXml(const std::string& text) {
    auto escaped = std::string("");
    escaped.reserve(text.size());
    for (const auto c: text) {
        switch (c) {
            case '&':
                escaped += "&amp;";
                break;
            case '<':
                escaped += "&lt;";
                break;
            case '>':
                escaped += "&gt;";
                break;
            case '"':
                escaped += "&quot;";
                break;
            default:
                escaped += c;
        }
    }
    return escaped;
}

std::string PromptManager::ConstructContextXML(const std::vector<Document>& documents) {
    if (documents.empty()) {
        return "<documents></documents>\n";
    }

    auto context = std::string("<documents>\n");
    for (const auto& document: documents) {
        context += "<document";
        if (!document.id.empty()) {
            context += " id=\"" + EscapeXml(document.id) + "\"";
        }
        if (document.score.has_value()) {
            context += fmt::format(" score=\"{}\"", *document.score);
        }
        context += ">" + EscapeXml(document.text) + "</document>\n";
    }
    context += "</documents>\n";
    return context;
}

std::string PromptManager::ConstructContextMarkdown(const std::vector<Document>& documents) {
    auto context = std::string(" | ID | TEXT | \n | -- | ---- | \n");
    auto document_idx = 1u;
    for (const auto& document: documents) {
        auto id = document.id.empty() ? "DOCUMENT " + std::to_string(document_idx) : document.id;
        context += " | " + id + " | " + document.text + " | \n";
        document_idx++;
    }
    return context;
}

std::string PromptManager::ConstructContextJSON(const std::vector<Document>& documents) {
    auto context_json = nlohmann::json::array();
    for (const auto& document: documents) {
        context_json.push_back(document.ToJson());
    }
    auto context = context_json.dump(4);
    context += "\n";
    return context;
}

std::string PromptManager::ConstructContext(const std::vector<Document>& documents, const std::string& context_format) {
    switch (stringToContextFormat(context_format)) {
        case ContextFormat::PLAIN:
            return ConstructContextPlain(documents);
        case ContextFormat::XML:
            return ConstructContextXML(documents);
        case ContextFormat::Markdown:
            return ConstructContextMarkdown(documents);
        case ContextFormat::JSON:
            return ConstructContextJSON(documents);
        default:
            throw InvalidArgumentError("PromptManager", "Invalid context format provided `" + context_format + "`");
    }
}

}// namespace promptline
