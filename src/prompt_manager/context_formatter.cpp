#include "promptline/prompt_manager/context_formatter.hpp"
#include "promptline/core/errors.hpp"
#include "promptline/prompt_manager/prompt_manager.hpp"

namespace promptline {

TemplateContextFormatter::TemplateContextFormatter(std::string prompt_template, std::string context_format)
    : prompt_template_(std::move(prompt_template)), context_format_(std::move(context_format)) {
    // fail at construction on an unknown format, not on the first request
    stringToContextFormat(context_format_);
    if (prompt_template_.find(PromptManager::ToString(PromptSection::USER_PROMPT)) == std::string::npos) {
        throw InvalidArgumentError("TemplateContextFormatter", "template must contain {{USER_PROMPT}}");
    }
}

std::string TemplateContextFormatter::Format(const std::string& query, const std::vector<Document>& documents) const {
    if (documents.empty()) {
        return query;
    }
    return PromptManager::Render(prompt_template_, query, documents, context_format_);
}

}// namespace promptline
