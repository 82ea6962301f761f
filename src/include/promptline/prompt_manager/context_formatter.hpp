#pragma once

#include "promptline/core/config.hpp"
#include "promptline/core/types.hpp"

namespace promptline {

// Policy mapping retrieved documents into the prompt text
class IContextFormatter {
public:
    virtual ~IContextFormatter() = default;
    virtual std::string Format(const std::string& query, const std::vector<Document>& documents) const = 0;
};

// Fills {{USER_PROMPT}} and {{CONTEXT}} of a template. With no documents the
// query is passed through untouched.
class TemplateContextFormatter : public IContextFormatter {
public:
    explicit TemplateContextFormatter(std::string prompt_template = DEFAULT_CONTEXT_TEMPLATE,
                                      std::string context_format = "PLAIN");

    std::string Format(const std::string& query, const std::vector<Document>& documents) const override;

    const std::string& prompt_template() const noexcept { return prompt_template_; }
    const std::string& context_format() const noexcept { return context_format_; }

private:
    std::string prompt_template_;
    std::string context_format_;
};

}// namespace promptline
