#pragma once

#include "promptline/core/cancellation.hpp"
#include "promptline/core/common.hpp"
#include "promptline/core/types.hpp"

namespace promptline {

// Turns a query into supporting documents, most relevant first. An empty
// result means "no context available" and is not an error; a strategy that
// cannot retrieve at all throws RetrievalError.
class IRetrievalStrategy {
public:
    virtual ~IRetrievalStrategy() = default;

    // Must be deterministic for a given query and strategy state. Long-running
    // implementations should poll `token` and stop once it expires.
    virtual std::vector<Document> Retrieve(const std::string& query, const CancellationToken& token) = 0;

    virtual std::string GetName() const = 0;
};

// Returns the same documents for every query
class StaticRetrievalStrategy : public IRetrievalStrategy {
public:
    explicit StaticRetrievalStrategy(std::vector<Document> documents) : documents_(std::move(documents)) {}

    std::vector<Document> Retrieve(const std::string& query, const CancellationToken& token) override;
    std::string GetName() const override { return "static"; }

private:
    const std::vector<Document> documents_;
};

// Keeps the corpus documents whose text contains a keyword, in corpus order.
// Without a fixed keyword the query itself is the keyword. Matching ignores
// case.
class KeywordRetrievalStrategy : public IRetrievalStrategy {
public:
    explicit KeywordRetrievalStrategy(std::vector<Document> corpus, std::optional<std::string> keyword = std::nullopt)
        : corpus_(std::move(corpus)), keyword_(std::move(keyword)) {}

    std::vector<Document> Retrieve(const std::string& query, const CancellationToken& token) override;
    std::string GetName() const override { return "keyword"; }

private:
    const std::vector<Document> corpus_;
    const std::optional<std::string> keyword_;
};

}// namespace promptline
