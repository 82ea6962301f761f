#include "promptline/retrieval/strategy.hpp"
#include <algorithm>
#include <cctype>

namespace promptline {

namespace {

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return std::tolower(c); });
    return value;
}

}// namespace

std::vector<Document> StaticRetrievalStrategy::Retrieve(const std::string& query, const CancellationToken& token) {
    token.ThrowIfExpired("StaticRetrievalStrategy", "retrieval");
    return documents_;
}

std::vector<Document> KeywordRetrievalStrategy::Retrieve(const std::string& query, const CancellationToken& token) {
    const auto keyword = ToLower(keyword_.value_or(query));
    std::vector<Document> matches;
    if (keyword.empty()) {
        return matches;
    }

    for (const auto& document: corpus_) {
        token.ThrowIfExpired("KeywordRetrievalStrategy", "retrieval");
        if (ToLower(document.text).find(keyword) != std::string::npos) {
            matches.push_back(document);
        }
    }
    return matches;
}

}// namespace promptline
