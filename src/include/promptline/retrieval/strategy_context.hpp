#pragma once

#include "promptline/retrieval/strategy.hpp"
#include <mutex>

namespace promptline {

// Holds the one active retrieval strategy. SetStrategy takes effect on the
// next Retrieve; a Retrieve already running keeps the strategy it started with.
class StrategyContext {
public:
    explicit StrategyContext(std::shared_ptr<IRetrievalStrategy> strategy = nullptr);

    StrategyContext(const StrategyContext&) = delete;
    StrategyContext& operator=(const StrategyContext&) = delete;

    void SetStrategy(std::shared_ptr<IRetrievalStrategy> strategy);
    std::shared_ptr<IRetrievalStrategy> GetStrategy() const;
    bool HasStrategy() const;

    std::vector<Document> Retrieve(const std::string& query, const CancellationToken& token = CancellationToken()) const;

private:
    mutable std::mutex mutex_;
    std::shared_ptr<IRetrievalStrategy> strategy_;
};

}// namespace promptline
