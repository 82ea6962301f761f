#include "promptline/retrieval/strategy_context.hpp"

namespace promptline {

StrategyContext::StrategyContext(std::shared_ptr<IRetrievalStrategy> strategy) : strategy_(std::move(strategy)) {}

void StrategyContext::SetStrategy(std::shared_ptr<IRetrievalStrategy> strategy) {
    if (!strategy) {
        throw InvalidArgumentError("StrategyContext", "retrieval strategy cannot be null");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    strategy_ = std::move(strategy);
}

std::shared_ptr<IRetrievalStrategy> StrategyContext::GetStrategy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return strategy_;
}

bool StrategyContext::HasStrategy() const {
    return GetStrategy() != nullptr;
}

std::vector<Document> StrategyContext::Retrieve(const std::string& query, const CancellationToken& token) const {
    auto strategy = GetStrategy();
    if (!strategy) {
        throw RetrievalError("no retrieval strategy is active");
    }

    return RunWithDeadline(
            "StrategyContext", fmt::format("retrieval with `{}`", strategy->GetName()), token,
            [strategy, query, token]() -> std::vector<Document> {
                try {
                    return strategy->Retrieve(query, token);
                } catch (const PipelineError&) {
                    throw;
                } catch (const std::exception& e) {
                    throw RetrievalError(fmt::format("`{}` failed: {}", strategy->GetName(), e.what()));
                } catch (...) {
                    throw RetrievalError(fmt::format("`{}` raised a non-standard exception", strategy->GetName()));
                }
            });
}

}// namespace promptline
