#pragma once

#include "promptline/core/cancellation.hpp"
#include "promptline/core/config.hpp"
#include "promptline/metrics/manager.hpp"
#include "promptline/model_manager/adapter_registry.hpp"
#include "promptline/notifier/observers.hpp"
#include "promptline/prompt_manager/context_formatter.hpp"
#include "promptline/prompt_manager/request_builder.hpp"
#include "promptline/retrieval/strategy_context.hpp"

namespace promptline {

struct PipelineResponse {
    Result result;
    Request request;
    std::vector<Document> documents;
    PublishOutcome publish_outcome;
};

// Composition root: retrieve -> build -> invoke -> publish. Handle may be
// called from many threads at once on the same instance. Metrics are recorded
// in the pipeline's own MetricsManager, so pipelines sharing a registry keep
// separate counts.
class Pipeline {
public:
    explicit Pipeline(Config config = Config(),
                      std::shared_ptr<AdapterRegistry> registry = nullptr,
                      std::shared_ptr<StrategyContext> strategy_context = nullptr,
                      std::shared_ptr<ResultNotifier> notifier = nullptr);

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    // Either returns the result or throws exactly one abort-class error;
    // observer failures never reach the caller
    Result Handle(const std::string& query, const std::string& model_id,
                  const CancellationToken& token = CancellationToken());
    PipelineResponse HandleDetailed(const std::string& query, const std::string& model_id,
                                    const CancellationToken& token = CancellationToken());

    void SetFormatter(std::shared_ptr<IContextFormatter> formatter);
    void SetExamples(std::vector<Example> examples);

    AdapterRegistry& GetAdapterRegistry() { return *registry_; }
    StrategyContext& GetStrategyContext() { return *strategy_context_; }
    ResultNotifier& GetNotifier() { return *notifier_; }
    MetricsManager& GetMetrics() { return *metrics_; }
    const Config& GetConfig() const { return config_; }

private:
    std::vector<Document> RetrieveStage(const std::string& query, const std::string& model_id,
                                        const CancellationToken& token);
    Request BuildStage(const std::string& query, const std::vector<Document>& documents) const;
    Result InvokeStage(const std::string& model_id, const Request& request, const CancellationToken& token);
    PublishOutcome PublishStage(const Result& result, const std::string& model_id);

    void Trace(const std::string& message) const;

    const Config config_;
    std::shared_ptr<MetricsManager> metrics_;
    std::shared_ptr<AdapterRegistry> registry_;
    std::shared_ptr<StrategyContext> strategy_context_;
    std::shared_ptr<ResultNotifier> notifier_;

    mutable std::mutex policy_mutex_;
    std::shared_ptr<IContextFormatter> formatter_;
    std::vector<Example> examples_;
};

}// namespace promptline
