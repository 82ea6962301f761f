#include "promptline/pipeline/pipeline.hpp"

namespace promptline {

Pipeline::Pipeline(Config config, std::shared_ptr<AdapterRegistry> registry,
                   std::shared_ptr<StrategyContext> strategy_context, std::shared_ptr<ResultNotifier> notifier)
    : config_(std::move(config)),
      metrics_(std::make_shared<MetricsManager>()),
      registry_(registry ? std::move(registry) : std::make_shared<AdapterRegistry>()),
      strategy_context_(strategy_context ? std::move(strategy_context) : std::make_shared<StrategyContext>()),
      notifier_(notifier ? std::move(notifier) : std::make_shared<ResultNotifier>()),
      formatter_(std::make_shared<TemplateContextFormatter>(config_.context_template)) {}

void Pipeline::SetFormatter(std::shared_ptr<IContextFormatter> formatter) {
    if (!formatter) {
        throw InvalidArgumentError("Pipeline", "context formatter cannot be null");
    }
    std::lock_guard<std::mutex> lock(policy_mutex_);
    formatter_ = std::move(formatter);
}

void Pipeline::SetExamples(std::vector<Example> examples) {
    std::lock_guard<std::mutex> lock(policy_mutex_);
    examples_ = std::move(examples);
}

Result Pipeline::Handle(const std::string& query, const std::string& model_id, const CancellationToken& token) {
    return HandleDetailed(query, model_id, token).result;
}

PipelineResponse Pipeline::HandleDetailed(const std::string& query, const std::string& model_id,
                                          const CancellationToken& token) {
    token.ThrowIfExpired("Pipeline", "request");
    // unknown ids are rejected before they can reach the metrics
    if (!registry_->Contains(model_id)) {
        throw UnknownModelError(model_id);
    }

    auto documents = RetrieveStage(query, model_id, token);
    token.ThrowIfExpired("Pipeline", "request");

    auto request = BuildStage(query, documents);
    Trace(fmt::format("built {}", request.ToString()));

    auto result = InvokeStage(model_id, request, token);
    Trace(fmt::format("`{}` answered with {} characters", model_id, result.text.size()));

    // cancelled while the backend was running: nothing may be published
    token.ThrowIfExpired("Pipeline", "request");

    auto publish_outcome = PublishStage(result, model_id);
    return {std::move(result), std::move(request), std::move(documents), std::move(publish_outcome)};
}

std::vector<Document> Pipeline::RetrieveStage(const std::string& query, const std::string& model_id,
                                              const CancellationToken& token) {
    const auto start = std::chrono::steady_clock::now();
    try {
        auto documents = strategy_context_->Retrieve(query, token.Restrict(config_.retrieve_timeout));
        metrics_->RecordCall(model_id, PipelineStage::RETRIEVE, MetricsManager::ElapsedMs(start), false);
        metrics_->AddDocuments(model_id, static_cast<int64_t>(documents.size()));
        Trace(fmt::format("retrieved {} document(s) for `{}`", documents.size(), model_id));
        return documents;
    } catch (const PipelineError& e) {
        metrics_->RecordCall(model_id, PipelineStage::RETRIEVE, MetricsManager::ElapsedMs(start), true);
        Trace(e.what());
        throw;
    }
}

Result Pipeline::InvokeStage(const std::string& model_id, const Request& request, const CancellationToken& token) {
    const auto start = std::chrono::steady_clock::now();
    try {
        auto result = registry_->Invoke(model_id, request, token.Restrict(config_.invoke_timeout));
        metrics_->RecordCall(model_id, PipelineStage::INVOKE, MetricsManager::ElapsedMs(start), false);
        return result;
    } catch (const UnknownModelError& e) {
        // unregistered since the check in HandleDetailed
        Trace(e.what());
        throw;
    } catch (const PipelineError& e) {
        metrics_->RecordCall(model_id, PipelineStage::INVOKE, MetricsManager::ElapsedMs(start), true);
        Trace(e.what());
        throw;
    }
}

Request Pipeline::BuildStage(const std::string& query, const std::vector<Document>& documents) const {
    std::shared_ptr<IContextFormatter> formatter;
    RequestBuilder builder(config_);
    {
        std::lock_guard<std::mutex> lock(policy_mutex_);
        formatter = formatter_;
        builder.AddExamples(examples_);
    }
    builder.SetPrompt(formatter->Format(query, documents));
    return builder.Build();
}

PublishOutcome Pipeline::PublishStage(const Result& result, const std::string& model_id) {
    const auto start = std::chrono::steady_clock::now();
    auto outcome = notifier_->Publish(result);
    metrics_->RecordCall(model_id, PipelineStage::PUBLISH, MetricsManager::ElapsedMs(start), !outcome.Succeeded());
    metrics_->AddObserverErrors(model_id, static_cast<int64_t>(outcome.errors.size()));
    Trace(fmt::format("published to {} observer(s), {} failed", outcome.delivered, outcome.errors.size()));
    return outcome;
}

void Pipeline::Trace(const std::string& message) const {
    if (config_.verbose) {
        std::cerr << "[Pipeline] " << message << '\n';
    }
}

}// namespace promptline
