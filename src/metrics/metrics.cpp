#include "promptline/metrics/manager.hpp"

namespace promptline {

void MetricsManager::RecordCall(const std::string& model_id, PipelineStage stage, double duration_ms, bool failed) {
    const int64_t duration_us = static_cast<int64_t>(duration_ms * 1000.0);
    std::lock_guard<std::mutex> lock(mutex_);
    BaseMetricsManager<std::string>::RecordCall(model_id, stage, duration_us, failed);
}

void MetricsManager::AddDocuments(const std::string& model_id, int64_t documents) {
    std::lock_guard<std::mutex> lock(mutex_);
    BaseMetricsManager<std::string>::AddDocuments(model_id, documents);
}

void MetricsManager::AddObserverErrors(const std::string& model_id, int64_t observer_errors) {
    std::lock_guard<std::mutex> lock(mutex_);
    BaseMetricsManager<std::string>::AddObserverErrors(model_id, observer_errors);
}

nlohmann::json MetricsManager::GetMetrics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return BaseMetricsManager<std::string>::GetMetrics();
}

StageMetricsData MetricsManager::GetStageMetrics(const std::string& model_id, PipelineStage stage) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = model_metrics_.find(model_id);
    if (it == model_metrics_.end()) {
        return {};
    }
    return it->second.GetMetrics(stage);
}

void MetricsManager::Reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    BaseMetricsManager<std::string>::Reset();
}

}// namespace promptline
