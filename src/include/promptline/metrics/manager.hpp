#pragma once

#include "promptline/metrics/base_manager.hpp"
#include "promptline/metrics/types.hpp"
#include <mutex>

namespace promptline {

// Thread-safe metrics store owned by a Pipeline (or any host) and shared with
// the components it wires together
class MetricsManager : private BaseMetricsManager<std::string> {
public:
    // Record a finished stage; durations are in milliseconds
    void RecordCall(const std::string& model_id, PipelineStage stage, double duration_ms, bool failed);

    // Record documents returned by a retrieval (accumulative)
    void AddDocuments(const std::string& model_id, int64_t documents);

    // Record observer failures reported by a publish (accumulative)
    void AddObserverErrors(const std::string& model_id, int64_t observer_errors);

    nlohmann::json GetMetrics() const;

    // Raw counters for one stage of one model; zeroed if nothing was recorded
    StageMetricsData GetStageMetrics(const std::string& model_id, PipelineStage stage) const;

    void Reset();

    static double ElapsedMs(std::chrono::steady_clock::time_point start) {
        return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    }

private:
    mutable std::mutex mutex_;
};

}// namespace promptline
