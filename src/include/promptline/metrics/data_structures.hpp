#pragma once

#include "promptline/core/common.hpp"
#include "promptline/metrics/types.hpp"
#include <nlohmann/json.hpp>

namespace promptline {

// Accumulated metrics for one stage of one model
struct StageMetricsData {
    int64_t calls = 0;
    int64_t failures = 0;
    int64_t duration_us = 0;
    int64_t documents = 0;
    int64_t observer_errors = 0;

    double duration_ms() const noexcept {
        return duration_us / 1000.0;
    }

    bool IsEmpty() const noexcept {
        return calls == 0 && failures == 0 && duration_us == 0 && documents == 0 && observer_errors == 0;
    }

    nlohmann::json ToJson(PipelineStage stage) const {
        nlohmann::json result = {
                {"calls", calls},
                {"failures", failures},
                {"duration_ms", duration_ms()}};

        if (stage == PipelineStage::RETRIEVE) {
            result["documents"] = documents;
        }
        if (stage == PipelineStage::PUBLISH) {
            result["observer_errors"] = observer_errors;
        }

        return result;
    }
};

// Metrics for every stage of a single model
class ModelMetrics {
public:
    static constexpr size_t NUM_STAGES = 4;

    StageMetricsData& GetMetrics(PipelineStage stage) {
        return by_stage_[PipelineStageToIndex(stage)];
    }

    const StageMetricsData& GetMetrics(PipelineStage stage) const noexcept {
        return by_stage_[PipelineStageToIndex(stage)];
    }

    bool IsEmpty() const noexcept {
        for (const auto& stage_metrics: by_stage_) {
            if (!stage_metrics.IsEmpty()) {
                return false;
            }
        }
        return true;
    }

private:
    StageMetricsData by_stage_[NUM_STAGES];
};

}// namespace promptline
