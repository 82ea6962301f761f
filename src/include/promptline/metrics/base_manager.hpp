#pragma once

#include "promptline/metrics/data_structures.hpp"
#include <algorithm>
#include <cstdint>
#include <fmt/format.h>
#include <unordered_map>

namespace promptline {

// Core metrics bookkeeping keyed by an arbitrary formattable key (a model id
// in practice). Not synchronized; MetricsManager adds the locking.
template<typename Key>
class BaseMetricsManager {
public:
    ModelMetrics& GetModelMetrics(const Key& key) {
        auto it = model_metrics_.find(key);
        if (it != model_metrics_.end()) {
            return it->second;
        }

        registration_order_[key] = ++registration_counter_;
        return model_metrics_[key];
    }

    // Count one call of `stage` for `key` (accumulative)
    void RecordCall(const Key& key, PipelineStage stage, int64_t duration_us, bool failed) {
        auto& metrics = GetModelMetrics(key).GetMetrics(stage);
        metrics.calls++;
        metrics.duration_us += duration_us;
        if (failed) {
            metrics.failures++;
        }
    }

    void AddDocuments(const Key& key, int64_t documents) {
        GetModelMetrics(key).GetMetrics(PipelineStage::RETRIEVE).documents += documents;
    }

    void AddObserverErrors(const Key& key, int64_t observer_errors) {
        GetModelMetrics(key).GetMetrics(PipelineStage::PUBLISH).observer_errors += observer_errors;
    }

    // Flattened metrics keyed "<stage>_<key>", ordered by stage then by the
    // order in which keys were first seen
    nlohmann::json GetMetrics() const {
        nlohmann::json result = nlohmann::json::object();

        struct MetricEntry {
            PipelineStage stage;
            size_t registration_order;
            std::string key;
            StageMetricsData metrics;
        };

        std::vector<MetricEntry> entries;
        for (const auto& [key, model_metrics]: model_metrics_) {
            if (model_metrics.IsEmpty()) {
                continue;
            }
            for (size_t i = 0; i < ModelMetrics::NUM_STAGES - 1; ++i) {
                const auto stage = static_cast<PipelineStage>(i);
                const auto& metrics = model_metrics.GetMetrics(stage);
                if (!metrics.IsEmpty()) {
                    entries.push_back({stage, registration_order_.at(key), fmt::format("{}", key), metrics});
                }
            }
        }

        std::sort(entries.begin(), entries.end(), [](const MetricEntry& a, const MetricEntry& b) {
            if (a.stage != b.stage) {
                return a.stage < b.stage;
            }
            return a.registration_order < b.registration_order;
        });

        for (const auto& entry: entries) {
            auto metrics_json = entry.metrics.ToJson(entry.stage);
            metrics_json["model_id"] = entry.key;
            result[fmt::format("{}_{}", PipelineStageToString(entry.stage), entry.key)] = std::move(metrics_json);
        }

        return result;
    }

    // Clear all metrics and registration tracking
    void Reset() {
        model_metrics_.clear();
        registration_order_.clear();
        registration_counter_ = 0;
    }

protected:
    std::unordered_map<Key, ModelMetrics> model_metrics_;
    std::unordered_map<Key, size_t> registration_order_;
    size_t registration_counter_ = 0;
};

}// namespace promptline
