#pragma once

#include <cstddef>
#include <cstdint>

namespace promptline {

enum class PipelineStage : uint8_t {
    RETRIEVE = 0,
    INVOKE = 1,
    PUBLISH = 2,
    UNKNOWN = 3
};

inline constexpr const char* PipelineStageToString(PipelineStage stage) noexcept {
    switch (stage) {
        case PipelineStage::RETRIEVE:
            return "retrieve";
        case PipelineStage::INVOKE:
            return "invoke";
        case PipelineStage::PUBLISH:
            return "publish";
        default:
            return "unknown";
    }
}

inline constexpr size_t PipelineStageToIndex(PipelineStage stage) noexcept {
    return static_cast<size_t>(stage);
}

}// namespace promptline
