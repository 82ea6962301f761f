#include "promptline/notifier/observers.hpp"
#include <fmt/ostream.h>

namespace promptline {

void LoggingObserver::OnEvent(const Result& result) {
    std::lock_guard<std::mutex> lock(mutex_);
    fmt::print(stream_, "{} {}\n", prefix_, result.text);
    if (!stream_) {
        throw std::runtime_error("LoggingObserver: failed to write result to stream");
    }
}

}// namespace promptline
