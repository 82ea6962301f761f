#pragma once

#include "promptline/core/types.hpp"
#include "promptline/notifier/notifier.hpp"
#include <ostream>

namespace promptline {

using ResultObserver = IObserver<Result>;
using ResultNotifier = Notifier<Result>;

// Writes every result it receives to a stream, one line per result
class LoggingObserver : public ResultObserver {
public:
    explicit LoggingObserver(std::ostream& stream = std::clog, std::string prefix = "[Result]")
        : stream_(stream), prefix_(std::move(prefix)) {}

    void OnEvent(const Result& result) override;

private:
    std::mutex mutex_;
    std::ostream& stream_;
    std::string prefix_;
};

}// namespace promptline
