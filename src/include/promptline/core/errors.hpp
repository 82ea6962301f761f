#pragma once

#include "promptline/core/common.hpp"
#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace promptline {

// Root of every error raised by the pipeline.
class PipelineError : public std::runtime_error {
public:
    PipelineError(const std::string& component, const std::string& reason)
        : std::runtime_error(fmt::format("[{}] error. Reason: {}", component, reason)),
          component_(component), reason_(reason) {}

    const std::string& component() const noexcept { return component_; }
    const std::string& reason() const noexcept { return reason_; }

private:
    std::string component_;
    std::string reason_;
};

class DuplicateModelError : public PipelineError {
public:
    explicit DuplicateModelError(const std::string& model_id)
        : PipelineError("AdapterRegistry", fmt::format("model `{}` is already registered", model_id)),
          model_id_(model_id) {}

    const std::string& model_id() const noexcept { return model_id_; }

private:
    std::string model_id_;
};

class UnknownModelError : public PipelineError {
public:
    explicit UnknownModelError(const std::string& model_id)
        : PipelineError("AdapterRegistry", fmt::format("model `{}` is not registered", model_id)),
          model_id_(model_id) {}

    const std::string& model_id() const noexcept { return model_id_; }

private:
    std::string model_id_;
};

// Backend-reported failure. `detail` holds whatever the backend produced:
// its error payload, or the exception text when it threw.
class BackendError : public PipelineError {
public:
    BackendError(const std::string& model_id, const std::string& reason, nlohmann::json detail = nullptr)
        : PipelineError("ModelBackend", fmt::format("`{}`: {}", model_id, reason)),
          model_id_(model_id), detail_(std::move(detail)) {}

    const std::string& model_id() const noexcept { return model_id_; }
    const nlohmann::json& detail() const noexcept { return detail_; }

private:
    std::string model_id_;
    nlohmann::json detail_;
};

class RetrievalError : public PipelineError {
public:
    explicit RetrievalError(const std::string& reason) : PipelineError("Retrieval", reason) {}
};

class InvalidRequestError : public PipelineError {
public:
    explicit InvalidRequestError(const std::string& reason) : PipelineError("RequestBuilder", reason) {}
};

class TimeoutError : public PipelineError {
public:
    TimeoutError(const std::string& component, const std::string& reason) : PipelineError(component, reason) {}
};

class InvalidArgumentError : public PipelineError {
public:
    InvalidArgumentError(const std::string& component, const std::string& reason) : PipelineError(component, reason) {}
};

class ConfigError : public PipelineError {
public:
    explicit ConfigError(const std::string& reason) : PipelineError("Config", reason) {}
};

// Failure of a single observer during publish. Collected in the publish
// outcome, never thrown to the publisher.
class ObserverError : public PipelineError {
public:
    ObserverError(uint64_t observer_id, const std::string& reason)
        : PipelineError("Notifier", fmt::format("observer #{} failed: {}", observer_id, reason)),
          observer_id_(observer_id) {}

    uint64_t observer_id() const noexcept { return observer_id_; }

private:
    uint64_t observer_id_;
};

}// namespace promptline
