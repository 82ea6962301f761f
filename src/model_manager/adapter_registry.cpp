#include "promptline/model_manager/adapter_registry.hpp"
#include <algorithm>
#include <mutex>

namespace promptline {

void AdapterRegistry::Register(const std::string& model_id, std::shared_ptr<IModelBackend> backend,
                               const std::string& entry_point) {
    if (!backend) {
        throw InvalidArgumentError("AdapterRegistry", fmt::format("backend for `{}` is null", model_id));
    }
    auto operation = backend->FindOperation(entry_point);
    if (!operation.has_value() || !*operation) {
        throw InvalidArgumentError("AdapterRegistry",
                                   fmt::format("backend for `{}` exposes no operation named `{}`", model_id,
                                               entry_point));
    }
    AddBinding({model_id, entry_point, std::move(backend), std::move(*operation)});
}

void AdapterRegistry::Register(const std::string& model_id, IModelBackend::Operation operation) {
    if (!operation) {
        throw InvalidArgumentError("AdapterRegistry", fmt::format("operation for `{}` is empty", model_id));
    }
    AddBinding({model_id, CALLABLE_ENTRY_POINT, nullptr, std::move(operation)});
}

void AdapterRegistry::AddBinding(AdapterBinding binding) {
    if (binding.model_id.empty()) {
        throw InvalidArgumentError("AdapterRegistry", "model id cannot be empty");
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (bindings_.find(binding.model_id) != bindings_.end()) {
        throw DuplicateModelError(binding.model_id);
    }
    auto model_id = binding.model_id;
    bindings_.emplace(std::move(model_id), std::move(binding));
}

bool AdapterRegistry::Unregister(const std::string& model_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return bindings_.erase(model_id) > 0;
}

bool AdapterRegistry::Contains(const std::string& model_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return bindings_.find(model_id) != bindings_.end();
}

std::vector<std::string> AdapterRegistry::GetModelIds() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> model_ids;
    model_ids.reserve(bindings_.size());
    for (const auto& [model_id, binding]: bindings_) {
        model_ids.push_back(model_id);
    }
    std::sort(model_ids.begin(), model_ids.end());
    return model_ids;
}

size_t AdapterRegistry::Size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return bindings_.size();
}

void AdapterRegistry::SetMetricsManager(std::shared_ptr<MetricsManager> metrics) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    metrics_ = std::move(metrics);
}

AdapterBinding AdapterRegistry::FindBinding(const std::string& model_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = bindings_.find(model_id);
    if (it == bindings_.end()) {
        throw UnknownModelError(model_id);
    }
    return it->second;
}

Result AdapterRegistry::Invoke(const std::string& model_id, const std::string& prompt,
                               const CancellationToken& token) const {
    return Dispatch(FindBinding(model_id), prompt, nlohmann::json::object(), token);
}

Result AdapterRegistry::Invoke(const std::string& model_id, const Request& request,
                               const CancellationToken& token) const {
    return Dispatch(FindBinding(model_id), request.prompt_text(), request.GetParameters(), token);
}

Result AdapterRegistry::Dispatch(const AdapterBinding& binding, const std::string& prompt,
                                 const nlohmann::json& parameters, const CancellationToken& token) const {
    std::shared_ptr<MetricsManager> metrics;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        metrics = metrics_;
    }

    const auto start = std::chrono::steady_clock::now();
    try {
        // The worker owns copies of everything it touches so an abandoned
        // call cannot outlive its inputs.
        auto payload = RunWithDeadline(
                "AdapterRegistry", fmt::format("invoke of `{}`", binding.model_id), token,
                [binding, prompt, parameters]() -> nlohmann::json {
                    try {
                        return binding.operation(prompt, parameters);
                    } catch (const PipelineError&) {
                        throw;
                    } catch (const std::exception& e) {
                        throw BackendError(binding.model_id, e.what(), e.what());
                    } catch (...) {
                        throw BackendError(binding.model_id, "backend raised a non-standard exception");
                    }
                });
        CheckPayload(binding, payload);
        Result result{ExtractText(payload), std::move(payload)};
        if (metrics) {
            metrics->RecordCall(binding.model_id, PipelineStage::INVOKE, MetricsManager::ElapsedMs(start), false);
        }
        return result;
    } catch (const PipelineError&) {
        if (metrics) {
            metrics->RecordCall(binding.model_id, PipelineStage::INVOKE, MetricsManager::ElapsedMs(start), true);
        }
        throw;
    }
}

void AdapterRegistry::CheckPayload(const AdapterBinding& binding, const nlohmann::json& payload) {
    if (payload.is_null()) {
        throw BackendError(binding.model_id, "backend returned an empty response");
    }
    if (payload.is_object() && payload.contains("error") && !payload["error"].is_null()) {
        const auto& error = payload["error"];
        std::string reason;
        if (error.is_string()) {
            reason = error.get<std::string>();
        } else if (error.is_object() && error.contains("message") && error["message"].is_string()) {
            reason = error["message"].get<std::string>();
        } else {
            reason = error.dump();
        }
        throw BackendError(binding.model_id, reason, error);
    }
}

std::string AdapterRegistry::ExtractText(const nlohmann::json& payload) {
    if (payload.is_string()) {
        return payload.get<std::string>();
    }
    if (payload.is_object()) {
        for (const auto* field: {"text", "response", "content", "output"}) {
            if (payload.contains(field) && payload[field].is_string()) {
                return payload[field].get<std::string>();
            }
        }
        // Chat-completion shape: {"choices": [{"message": {"content": ...}}]}
        if (payload.contains("choices") && payload["choices"].is_array() && !payload["choices"].empty()) {
            const auto& choice = payload["choices"][0];
            if (choice.contains("message") && choice["message"].contains("content") &&
                choice["message"]["content"].is_string()) {
                return choice["message"]["content"].get<std::string>();
            }
            if (choice.contains("text") && choice["text"].is_string()) {
                return choice["text"].get<std::string>();
            }
        }
    }
    return payload.dump();
}

}// namespace promptline
