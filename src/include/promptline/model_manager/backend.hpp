#pragma once

#include "promptline/core/common.hpp"
#include <algorithm>
#include <functional>
#include <nlohmann/json.hpp>

namespace promptline {

// A generative-model implementation with its own native call shape. Concrete
// backends expose one or more named operations in their constructor; the
// registry binds exactly one of them as the generation call. Exposed
// operations point back at the backend, so backends are neither copied nor
// moved.
class IModelBackend {
public:
    // prompt, generation parameters ({"temperature", "max_tokens"}, possibly
    // empty) -> native response payload
    using Operation = std::function<nlohmann::json(const std::string& prompt, const nlohmann::json& parameters)>;

    IModelBackend() = default;
    IModelBackend(const IModelBackend&) = delete;
    IModelBackend& operator=(const IModelBackend&) = delete;
    IModelBackend(IModelBackend&&) = delete;
    IModelBackend& operator=(IModelBackend&&) = delete;
    virtual ~IModelBackend() = default;

    std::optional<Operation> FindOperation(const std::string& name) const {
        auto it = operations_.find(name);
        if (it == operations_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<std::string> GetOperationNames() const {
        std::vector<std::string> names;
        names.reserve(operations_.size());
        for (const auto& [name, operation]: operations_) {
            names.push_back(name);
        }
        std::sort(names.begin(), names.end());
        return names;
    }

protected:
    void Expose(const std::string& name, Operation operation) {
        operations_[name] = std::move(operation);
    }

    // Native method taking only the prompt
    template<typename Backend, typename Return>
    void Expose(const std::string& name, Return (Backend::*method)(const std::string&)) {
        auto* self = static_cast<Backend*>(this);
        Expose(name, [self, method](const std::string& prompt, const nlohmann::json&) {
            return nlohmann::json((self->*method)(prompt));
        });
    }

    template<typename Backend, typename Return>
    void Expose(const std::string& name, Return (Backend::*method)(const std::string&) const) {
        const auto* self = static_cast<const Backend*>(this);
        Expose(name, [self, method](const std::string& prompt, const nlohmann::json&) {
            return nlohmann::json((self->*method)(prompt));
        });
    }

    // Native method that also honours generation parameters
    template<typename Backend, typename Return>
    void Expose(const std::string& name, Return (Backend::*method)(const std::string&, const nlohmann::json&)) {
        auto* self = static_cast<Backend*>(this);
        Expose(name, [self, method](const std::string& prompt, const nlohmann::json& parameters) {
            return nlohmann::json((self->*method)(prompt, parameters));
        });
    }

private:
    std::unordered_map<std::string, Operation> operations_;
};

}// namespace promptline
