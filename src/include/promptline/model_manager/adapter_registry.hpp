#pragma once

#include "promptline/core/cancellation.hpp"
#include "promptline/core/common.hpp"
#include "promptline/core/types.hpp"
#include "promptline/metrics/manager.hpp"
#include "promptline/model_manager/backend.hpp"
#include <shared_mutex>

namespace promptline {

// A backend bound to the one operation that serves as its generation call
struct AdapterBinding {
    std::string model_id;
    std::string entry_point;
    std::shared_ptr<IModelBackend> backend;
    IModelBackend::Operation operation;
};

constexpr auto CALLABLE_ENTRY_POINT = "<callable>";

// Presents one invocation contract over differently shaped backends. Safe for
// concurrent Invoke calls; Register/Unregister take the table exclusively.
class AdapterRegistry {
public:
    explicit AdapterRegistry(std::shared_ptr<MetricsManager> metrics = nullptr) : metrics_(std::move(metrics)) {}

    AdapterRegistry(const AdapterRegistry&) = delete;
    AdapterRegistry& operator=(const AdapterRegistry&) = delete;

    // Resolves `entry_point` on `backend` now, not at call time
    void Register(const std::string& model_id, std::shared_ptr<IModelBackend> backend, const std::string& entry_point);
    // Binds a callable directly; no name lookup involved
    void Register(const std::string& model_id, IModelBackend::Operation operation);

    bool Unregister(const std::string& model_id);
    bool Contains(const std::string& model_id) const;
    std::vector<std::string> GetModelIds() const;
    size_t Size() const;

    Result Invoke(const std::string& model_id, const std::string& prompt,
                  const CancellationToken& token = CancellationToken()) const;
    Result Invoke(const std::string& model_id, const Request& request,
                  const CancellationToken& token = CancellationToken()) const;

    void SetMetricsManager(std::shared_ptr<MetricsManager> metrics);

    // Normalizes a native payload into result text
    static std::string ExtractText(const nlohmann::json& payload);

private:
    void AddBinding(AdapterBinding binding);
    AdapterBinding FindBinding(const std::string& model_id) const;
    Result Dispatch(const AdapterBinding& binding, const std::string& prompt, const nlohmann::json& parameters,
                    const CancellationToken& token) const;
    static void CheckPayload(const AdapterBinding& binding, const nlohmann::json& payload);

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, AdapterBinding> bindings_;
    std::shared_ptr<MetricsManager> metrics_;
};

}// namespace promptline
