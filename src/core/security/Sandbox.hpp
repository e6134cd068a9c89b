#pragma once

#include <QtCore/QStringList>
#include <memory>
#include <utility>

#include "core/plugin/PluginTypes.hpp"
#include "core/security/CapabilityTable.hpp"
#include "core/security/ResourceLimiter.hpp"

namespace Corral {

enum class LimitScope {
    SharedProcess,      // direct and thread-isolated modes, inside the engine process
    DedicatedProcess    // corral-plugin-host, one invocation per process
};

struct SandboxReport {
    QStringList applied;
    QStringList skipped;
    QStringList failed;
};

/**
 * @brief Isolated context for a single plugin invocation
 *
 * The constructor applies the OS limits for the scope and creates a fresh
 * capability table. The destructor puts back everything it changed, also
 * when the body throws.
 */
class Sandbox {
public:
    Sandbox(const ResourceLimits& limits,
            const SecurityPolicy& policy,
            LimitScope scope,
            bool applyLimitsInSharedProcess = false,
            std::unique_ptr<ResourceLimiter> limiter = nullptr);
    ~Sandbox();

    Sandbox(const Sandbox&) = delete;
    Sandbox& operator=(const Sandbox&) = delete;

    CapabilityTable& capabilities() { return *capabilities_; }
    const ResourceLimits& limits() const { return limits_; }
    LimitScope scope() const { return scope_; }
    const SandboxReport& report() const { return report_; }

    template<typename Body>
    auto run(Body&& body) -> decltype(std::forward<Body>(body)(std::declval<CapabilityTable&>())) {
        return std::forward<Body>(body)(*capabilities_);
    }

private:
    void enter(bool applyLimitsInSharedProcess);
    void exit();
    void applyProcessLimits(bool includeCpu);
    void enterSharedProcess();
    void leaveSharedProcess();
    void record(const QString& kind, const Expected<void, LimitError>& result);

    const ResourceLimits limits_;
    const LimitScope scope_;
    std::unique_ptr<ResourceLimiter> limiter_;
    std::unique_ptr<CapabilityTable> capabilities_;
    SandboxReport report_;
    int previousMaxThreadCount_ = -1;
    bool alarmArmed_ = false;
    bool holdsSharedLimits_ = false;
};

template<typename Body>
auto withSandbox(const ResourceLimits& limits,
                 const SecurityPolicy& policy,
                 LimitScope scope,
                 Body&& body,
                 bool applyLimitsInSharedProcess = false) {
    Sandbox sandbox(limits, policy, scope, applyLimitsInSharedProcess);
    return sandbox.run(std::forward<Body>(body));
}

} // namespace Corral
