#pragma once

#include <QtCore/QFuture>
#include <QtCore/QList>
#include <QtCore/QObject>
#include <QtCore/QString>
#include <memory>

#include "core/common/Config.hpp"
#include "core/plugin/PluginRegistry.hpp"
#include "core/plugin/PluginTypes.hpp"

namespace Corral {

/**
 * @brief Runs registered plugins under an isolation mode with limits and a timeout
 *
 * Lives on one thread with a running event loop. execute() never throws: every
 * failure, including bad requests, becomes a terminal ExecutionResult that is
 * also recorded in the history and the metrics.
 *
 * Modes:
 * - Direct: inline on the engine thread, cannot be cancelled once started,
 *   timeout is checked after the plugin returns.
 * - ThreadIsolated: bounded thread pool, cancellation is cooperative.
 * - ProcessIsolated / Sandboxed: one corral-plugin-host process per request,
 *   cancellation and timeout kill the worker.
 */
class PluginExecutionEngine : public QObject {
    Q_OBJECT

public:
    PluginExecutionEngine(std::shared_ptr<PluginRegistry> registry,
                          const Config::EngineSettings& settings,
                          QObject* parent = nullptr);
    // Settings from Config::instance()
    explicit PluginExecutionEngine(std::shared_ptr<PluginRegistry> registry, QObject* parent = nullptr);
    ~PluginExecutionEngine() override;

    QFuture<ExecutionResult> execute(const ExecutionRequest& request);

    // False when the request is not active or its work already settled.
    bool cancel(const QString& requestId);

    QList<ExecutionResult> activeExecutions() const;

    // Newest last. limit <= 0 returns every retained entry.
    QList<ExecutionResult> executionHistory(int limit = 100, const QString& userId = QString()) const;

    ExecutionMetrics executionMetrics() const;

    // Cancels everything in flight, kills worker processes and waits for
    // worker threads. Later execute() calls fail immediately.
    void shutdown();
    bool isShutdown() const;

    const Config::EngineSettings& settings() const;

signals:
    void executionStarted(const QString& requestId);
    void executionFinished(const Corral::ExecutionResult& result);
    void securityViolation(const QString& requestId, const QString& description);

private:
    class PluginExecutionEnginePrivate;
    std::unique_ptr<PluginExecutionEnginePrivate> d;

    struct ActiveExecution;

    QFuture<ExecutionResult> rejectEarly(ExecutionResult result, PluginError kind, const QString& message);
    void dispatch(const std::shared_ptr<ActiveExecution>& execution);
    void handleSettled(const QString& requestId, const ActiveExecution* token);
    void handleTimeout(const QString& requestId, const ActiveExecution* token);
    void applyOutcome(ActiveExecution& execution, const PluginOutcome& outcome);
    void finalize(const std::shared_ptr<ActiveExecution>& execution);
    void recordResult(const ExecutionResult& result);
};

} // namespace Corral
