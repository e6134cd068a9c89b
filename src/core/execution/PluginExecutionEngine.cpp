#include "PluginExecutionEngine.hpp"
#include "core/common/Logger.hpp"
#include "core/execution/ExecutionHandle.hpp"
#include "core/execution/PluginInvoker.hpp"
#include "core/execution/ProcessWorkerPool.hpp"
#include "core/execution/ThreadWorkerPool.hpp"
#include "core/security/ParameterValidator.hpp"

#include <QtCore/QCoreApplication>
#include <QtCore/QDir>
#include <QtCore/QElapsedTimer>
#include <QtCore/QFutureWatcher>
#include <QtCore/QHash>
#include <QtCore/QPointer>
#include <QtCore/QPromise>
#include <QtCore/QTimer>
#include <QtCore/QUuid>
#include <algorithm>
#include <limits>

namespace Corral {

namespace {

constexpr int SHUTDOWN_THREAD_WAIT_MS = 10000;
// QTimer intervals are int milliseconds
constexpr qint64 MAX_TIMER_INTERVAL_MS = std::numeric_limits<int>::max();

QString defaultHostExecutable() {
    return QDir(QCoreApplication::applicationDirPath()).filePath(QStringLiteral("corral-plugin-host"));
}

} // namespace

struct PluginExecutionEngine::ActiveExecution {
    ExecutionRequest request;
    ExecutionResult result;
    ResourceLimits limits;
    std::unique_ptr<ExecutionHandle> handle;
    QFutureWatcher<PluginOutcome>* watcher = nullptr;
    QTimer* timer = nullptr;
    std::shared_ptr<QPromise<ExecutionResult>> promise;
    QElapsedTimer clock;
    qint64 timeoutMs = 0;
};

class PluginExecutionEngine::PluginExecutionEnginePrivate {
public:
    PluginExecutionEnginePrivate(std::shared_ptr<PluginRegistry> registry, const Config::EngineSettings& engineSettings)
        : registry(std::move(registry))
        , settings(engineSettings)
        , threadPool(engineSettings.threadPoolSize) {
    }

    std::shared_ptr<PluginRegistry> registry;
    Config::EngineSettings settings;
    ThreadWorkerPool threadPool;
    ProcessWorkerPool* processPool = nullptr;

    QHash<QString, std::shared_ptr<ActiveExecution>> active;
    QList<ExecutionResult> history;
    ExecutionMetrics metrics;
    bool shutdown = false;
};

PluginExecutionEngine::PluginExecutionEngine(std::shared_ptr<PluginRegistry> registry,
                                             const Config::EngineSettings& settings,
                                             QObject* parent)
    : QObject(parent)
    , d(std::make_unique<PluginExecutionEnginePrivate>(std::move(registry), settings)) {
    qRegisterMetaType<Corral::ExecutionResult>();

    if (d->settings.pluginHostExecutable.isEmpty()) {
        d->settings.pluginHostExecutable = defaultHostExecutable();
    }
    if (d->settings.historyLimit < 1) {
        d->settings.historyLimit = 1000;
    }
    if (d->settings.defaultTimeoutSeconds < 1) {
        d->settings.defaultTimeoutSeconds = 30;
    }
    d->settings.defaultLimits = d->settings.defaultLimits.mergedOnto(ResourceLimits());

    d->processPool = new ProcessWorkerPool(d->settings.processPoolSize, d->settings.pluginHostExecutable, this);

    CORRAL_INFO("Plugin execution engine ready ({} worker threads, {} worker processes, host {})",
                d->threadPool.maxThreads(), d->processPool->maxWorkers(),
                d->settings.pluginHostExecutable.toStdString());
}

PluginExecutionEngine::PluginExecutionEngine(std::shared_ptr<PluginRegistry> registry, QObject* parent)
    : PluginExecutionEngine(std::move(registry), Config::instance().getEngineSettings(), parent) {
}

PluginExecutionEngine::~PluginExecutionEngine() {
    shutdown();
}

QFuture<ExecutionResult> PluginExecutionEngine::execute(const ExecutionRequest& request) {
    auto execution = std::make_shared<ActiveExecution>();
    execution->clock.start();
    execution->request = request;
    if (execution->request.requestId.isEmpty()) {
        execution->request.requestId = QUuid::createUuid().toString(QUuid::WithoutBraces);
    }

    ExecutionResult& result = execution->result;
    result.requestId = execution->request.requestId;
    result.pluginName = request.pluginName;
    result.userId = request.userId;
    result.sessionId = request.sessionId;
    result.startedAt = QDateTime::currentDateTimeUtc();
    result.status = ExecutionStatus::Pending;
    result.metadata["execution_mode"] = toString(request.executionMode);

    if (d->shutdown) {
        return rejectEarly(result, PluginError::Execution, QStringLiteral("Engine is shut down"));
    }
    if (request.pluginName.trimmed().isEmpty()) {
        return rejectEarly(result, PluginError::Validation, QStringLiteral("plugin_name is required"));
    }
    const int timeoutSeconds = request.timeoutSeconds.value_or(d->settings.defaultTimeoutSeconds);
    if (timeoutSeconds <= 0) {
        return rejectEarly(result, PluginError::Validation,
                           QStringLiteral("timeout_seconds must be positive (got %1)").arg(timeoutSeconds));
    }
    if (d->active.contains(result.requestId)) {
        return rejectEarly(result, PluginError::Validation,
                           QStringLiteral("Request %1 is already active").arg(result.requestId));
    }

    auto metadata = d->registry->getPlugin(request.pluginName);
    if (!metadata) {
        return rejectEarly(result, PluginError::NotFound,
                           QStringLiteral("Plugin not found: %1").arg(request.pluginName));
    }
    if (!metadata.value().isExecutable()) {
        return rejectEarly(result, PluginError::NotFound,
                           QStringLiteral("Plugin %1 is not available (status: %2)")
                               .arg(request.pluginName, toString(metadata.value().status)));
    }

    const ParameterSchema schema = ParameterSchema::fromManifest(metadata.value().manifest);
    auto parameters = ParameterValidator::sanitizeInput(request.parameters, schema);
    if (!parameters) {
        if (!parameters.error().parameter.isEmpty()) {
            result.metadata["parameter"] = parameters.error().parameter;
        }
        return rejectEarly(result, PluginError::Validation, parameters.error().message);
    }

    execution->limits = request.resourceLimits
        ? request.resourceLimits->mergedOnto(d->settings.defaultLimits)
        : d->settings.defaultLimits;
    const SecurityPolicy policy = request.securityPolicy.value_or(d->settings.defaultPolicy);
    execution->timeoutMs = static_cast<qint64>(std::min(timeoutSeconds, execution->limits.maxWallTimeSeconds)) * 1000;

    Invocation invocation;
    invocation.requestId = result.requestId;
    invocation.pluginName = request.pluginName;
    invocation.libraryPath = metadata.value().libraryPath();
    invocation.entryPoint = metadata.value().manifest.entryPoint;
    invocation.parameters = parameters.value();
    invocation.limits = execution->limits;
    invocation.policy = policy;
    invocation.declaredImports = metadata.value().manifest.extensions.value("imports").toStringList();

    execution->promise = std::make_shared<QPromise<ExecutionResult>>();
    execution->promise->start();
    QFuture<ExecutionResult> future = execution->promise->future();

    result.status = ExecutionStatus::Running;
    d->active.insert(result.requestId, execution);
    CORRAL_INFO("Executing {} as {} (request {})", request.pluginName.toStdString(),
                toString(request.executionMode).toStdString(), result.requestId.toStdString());
    emit executionStarted(result.requestId);

    const ExecutionMode mode = request.executionMode;
    const bool applyShared = d->settings.applyLimitsInSharedProcess;

    switch (mode) {
        case ExecutionMode::Direct: {
            const PluginOutcome outcome = PluginInvoker::invoke(invocation, LimitScope::SharedProcess,
                                                                PluginInvoker::CancellationCheck(), applyShared);
            execution->handle = std::make_unique<ExecutionHandle>(
                ExecutionHandle::completed(result.requestId, mode, outcome));
            if (execution->clock.elapsed() > execution->timeoutMs) {
                result.status = ExecutionStatus::Timeout;
                result.error = QStringLiteral("Execution timed out after %1 seconds").arg(execution->timeoutMs / 1000);
                result.metadata["error_kind"] = toString(PluginError::Timeout);
                result.metadata["handle_cancelled"] = false;
            } else {
                applyOutcome(*execution, outcome);
            }
            finalize(execution);
            return future;
        }
        case ExecutionMode::ThreadIsolated: {
            ThreadJobTicket ticket = d->threadPool.submit([invocation, applyShared](const JobControl& control) {
                return PluginInvoker::invoke(invocation, LimitScope::SharedProcess,
                                             [&control]() { return control.isCancellationRequested(); },
                                             applyShared);
            });
            std::shared_ptr<JobControl> control = ticket.control;
            execution->handle = std::make_unique<ExecutionHandle>(
                result.requestId, mode, ticket.future, [control]() { return control->requestCancel(); });
            break;
        }
        case ExecutionMode::ProcessIsolated:
        case ExecutionMode::Sandboxed: {
            QPointer<ProcessWorkerPool> pool = d->processPool;
            const QString jobId = result.requestId;
            execution->handle = std::make_unique<ExecutionHandle>(
                result.requestId, mode, d->processPool->submit(jobId, invocation),
                [pool, jobId]() { return pool && pool->cancel(jobId); });
            break;
        }
    }

    dispatch(execution);
    return future;
}

void PluginExecutionEngine::dispatch(const std::shared_ptr<ActiveExecution>& execution) {
    const QString requestId = execution->result.requestId;
    const ActiveExecution* token = execution.get();

    execution->timer = new QTimer(this);
    execution->timer->setSingleShot(true);
    execution->timer->setInterval(static_cast<int>(std::min(execution->timeoutMs, MAX_TIMER_INTERVAL_MS)));
    connect(execution->timer, &QTimer::timeout, this, [this, requestId, token]() {
        handleTimeout(requestId, token);
    });

    execution->watcher = new QFutureWatcher<PluginOutcome>(this);
    connect(execution->watcher, &QFutureWatcher<PluginOutcome>::finished, this, [this, requestId, token]() {
        handleSettled(requestId, token);
    });

    execution->timer->start();
    execution->watcher->setFuture(execution->handle->future());
}

void PluginExecutionEngine::handleSettled(const QString& requestId, const ActiveExecution* token) {
    auto it = d->active.find(requestId);
    if (it == d->active.end() || it->get() != token) {
        // Already timed out or cancelled
        return;
    }
    std::shared_ptr<ActiveExecution> execution = it.value();

    const QFuture<PluginOutcome> future = execution->handle->future();
    if (future.resultCount() == 0) {
        PluginFault fault;
        fault.kind = PluginError::Cancelled;
        fault.message = QStringLiteral("Execution cancelled");
        applyOutcome(*execution, makeUnexpected(fault));
    } else {
        applyOutcome(*execution, future.result());
    }
    finalize(execution);
}

void PluginExecutionEngine::handleTimeout(const QString& requestId, const ActiveExecution* token) {
    auto it = d->active.find(requestId);
    if (it == d->active.end() || it->get() != token) {
        return;
    }
    std::shared_ptr<ActiveExecution> execution = it.value();

    const qint64 remainingMs = execution->timeoutMs - execution->clock.elapsed();
    if (remainingMs > 0) {
        // Deadline beyond a single timer interval
        execution->timer->setInterval(static_cast<int>(std::min(remainingMs, MAX_TIMER_INTERVAL_MS)));
        execution->timer->start();
        return;
    }

    ExecutionResult& result = execution->result;
    result.status = ExecutionStatus::Timeout;
    result.error = QStringLiteral("Execution timed out after %1 seconds").arg(execution->timeoutMs / 1000);
    result.metadata["error_kind"] = toString(PluginError::Timeout);
    result.metadata["handle_cancelled"] = execution->handle->cancel();

    CORRAL_WARN("Request {} ({}) timed out after {} ms", requestId.toStdString(),
                result.pluginName.toStdString(), execution->timeoutMs);
    finalize(execution);
}

bool PluginExecutionEngine::cancel(const QString& requestId) {
    auto it = d->active.find(requestId);
    if (it == d->active.end()) {
        return false;
    }
    std::shared_ptr<ActiveExecution> execution = it.value();
    if (!execution->handle || execution->handle->isSettled()) {
        return false;
    }

    ExecutionResult& result = execution->result;
    result.status = ExecutionStatus::Cancelled;
    result.error = QStringLiteral("Execution cancelled");
    result.metadata["error_kind"] = toString(PluginError::Cancelled);
    result.metadata["cancel_requested"] = true;
    result.metadata["handle_cancelled"] = execution->handle->cancel();

    CORRAL_INFO("Cancelled request {}", requestId.toStdString());
    finalize(execution);
    return true;
}

void PluginExecutionEngine::applyOutcome(ActiveExecution& execution, const PluginOutcome& outcome) {
    ExecutionResult& result = execution.result;

    const QList<SecurityViolation>& violations = outcome ? outcome.value().violations : outcome.error().violations;
    const QString& workerStderr = outcome ? outcome.value().workerStderr : outcome.error().workerStderr;

    if (!violations.isEmpty()) {
        result.metadata["security_violations"] = violationsToVariant(violations);
        for (const SecurityViolation& violation : violations) {
            emit securityViolation(result.requestId, violation.toString());
        }
    }
    if (!workerStderr.isEmpty()) {
        result.metadata["worker_stderr"] = workerStderr;
    }

    if (!outcome) {
        const PluginFault& fault = outcome.error();
        switch (fault.kind) {
            case PluginError::Cancelled: result.status = ExecutionStatus::Cancelled; break;
            case PluginError::Timeout: result.status = ExecutionStatus::Timeout; break;
            default: result.status = ExecutionStatus::Failed; break;
        }
        result.error = fault.message;
        result.metadata["error_kind"] = toString(fault.kind);
        if (!fault.traceback.isEmpty()) {
            result.metadata["traceback"] = fault.traceback;
        }
        return;
    }

    const PluginOutput& output = outcome.value();
    if (!output.printed.isEmpty()) {
        result.metadata["plugin_output"] = output.printed;
    }

    auto sanitized = ParameterValidator::sanitizeOutput(output.value, execution.limits);
    if (!sanitized) {
        result.status = ExecutionStatus::Failed;
        result.error = sanitized.error().message;
        result.metadata["error_kind"] = toString(sanitized.error().kind);
        return;
    }

    result.status = ExecutionStatus::Completed;
    result.result = sanitized.value().value;
    if (sanitized.value().truncated) {
        result.metadata["output_truncated"] = true;
    }
}

void PluginExecutionEngine::finalize(const std::shared_ptr<ActiveExecution>& execution) {
    if (execution->timer) {
        execution->timer->stop();
        execution->timer->disconnect(this);
        execution->timer->deleteLater();
        execution->timer = nullptr;
    }
    if (execution->watcher) {
        execution->watcher->disconnect(this);
        execution->watcher->deleteLater();
        execution->watcher = nullptr;
    }

    ExecutionResult& result = execution->result;
    result.completedAt = QDateTime::currentDateTimeUtc();
    result.executionTime = execution->clock.nsecsElapsed() / 1e9;

    d->active.remove(result.requestId);
    recordResult(result);

    execution->promise->addResult(result);
    execution->promise->finish();

    CORRAL_INFO("Request {} ({}) finished: {} in {:.3f}s", result.requestId.toStdString(),
                result.pluginName.toStdString(), toString(result.status).toStdString(), result.executionTime);
    emit executionFinished(result);
}

QFuture<ExecutionResult> PluginExecutionEngine::rejectEarly(ExecutionResult result, PluginError kind,
                                                            const QString& message) {
    result.status = ExecutionStatus::Failed;
    result.error = message;
    result.metadata["error_kind"] = toString(kind);
    result.completedAt = QDateTime::currentDateTimeUtc();
    result.executionTime = result.startedAt.msecsTo(result.completedAt) / 1000.0;

    CORRAL_WARN("Rejected request {} for {}: {}", result.requestId.toStdString(),
                result.pluginName.toStdString(), message.toStdString());
    recordResult(result);

    QPromise<ExecutionResult> promise;
    promise.start();
    promise.addResult(result);
    promise.finish();

    emit executionFinished(result);
    return promise.future();
}

void PluginExecutionEngine::recordResult(const ExecutionResult& result) {
    d->history.append(result);
    while (d->history.size() > d->settings.historyLimit) {
        d->history.removeFirst();
    }

    ExecutionMetrics& metrics = d->metrics;
    ++metrics.executionsTotal;
    switch (result.status) {
        case ExecutionStatus::Completed: ++metrics.executionsSuccessful; break;
        case ExecutionStatus::Timeout: ++metrics.executionsTimeout; break;
        case ExecutionStatus::Cancelled: ++metrics.executionsCancelled; break;
        default: ++metrics.executionsFailed; break;
    }
    metrics.totalExecutionTime += result.executionTime;
    metrics.averageExecutionTime = metrics.totalExecutionTime / metrics.executionsTotal;
    metrics.successRate = static_cast<double>(metrics.executionsSuccessful) / metrics.executionsTotal;
}

QList<ExecutionResult> PluginExecutionEngine::activeExecutions() const {
    QList<ExecutionResult> results;
    results.reserve(d->active.size());
    for (const auto& execution : d->active) {
        results.append(execution->result);
    }
    std::sort(results.begin(), results.end(), [](const ExecutionResult& a, const ExecutionResult& b) {
        return a.startedAt < b.startedAt;
    });
    return results;
}

QList<ExecutionResult> PluginExecutionEngine::executionHistory(int limit, const QString& userId) const {
    QList<ExecutionResult> matching;
    for (const ExecutionResult& result : d->history) {
        if (userId.isEmpty() || result.userId == userId) {
            matching.append(result);
        }
    }
    if (limit > 0 && matching.size() > limit) {
        matching = matching.mid(matching.size() - limit);
    }
    return matching;
}

ExecutionMetrics PluginExecutionEngine::executionMetrics() const {
    ExecutionMetrics metrics = d->metrics;
    metrics.activeExecutions = d->active.size();
    return metrics;
}

void PluginExecutionEngine::shutdown() {
    if (d->shutdown) {
        return;
    }
    d->shutdown = true;

    const QList<std::shared_ptr<ActiveExecution>> executions = d->active.values();
    for (const auto& execution : executions) {
        ExecutionResult& result = execution->result;
        result.status = ExecutionStatus::Cancelled;
        result.error = QStringLiteral("Engine shutting down");
        result.metadata["error_kind"] = toString(PluginError::Cancelled);
        result.metadata["handle_cancelled"] = execution->handle ? execution->handle->cancel() : false;
        finalize(execution);
    }

    d->processPool->shutdown();
    if (!d->threadPool.waitForDone(SHUTDOWN_THREAD_WAIT_MS)) {
        CORRAL_WARN("Worker threads still busy {} ms after shutdown", SHUTDOWN_THREAD_WAIT_MS);
    }
    CORRAL_INFO("Plugin execution engine shut down ({} requests cancelled)", executions.size());
}

bool PluginExecutionEngine::isShutdown() const {
    return d->shutdown;
}

const Config::EngineSettings& PluginExecutionEngine::settings() const {
    return d->settings;
}

} // namespace Corral
