#pragma once

#include <QtCore/QDateTime>
#include <QtCore/QFuture>
#include <QtCore/QString>
#include <functional>

#include "core/plugin/PluginTypes.hpp"

namespace Corral {

// Awaitable, cancellable view of one in-flight unit of plugin work.
class ExecutionHandle {
public:
    using CancelHook = std::function<bool()>;

    ExecutionHandle(const QString& requestId,
                    ExecutionMode mode,
                    const QFuture<PluginOutcome>& future,
                    CancelHook cancelHook = CancelHook());

    // Already settled, for work that ran inline.
    static ExecutionHandle completed(const QString& requestId, ExecutionMode mode, const PluginOutcome& outcome);

    const QString& requestId() const { return requestId_; }
    ExecutionMode mode() const { return mode_; }
    const QDateTime& createdAt() const { return createdAt_; }
    QFuture<PluginOutcome> future() const { return future_; }

    bool isSettled() const { return future_.isFinished(); }
    bool cancelRequested() const { return cancelRequested_; }

    // Best-effort. True only when the underlying job is guaranteed not to run
    // (queued thread job) or was stopped (worker process).
    bool cancel();

private:
    QString requestId_;
    ExecutionMode mode_;
    QFuture<PluginOutcome> future_;
    CancelHook cancelHook_;
    QDateTime createdAt_;
    bool cancelRequested_ = false;
};

} // namespace Corral
