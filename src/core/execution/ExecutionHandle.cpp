#include "ExecutionHandle.hpp"
#include "core/common/Logger.hpp"

#include <QtCore/QPromise>

namespace Corral {

ExecutionHandle::ExecutionHandle(const QString& requestId,
                                 ExecutionMode mode,
                                 const QFuture<PluginOutcome>& future,
                                 CancelHook cancelHook)
    : requestId_(requestId)
    , mode_(mode)
    , future_(future)
    , cancelHook_(std::move(cancelHook))
    , createdAt_(QDateTime::currentDateTimeUtc()) {
}

ExecutionHandle ExecutionHandle::completed(const QString& requestId, ExecutionMode mode, const PluginOutcome& outcome) {
    QPromise<PluginOutcome> promise;
    promise.start();
    promise.addResult(outcome);
    promise.finish();
    return ExecutionHandle(requestId, mode, promise.future());
}

bool ExecutionHandle::cancel() {
    if (isSettled()) {
        return false;
    }
    cancelRequested_ = true;
    if (!cancelHook_) {
        return false;
    }

    const bool cancelled = cancelHook_();
    CORRAL_DEBUG("Cancel of {} ({}) {}", requestId_.toStdString(), toString(mode_).toStdString(),
                 cancelled ? "succeeded" : "will run to completion");
    return cancelled;
}

} // namespace Corral
