#include "ThreadWorkerPool.hpp"
#include "core/common/Logger.hpp"

#include <QtCore/QPromise>
#include <QtCore/QRunnable>
#include <exception>

namespace Corral {

bool JobControl::tryStart() {
    Phase expected = Phase::Queued;
    return phase_.compare_exchange_strong(expected, Phase::Running);
}

bool JobControl::requestCancel() {
    cancelRequested_.store(true);
    Phase expected = Phase::Queued;
    return phase_.compare_exchange_strong(expected, Phase::Cancelled);
}

void JobControl::markFinished() {
    Phase expected = Phase::Running;
    phase_.compare_exchange_strong(expected, Phase::Finished);
}

namespace {

PluginFault makeFault(PluginError kind, const QString& message) {
    PluginFault fault;
    fault.kind = kind;
    fault.message = message;
    return fault;
}

class ThreadJob : public QRunnable {
public:
    ThreadJob(ThreadWorkerPool::Work work, std::shared_ptr<JobControl> control)
        : work_(std::move(work))
        , control_(std::move(control)) {
        setAutoDelete(true);
        promise_.start();
    }

    QFuture<PluginOutcome> future() { return promise_.future(); }

    void run() override {
        if (!control_->tryStart()) {
            promise_.addResult(PluginOutcome(makeUnexpected(
                makeFault(PluginError::Cancelled, QStringLiteral("Execution cancelled before start")))));
            promise_.finish();
            return;
        }

        try {
            promise_.addResult(work_(*control_));
        } catch (const std::exception& e) {
            CORRAL_ERROR("Worker thread job threw: {}", e.what());
            promise_.addResult(PluginOutcome(makeUnexpected(
                makeFault(PluginError::Execution, QString::fromUtf8(e.what())))));
        }
        control_->markFinished();
        promise_.finish();
    }

private:
    ThreadWorkerPool::Work work_;
    std::shared_ptr<JobControl> control_;
    QPromise<PluginOutcome> promise_;
};

} // namespace

ThreadWorkerPool::ThreadWorkerPool(int maxThreads) {
    pool_.setMaxThreadCount(qMax(1, maxThreads));
    pool_.setObjectName(QStringLiteral("corral-plugin-workers"));
}

ThreadWorkerPool::~ThreadWorkerPool() {
    pool_.clear();
    pool_.waitForDone();
}

ThreadJobTicket ThreadWorkerPool::submit(Work work) {
    auto control = std::make_shared<JobControl>();
    auto* job = new ThreadJob(std::move(work), control);
    ThreadJobTicket ticket{job->future(), control};
    pool_.start(job);
    return ticket;
}

int ThreadWorkerPool::maxThreads() const {
    return pool_.maxThreadCount();
}

int ThreadWorkerPool::activeThreadCount() const {
    return pool_.activeThreadCount();
}

bool ThreadWorkerPool::waitForDone(int msecs) {
    return pool_.waitForDone(msecs);
}

} // namespace Corral
