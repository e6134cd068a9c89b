#pragma once

#include <QtCore/QFuture>
#include <QtCore/QThreadPool>
#include <atomic>
#include <functional>
#include <memory>

#include "core/plugin/PluginTypes.hpp"

namespace Corral {

// Shared between the pool job and whoever holds its ticket.
class JobControl {
public:
    enum class Phase {
        Queued,
        Running,
        Finished,
        Cancelled
    };

    // Queued -> Running. Fails when the job was cancelled first.
    bool tryStart();

    // Raises the cooperative flag; returns true only for Queued -> Cancelled.
    bool requestCancel();

    void markFinished();

    Phase phase() const { return phase_.load(); }
    bool isCancellationRequested() const { return cancelRequested_.load(); }

private:
    std::atomic<Phase> phase_{Phase::Queued};
    std::atomic<bool> cancelRequested_{false};
};

struct ThreadJobTicket {
    QFuture<PluginOutcome> future;
    std::shared_ptr<JobControl> control;
};

class ThreadWorkerPool {
public:
    using Work = std::function<PluginOutcome(const JobControl& control)>;

    explicit ThreadWorkerPool(int maxThreads);
    ~ThreadWorkerPool();

    ThreadWorkerPool(const ThreadWorkerPool&) = delete;
    ThreadWorkerPool& operator=(const ThreadWorkerPool&) = delete;

    ThreadJobTicket submit(Work work);

    int maxThreads() const;
    int activeThreadCount() const;
    bool waitForDone(int msecs = -1);

private:
    QThreadPool pool_;
};

} // namespace Corral
