#pragma once

#include <QtCore/QFuture>
#include <QtCore/QObject>
#include <QtCore/QProcess>
#include <QtCore/QString>
#include <memory>

#include "core/execution/PluginInvoker.hpp"
#include "core/plugin/PluginTypes.hpp"

namespace Corral {

/**
 * @brief Bounded pool of corral-plugin-host worker processes
 *
 * One process per job. Jobs beyond the bound wait in a FIFO queue. Must be
 * used from the thread that owns it; QProcess signals drive completion.
 */
class ProcessWorkerPool : public QObject {
    Q_OBJECT

public:
    static constexpr int MAX_STDERR_BYTES = 8 * 1024;

    ProcessWorkerPool(int maxWorkers, const QString& hostExecutable, QObject* parent = nullptr);
    ~ProcessWorkerPool() override;

    QFuture<PluginOutcome> submit(const QString& jobId, const Invocation& invocation);

    // Drops a queued job or kills a running worker. False when the job is unknown.
    bool cancel(const QString& jobId);

    // Kills running workers and cancels queued jobs.
    void shutdown();

    int maxWorkers() const;
    int runningCount() const;
    int queuedCount() const;
    QString hostExecutable() const;

    static PluginOutcome parseResponse(const QByteArray& stdoutData,
                                       const QByteArray& stderrData,
                                       int exitCode,
                                       QProcess::ExitStatus exitStatus);

signals:
    void workerStarted(const QString& jobId, qint64 pid);
    void workerFinished(const QString& jobId, int exitCode);

private:
    class ProcessWorkerPoolPrivate;
    std::unique_ptr<ProcessWorkerPoolPrivate> d;

    void startQueuedJobs();
    void launch(const QString& jobId);
    void handleFinished(const QString& jobId, int exitCode, QProcess::ExitStatus exitStatus);
    void handleError(const QString& jobId, QProcess::ProcessError error);
};

} // namespace Corral
