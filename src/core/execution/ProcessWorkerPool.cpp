#include "ProcessWorkerPool.hpp"
#include "core/common/Logger.hpp"

#include <QtCore/QHash>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonParseError>
#include <QtCore/QPromise>
#include <QtCore/QStringList>

namespace Corral {

namespace {

constexpr int KILL_WAIT_MS = 1000;

PluginFault makeFault(PluginError kind, const QString& message) {
    PluginFault fault;
    fault.kind = kind;
    fault.message = message;
    return fault;
}

} // namespace

class ProcessWorkerPool::ProcessWorkerPoolPrivate {
public:
    struct Job {
        QByteArray payload;
        std::shared_ptr<QPromise<PluginOutcome>> promise;
        QProcess* process = nullptr;
        QByteArray stdoutData;
        QByteArray stderrData;
    };

    int maxWorkers = 1;
    QString hostExecutable;
    QStringList queue;
    QHash<QString, Job> jobs;
    int running = 0;

    static void settle(const std::shared_ptr<QPromise<PluginOutcome>>& promise, const PluginOutcome& outcome) {
        if (promise->future().isFinished()) {
            return;
        }
        promise->addResult(outcome);
        promise->finish();
    }

    static void appendCapped(QByteArray& buffer, const QByteArray& chunk) {
        buffer.append(chunk);
        if (buffer.size() > MAX_STDERR_BYTES) {
            buffer.remove(0, buffer.size() - MAX_STDERR_BYTES);
        }
    }
};

ProcessWorkerPool::ProcessWorkerPool(int maxWorkers, const QString& hostExecutable, QObject* parent)
    : QObject(parent)
    , d(std::make_unique<ProcessWorkerPoolPrivate>()) {
    d->maxWorkers = qMax(1, maxWorkers);
    d->hostExecutable = hostExecutable;
}

ProcessWorkerPool::~ProcessWorkerPool() {
    shutdown();
}

QFuture<PluginOutcome> ProcessWorkerPool::submit(const QString& jobId, const Invocation& invocation) {
    auto promise = std::make_shared<QPromise<PluginOutcome>>();
    promise->start();
    QFuture<PluginOutcome> future = promise->future();

    if (d->jobs.contains(jobId)) {
        ProcessWorkerPoolPrivate::settle(promise, PluginOutcome(makeUnexpected(
            makeFault(PluginError::Execution, QStringLiteral("Duplicate worker job id %1").arg(jobId)))));
        return future;
    }

    ProcessWorkerPoolPrivate::Job job;
    job.payload = QJsonDocument(invocation.toJson()).toJson(QJsonDocument::Compact);
    job.promise = promise;
    d->jobs.insert(jobId, job);
    d->queue.append(jobId);

    CORRAL_DEBUG("Queued worker job {} ({} running, {} queued)", jobId.toStdString(), d->running, d->queue.size());
    startQueuedJobs();
    return future;
}

bool ProcessWorkerPool::cancel(const QString& jobId) {
    auto it = d->jobs.find(jobId);
    if (it == d->jobs.end()) {
        return false;
    }

    const PluginOutcome cancelled = makeUnexpected(
        makeFault(PluginError::Cancelled, QStringLiteral("Execution cancelled")));

    QProcess* process = it->process;
    if (!process) {
        d->queue.removeAll(jobId);
        ProcessWorkerPoolPrivate::settle(it->promise, cancelled);
        d->jobs.erase(it);
        CORRAL_DEBUG("Dropped queued worker job {}", jobId.toStdString());
        return true;
    }

    // The process is reaped asynchronously once it has died
    disconnect(process, nullptr, this, nullptr);
    connect(process, &QProcess::finished, process, &QObject::deleteLater);
    process->kill();

    ProcessWorkerPoolPrivate::settle(it->promise, cancelled);
    d->jobs.erase(it);
    --d->running;
    CORRAL_INFO("Killed worker for job {}", jobId.toStdString());

    startQueuedJobs();
    return true;
}

void ProcessWorkerPool::shutdown() {
    const PluginOutcome cancelled = makeUnexpected(
        makeFault(PluginError::Cancelled, QStringLiteral("Worker pool shut down")));

    for (auto it = d->jobs.begin(); it != d->jobs.end(); ++it) {
        if (QProcess* process = it->process) {
            disconnect(process, nullptr, this, nullptr);
            process->kill();
            if (!process->waitForFinished(KILL_WAIT_MS)) {
                CORRAL_WARN("Worker for job {} did not exit after kill", it.key().toStdString());
            }
            delete process;
        }
        ProcessWorkerPoolPrivate::settle(it->promise, cancelled);
    }

    if (!d->jobs.isEmpty()) {
        CORRAL_INFO("Process worker pool shut down with {} jobs outstanding", d->jobs.size());
    }
    d->jobs.clear();
    d->queue.clear();
    d->running = 0;
}

int ProcessWorkerPool::maxWorkers() const {
    return d->maxWorkers;
}

int ProcessWorkerPool::runningCount() const {
    return d->running;
}

int ProcessWorkerPool::queuedCount() const {
    return d->queue.size();
}

QString ProcessWorkerPool::hostExecutable() const {
    return d->hostExecutable;
}

void ProcessWorkerPool::startQueuedJobs() {
    while (d->running < d->maxWorkers && !d->queue.isEmpty()) {
        launch(d->queue.takeFirst());
    }
}

void ProcessWorkerPool::launch(const QString& jobId) {
    auto it = d->jobs.find(jobId);
    if (it == d->jobs.end()) {
        return;
    }

    auto* process = new QProcess(this);
    it->process = process;
    ++d->running;

    process->setProgram(d->hostExecutable);
    process->setArguments({QStringLiteral("--request-id"), jobId});
    process->setProcessChannelMode(QProcess::SeparateChannels);

    connect(process, &QProcess::started, this, [this, jobId, process]() {
        auto job = d->jobs.find(jobId);
        if (job == d->jobs.end()) {
            return;
        }
        process->write(job->payload);
        process->closeWriteChannel();
        emit workerStarted(jobId, process->processId());
    });

    connect(process, &QProcess::readyReadStandardOutput, this, [this, jobId, process]() {
        auto job = d->jobs.find(jobId);
        if (job != d->jobs.end()) {
            job->stdoutData.append(process->readAllStandardOutput());
        }
    });

    connect(process, &QProcess::readyReadStandardError, this, [this, jobId, process]() {
        auto job = d->jobs.find(jobId);
        if (job != d->jobs.end()) {
            ProcessWorkerPoolPrivate::appendCapped(job->stderrData, process->readAllStandardError());
        }
    });

    connect(process, &QProcess::finished, this, [this, jobId](int exitCode, QProcess::ExitStatus exitStatus) {
        handleFinished(jobId, exitCode, exitStatus);
    });

    connect(process, &QProcess::errorOccurred, this, [this, jobId](QProcess::ProcessError error) {
        handleError(jobId, error);
    });

    CORRAL_DEBUG("Starting {} for job {}", d->hostExecutable.toStdString(), jobId.toStdString());
    process->start();
}

void ProcessWorkerPool::handleFinished(const QString& jobId, int exitCode, QProcess::ExitStatus exitStatus) {
    auto it = d->jobs.find(jobId);
    if (it == d->jobs.end()) {
        return;
    }

    QProcess* process = it->process;
    it->stdoutData.append(process->readAllStandardOutput());
    ProcessWorkerPoolPrivate::appendCapped(it->stderrData, process->readAllStandardError());

    const PluginOutcome outcome = parseResponse(it->stdoutData, it->stderrData, exitCode, exitStatus);
    ProcessWorkerPoolPrivate::settle(it->promise, outcome);

    d->jobs.erase(it);
    --d->running;
    process->deleteLater();

    emit workerFinished(jobId, exitCode);
    startQueuedJobs();
}

void ProcessWorkerPool::handleError(const QString& jobId, QProcess::ProcessError error) {
    if (error != QProcess::FailedToStart) {
        // Crashes and I/O errors are followed by finished()
        CORRAL_DEBUG("Worker for job {} reported process error {}", jobId.toStdString(), static_cast<int>(error));
        return;
    }

    auto it = d->jobs.find(jobId);
    if (it == d->jobs.end()) {
        return;
    }

    QProcess* process = it->process;
    CORRAL_ERROR("Failed to start plugin host {}: {}",
                 d->hostExecutable.toStdString(), process->errorString().toStdString());

    ProcessWorkerPoolPrivate::settle(it->promise, PluginOutcome(makeUnexpected(
        makeFault(PluginError::Execution, QStringLiteral("Failed to start plugin host %1: %2")
                                              .arg(d->hostExecutable, process->errorString())))));

    d->jobs.erase(it);
    --d->running;
    process->deleteLater();
    startQueuedJobs();
}

PluginOutcome ProcessWorkerPool::parseResponse(const QByteArray& stdoutData,
                                               const QByteArray& stderrData,
                                               int exitCode,
                                               QProcess::ExitStatus exitStatus) {
    const QString workerStderr = QString::fromUtf8(stderrData);

    auto failure = [&workerStderr](const QString& message) -> PluginOutcome {
        PluginFault fault = makeFault(PluginError::Execution, message);
        fault.traceback = workerStderr;
        fault.workerStderr = workerStderr;
        return makeUnexpected(fault);
    };

    if (exitStatus == QProcess::CrashExit) {
        return failure(QStringLiteral("Plugin worker crashed"));
    }

    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(stdoutData, &parseError);
    if (parseError.error != QJsonParseError::NoError || !document.isObject()) {
        return failure(QStringLiteral("Plugin worker exited with code %1 without a valid response").arg(exitCode));
    }

    PluginOutcome outcome = PluginInvoker::outcomeFromJson(document.object());
    if (outcome) {
        outcome.value().workerStderr = workerStderr;
    } else {
        outcome.error().workerStderr = workerStderr;
    }
    return outcome;
}

} // namespace Corral
