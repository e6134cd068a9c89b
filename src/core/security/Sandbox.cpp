#include "Sandbox.hpp"
#include "../common/Logger.hpp"

#include <QtCore/QMutex>
#include <QtCore/QMutexLocker>
#include <QtCore/QThreadPool>

#ifdef Q_OS_UNIX
#include <unistd.h>
#endif

namespace Corral {

namespace {

// rlimits belong to the whole process. Overlapping shared-process sandboxes
// share one set: the first to enter applies and saves, the last to leave
// restores.
struct SharedProcessLimits {
    QMutex mutex;
    int holders = 0;
    std::unique_ptr<ResourceLimiter> limiter;
    SandboxReport report;
};

SharedProcessLimits& sharedProcessLimits() {
    static SharedProcessLimits state;
    return state;
}

} // namespace

Sandbox::Sandbox(const ResourceLimits& limits,
                 const SecurityPolicy& policy,
                 LimitScope scope,
                 bool applyLimitsInSharedProcess,
                 std::unique_ptr<ResourceLimiter> limiter)
    : limits_(limits)
    , scope_(scope)
    , limiter_(std::move(limiter))
    , capabilities_(std::make_unique<CapabilityTable>(policy)) {
    if (!limiter_) {
        limiter_ = createPlatformResourceLimiter(scope == LimitScope::DedicatedProcess
                                                     ? LimitMode::SoftAndHard
                                                     : LimitMode::SoftOnly);
    }
    enter(applyLimitsInSharedProcess);
}

Sandbox::~Sandbox() {
    exit();
}

void Sandbox::enter(bool applyLimitsInSharedProcess) {
    if (scope_ == LimitScope::SharedProcess && !applyLimitsInSharedProcess) {
        // Process-wide limits would apply to the whole engine
        report_.skipped << "memory" << "cpu" << "descriptors" << "processes";
        CORRAL_DEBUG("Sandbox: shared process, OS limits skipped");
        return;
    }

    if (scope_ == LimitScope::SharedProcess) {
        enterSharedProcess();
        return;
    }

    applyProcessLimits(true);

    QThreadPool* pool = QThreadPool::globalInstance();
    previousMaxThreadCount_ = pool->maxThreadCount();
    pool->setMaxThreadCount(limits_.maxThreads);
    report_.applied << "threads";

#ifdef Q_OS_UNIX
    alarm(static_cast<unsigned int>(limits_.maxWallTimeSeconds));
    alarmArmed_ = true;
    report_.applied << "wall_time";
#else
    report_.skipped << "wall_time";
#endif

    CORRAL_DEBUG("Sandbox: entered via {} (applied: {}, failed: {})",
                 limiter_->backendName().toStdString(),
                 report_.applied.join(",").toStdString(),
                 report_.failed.join(",").toStdString());
}

void Sandbox::applyProcessLimits(bool includeCpu) {
    record("memory", limiter_->applyMemoryLimit(static_cast<quint64>(limits_.maxMemoryMb) * 1024 * 1024));
    if (includeCpu) {
        record("cpu", limiter_->applyCpuLimit(static_cast<quint64>(limits_.maxCpuTimeSeconds)));
    } else {
        // RLIMIT_CPU counts the CPU time the engine has already used
        report_.skipped << "cpu";
    }
    record("descriptors", limiter_->applyDescriptorLimit(static_cast<quint64>(limits_.maxFileDescriptors)));
    record("processes", limiter_->applyProcessLimit(static_cast<quint64>(limits_.maxProcesses)));
}

void Sandbox::enterSharedProcess() {
    SharedProcessLimits& shared = sharedProcessLimits();
    QMutexLocker locker(&shared.mutex);
    holdsSharedLimits_ = true;

    if (shared.holders++ > 0) {
        report_ = shared.report;
        CORRAL_DEBUG("Sandbox: shared process limits already held by {} other sandboxes", shared.holders - 1);
        return;
    }

    applyProcessLimits(false);
    shared.report = report_;
    shared.limiter = std::move(limiter_);
    CORRAL_DEBUG("Sandbox: shared process limits applied (applied: {}, failed: {})",
                 report_.applied.join(",").toStdString(), report_.failed.join(",").toStdString());
}

void Sandbox::leaveSharedProcess() {
    SharedProcessLimits& shared = sharedProcessLimits();
    QMutexLocker locker(&shared.mutex);
    holdsSharedLimits_ = false;

    if (--shared.holders > 0) {
        return;
    }
    if (shared.limiter) {
        shared.limiter->restore();
        shared.limiter.reset();
    }
    shared.report = SandboxReport();
}

void Sandbox::exit() {
    if (holdsSharedLimits_) {
        leaveSharedProcess();
        return;
    }
#ifdef Q_OS_UNIX
    if (alarmArmed_) {
        alarm(0);
        alarmArmed_ = false;
    }
#endif
    if (previousMaxThreadCount_ > 0) {
        QThreadPool::globalInstance()->setMaxThreadCount(previousMaxThreadCount_);
        previousMaxThreadCount_ = -1;
    }
    limiter_->restore();
}

void Sandbox::record(const QString& kind, const Expected<void, LimitError>& result) {
    if (result) {
        report_.applied << kind;
        return;
    }
    if (result.error() == LimitError::Unsupported) {
        report_.skipped << kind;
        CORRAL_WARN("Sandbox: {} limit not supported on this platform", kind.toStdString());
    } else {
        report_.failed << kind;
        CORRAL_WARN("Sandbox: {} limit could not be applied", kind.toStdString());
    }
}

} // namespace Corral
