#include "PosixResourceLimiter.hpp"
#include "core/common/Logger.hpp"

#include <cerrno>
#include <cstring>

namespace Corral {

PosixResourceLimiter::PosixResourceLimiter(LimitMode mode)
    : mode_(mode) {
}

PosixResourceLimiter::~PosixResourceLimiter() {
    restore();
}

Expected<void, LimitError> PosixResourceLimiter::applyMemoryLimit(quint64 bytes) {
#ifdef RLIMIT_AS
    return applyLimit(RLIMIT_AS, "RLIMIT_AS", bytes);
#else
    Q_UNUSED(bytes);
    return makeUnexpected(LimitError::Unsupported);
#endif
}

Expected<void, LimitError> PosixResourceLimiter::applyCpuLimit(quint64 seconds) {
    return applyLimit(RLIMIT_CPU, "RLIMIT_CPU", seconds);
}

Expected<void, LimitError> PosixResourceLimiter::applyDescriptorLimit(quint64 count) {
    return applyLimit(RLIMIT_NOFILE, "RLIMIT_NOFILE", count);
}

Expected<void, LimitError> PosixResourceLimiter::applyProcessLimit(quint64 count) {
#ifdef RLIMIT_NPROC
    return applyLimit(RLIMIT_NPROC, "RLIMIT_NPROC", count);
#else
    Q_UNUSED(count);
    return makeUnexpected(LimitError::Unsupported);
#endif
}

Expected<void, LimitError> PosixResourceLimiter::applyLimit(int resource, const char* name, quint64 value) {
    struct rlimit current {};
    if (getrlimit(resource, &current) != 0) {
        Logger::instance().warn("PosixResourceLimiter: getrlimit({}) failed: {}", name, std::strerror(errno));
        return makeUnexpected(LimitError::Rejected);
    }

    struct rlimit requested = current;
    rlim_t target = static_cast<rlim_t>(value);
    if (current.rlim_max != RLIM_INFINITY && target > current.rlim_max) {
        target = current.rlim_max;
    }
    requested.rlim_cur = target;
    if (mode_ == LimitMode::SoftAndHard) {
        requested.rlim_max = target;
        // SIGXCPU at the soft limit, SIGKILL a second later
        if (resource == RLIMIT_CPU && (current.rlim_max == RLIM_INFINITY || target < current.rlim_max)) {
            requested.rlim_max = target + 1;
        }
    }

    if (setrlimit(resource, &requested) != 0) {
        Logger::instance().warn("PosixResourceLimiter: setrlimit({}, {}) failed: {}",
                                name, static_cast<unsigned long long>(target), std::strerror(errno));
        return makeUnexpected(LimitError::Rejected);
    }

    if (!saved_.contains(resource)) {
        saved_.insert(resource, current);
    }
    Logger::instance().debug("PosixResourceLimiter: {} set to {}", name, static_cast<unsigned long long>(target));
    return {};
}

void PosixResourceLimiter::restore() {
    if (mode_ == LimitMode::SoftAndHard) {
        // Lowered hard limits cannot be raised by an unprivileged process
        saved_.clear();
        return;
    }

    for (auto it = saved_.constBegin(); it != saved_.constEnd(); ++it) {
        struct rlimit previous = it.value();
        if (setrlimit(it.key(), &previous) != 0) {
            Logger::instance().warn("PosixResourceLimiter: failed to restore limit {}: {}",
                                    it.key(), std::strerror(errno));
        }
    }
    saved_.clear();
}

std::unique_ptr<ResourceLimiter> createPlatformResourceLimiter(LimitMode mode) {
    return std::make_unique<PosixResourceLimiter>(mode);
}

} // namespace Corral
