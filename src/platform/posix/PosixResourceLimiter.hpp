#pragma once

#include "core/security/ResourceLimiter.hpp"

#include <QtCore/QMap>
#include <sys/resource.h>

namespace Corral {

/**
 * @brief setrlimit-based limiter
 *
 * Maps memory to RLIMIT_AS, CPU time to RLIMIT_CPU, descriptors to
 * RLIMIT_NOFILE and processes to RLIMIT_NPROC. Requested values are clamped
 * to the current hard limit. In SoftAndHard mode the hard limit is lowered
 * too and restore() cannot raise it again.
 */
class PosixResourceLimiter : public ResourceLimiter {
public:
    explicit PosixResourceLimiter(LimitMode mode);
    ~PosixResourceLimiter() override;

    QString backendName() const override { return QStringLiteral("posix-rlimit"); }

    Expected<void, LimitError> applyMemoryLimit(quint64 bytes) override;
    Expected<void, LimitError> applyCpuLimit(quint64 seconds) override;
    Expected<void, LimitError> applyDescriptorLimit(quint64 count) override;
    Expected<void, LimitError> applyProcessLimit(quint64 count) override;
    void restore() override;

private:
    Expected<void, LimitError> applyLimit(int resource, const char* name, quint64 value);

    LimitMode mode_;
    QMap<int, struct rlimit> saved_;
};

} // namespace Corral
