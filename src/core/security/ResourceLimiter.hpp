#pragma once

#include <QtCore/QString>
#include <QtCore/QtGlobal>
#include <memory>

#include "core/common/Expected.hpp"

namespace Corral {

enum class LimitError {
    Unsupported,
    Rejected
};

enum class LimitMode {
    SoftOnly,     // restorable, used inside a shared process
    SoftAndHard   // irreversible, used by a dedicated worker process
};

// OS resource caps for the current process. Every kind is applied
// independently; a failure of one kind does not affect the others.
class ResourceLimiter {
public:
    virtual ~ResourceLimiter() = default;

    virtual QString backendName() const = 0;

    virtual Expected<void, LimitError> applyMemoryLimit(quint64 bytes) = 0;
    virtual Expected<void, LimitError> applyCpuLimit(quint64 seconds) = 0;
    virtual Expected<void, LimitError> applyDescriptorLimit(quint64 count) = 0;
    virtual Expected<void, LimitError> applyProcessLimit(quint64 count) = 0;

    // Puts back every soft limit changed since construction.
    virtual void restore() = 0;
};

class NullResourceLimiter : public ResourceLimiter {
public:
    QString backendName() const override { return QStringLiteral("none"); }

    Expected<void, LimitError> applyMemoryLimit(quint64) override { return makeUnexpected(LimitError::Unsupported); }
    Expected<void, LimitError> applyCpuLimit(quint64) override { return makeUnexpected(LimitError::Unsupported); }
    Expected<void, LimitError> applyDescriptorLimit(quint64) override { return makeUnexpected(LimitError::Unsupported); }
    Expected<void, LimitError> applyProcessLimit(quint64) override { return makeUnexpected(LimitError::Unsupported); }
    void restore() override {}
};

// POSIX setrlimit backend where available, NullResourceLimiter elsewhere.
std::unique_ptr<ResourceLimiter> createPlatformResourceLimiter(LimitMode mode);

QString toString(LimitError error);

} // namespace Corral
