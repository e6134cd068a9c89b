#include "ResourceLimiter.hpp"

namespace Corral {

QString toString(LimitError error) {
    switch (error) {
        case LimitError::Unsupported: return "unsupported";
        case LimitError::Rejected: return "rejected";
    }
    return "unknown";
}

#ifndef Q_OS_UNIX
std::unique_ptr<ResourceLimiter> createPlatformResourceLimiter(LimitMode) {
    return std::make_unique<NullResourceLimiter>();
}
#endif

} // namespace Corral
