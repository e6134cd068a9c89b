#pragma once

#include <QtCore/QJsonObject>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QVariant>
#include <functional>

#include "core/common/Expected.hpp"
#include "core/plugin/PluginTypes.hpp"
#include "core/security/Sandbox.hpp"

namespace Corral {

// Everything needed to run one plugin call, in any worker.
struct Invocation {
    QString requestId;
    QString pluginName;
    QString libraryPath;
    QString entryPoint;
    QVariantMap parameters;
    ResourceLimits limits;
    SecurityPolicy policy;
    QStringList declaredImports;

    // Plugin host wire format
    QJsonObject toJson() const;
    static Expected<Invocation, QString> fromJson(const QJsonObject& json);
};

class PluginInvoker {
public:
    using CancellationCheck = std::function<bool()>;

    // Never throws. Exceptions escaping the plugin become Execution faults.
    static PluginOutcome invoke(const Invocation& invocation,
                                LimitScope scope,
                                const CancellationCheck& cancellationRequested = CancellationCheck(),
                                bool applyLimitsInSharedProcess = false);

    static QJsonObject outcomeToJson(const PluginOutcome& outcome);
    static PluginOutcome outcomeFromJson(const QJsonObject& json);

private:
    static PluginOutcome runEntryPoint(const Invocation& invocation,
                                       CapabilityTable& capabilities,
                                       const CancellationCheck& cancellationRequested);
};

} // namespace Corral
