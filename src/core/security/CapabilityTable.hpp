#pragma once

#include <QtCore/QList>
#include <QtCore/QMutex>
#include <QtCore/QStringList>

#include "core/plugin/PluginApi.hpp"
#include "core/plugin/PluginTypes.hpp"

namespace Corral {

// Per-invocation allow-list. Every denial is recorded as a violation.
// Safe to call from the plugin's own worker threads.
class CapabilityTable : public PluginCapabilities {
public:
    static constexpr int MAX_PRINTED_LINES = 1000;

    explicit CapabilityTable(const SecurityPolicy& policy);
    ~CapabilityTable() override = default;

    CapabilityTable(const CapabilityTable&) = delete;
    CapabilityTable& operator=(const CapabilityTable&) = delete;

    bool isBuiltinAllowed(const QString& name) const override;
    Expected<void, PluginFault> requireBuiltin(const QString& name) override;
    Expected<void, PluginFault> importModule(const QString& moduleName) override;
    Expected<std::unique_ptr<QFile>, PluginFault> openFile(const QString& path,
                                                            QIODevice::OpenMode mode) override;
    Expected<void, PluginFault> requireNetwork(const QString& host) override;
    Expected<void, PluginFault> requireSubprocess(const QString& program) override;
    void print(const QString& line) override;

    // Import decision without recording anything.
    bool isImportAllowed(const QString& moduleName) const;
    static bool matchesModulePrefix(const QString& moduleName, const QString& prefix);

    const SecurityPolicy& policy() const { return policy_; }
    QStringList printedLines() const;
    QList<SecurityViolation> violations() const;

private:
    PluginFault deny(PluginError kind, const QString& capability,
                     const QString& detail, const QString& severity);

    const SecurityPolicy policy_;
    mutable QMutex mutex_;
    QStringList printed_;
    bool printedOverflow_ = false;
    QList<SecurityViolation> violations_;
};

} // namespace Corral
