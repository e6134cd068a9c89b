#include "CapabilityTable.hpp"
#include "../common/Logger.hpp"

#include <QtCore/QMutexLocker>

namespace Corral {

CapabilityTable::CapabilityTable(const SecurityPolicy& policy)
    : policy_(policy) {
}

bool CapabilityTable::matchesModulePrefix(const QString& moduleName, const QString& prefix) {
    if (prefix.isEmpty()) {
        return false;
    }
    if (moduleName == prefix) {
        return true;
    }
    // Dotted-name boundary: "os" covers "os.path" but not "osx"
    return moduleName.startsWith(prefix) && moduleName.at(prefix.length()) == QLatin1Char('.');
}

bool CapabilityTable::isImportAllowed(const QString& moduleName) const {
    for (const QString& blocked : policy_.blockedImports) {
        if (matchesModulePrefix(moduleName, blocked)) {
            return false;
        }
    }
    if (policy_.allowImports.isEmpty()) {
        return true;
    }
    for (const QString& allowed : policy_.allowImports) {
        if (matchesModulePrefix(moduleName, allowed)) {
            return true;
        }
    }
    return false;
}

bool CapabilityTable::isBuiltinAllowed(const QString& name) const {
    return policy_.allowedBuiltins.contains(name);
}

Expected<void, PluginFault> CapabilityTable::requireBuiltin(const QString& name) {
    if (isBuiltinAllowed(name)) {
        return {};
    }
    return makeUnexpected(deny(PluginError::PermissionDenied, "builtin",
                               QStringLiteral("Builtin '%1' is not allowed").arg(name), "medium"));
}

Expected<void, PluginFault> CapabilityTable::importModule(const QString& moduleName) {
    if (isImportAllowed(moduleName)) {
        return {};
    }
    return makeUnexpected(deny(PluginError::ImportRestricted, "import",
                               QStringLiteral("Import of '%1' is restricted").arg(moduleName), "high"));
}

Expected<std::unique_ptr<QFile>, PluginFault> CapabilityTable::openFile(const QString& path,
                                                                         QIODevice::OpenMode mode) {
    if (!policy_.allowFileSystem) {
        return makeUnexpected(deny(PluginError::PermissionDenied, "file_system",
                                   QStringLiteral("File access denied: %1").arg(path), "high"));
    }

    auto file = std::make_unique<QFile>(path);
    if (!file->open(mode)) {
        PluginFault fault;
        fault.kind = PluginError::Execution;
        fault.message = QStringLiteral("Cannot open %1: %2").arg(path, file->errorString());
        return makeUnexpected(fault);
    }
    return std::move(file);
}

Expected<void, PluginFault> CapabilityTable::requireNetwork(const QString& host) {
    if (policy_.allowNetwork) {
        return {};
    }
    return makeUnexpected(deny(PluginError::PermissionDenied, "network",
                               QStringLiteral("Network access denied: %1").arg(host), "high"));
}

Expected<void, PluginFault> CapabilityTable::requireSubprocess(const QString& program) {
    if (policy_.allowSubprocess) {
        return {};
    }
    return makeUnexpected(deny(PluginError::PermissionDenied, "subprocess",
                               QStringLiteral("Subprocess execution denied: %1").arg(program), "critical"));
}

void CapabilityTable::print(const QString& line) {
    if (!isBuiltinAllowed("print")) {
        deny(PluginError::PermissionDenied, "builtin", QStringLiteral("Builtin 'print' is not allowed"), "low");
        return;
    }

    QMutexLocker locker(&mutex_);
    if (printed_.size() < MAX_PRINTED_LINES) {
        printed_.append(line);
    } else if (!printedOverflow_) {
        printedOverflow_ = true;
        CORRAL_DEBUG("Plugin output exceeded {} lines, dropping the rest", MAX_PRINTED_LINES);
    }
}

QStringList CapabilityTable::printedLines() const {
    QMutexLocker locker(&mutex_);
    return printed_;
}

QList<SecurityViolation> CapabilityTable::violations() const {
    QMutexLocker locker(&mutex_);
    return violations_;
}

PluginFault CapabilityTable::deny(PluginError kind, const QString& capability,
                                  const QString& detail, const QString& severity) {
    SecurityViolation violation{capability, detail, severity};
    CORRAL_WARN("Security violation: {}", violation.toString().toStdString());

    QMutexLocker locker(&mutex_);
    violations_.append(violation);

    PluginFault fault;
    fault.kind = kind;
    fault.message = detail;
    fault.violations = violations_;
    return fault;
}

} // namespace Corral
