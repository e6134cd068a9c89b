#pragma once

#include <QtCore/QDateTime>
#include <QtCore/QJsonArray>
#include <QtCore/QJsonObject>
#include <QtCore/QList>
#include <QtCore/QMetaType>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QVariant>
#include <optional>

#include "core/common/Expected.hpp"

namespace Corral {

enum class ExecutionMode {
    Direct,
    ThreadIsolated,
    ProcessIsolated,
    Sandboxed
};

enum class ExecutionStatus {
    Pending,
    Running,
    Completed,
    Failed,
    Timeout,
    Cancelled
};

// Lifecycle status reported by the registry. Only Registered, Loaded and
// Active plugins are executable.
enum class PluginStatus {
    Discovered,
    Registered,
    Loaded,
    Active,
    Disabled,
    Error
};

enum class PluginError {
    Validation,
    NotFound,
    ImportRestricted,
    PermissionDenied,
    Timeout,
    Cancelled,
    OutputTooLarge,
    Execution
};

struct ResourceLimits {
    int maxMemoryMb = 512;
    int maxCpuTimeSeconds = 30;
    int maxWallTimeSeconds = 60;
    int maxFileDescriptors = 256;
    int maxProcesses = 32;
    int maxThreads = 16;
    int maxOutputSizeKb = 1024;

    qint64 maxOutputBytes() const { return static_cast<qint64>(maxOutputSizeKb) * 1024; }

    // Non-positive fields take the value from defaults.
    ResourceLimits mergedOnto(const ResourceLimits& defaults) const;

    QJsonObject toJson() const;
    static ResourceLimits fromJson(const QJsonObject& json, const ResourceLimits& defaults = ResourceLimits());
};

struct SecurityPolicy {
    bool allowNetwork = false;
    bool allowFileSystem = false;
    bool allowSubprocess = false;
    QStringList allowImports;
    QStringList blockedImports;
    QStringList allowedBuiltins = defaultAllowedBuiltins();

    static QStringList defaultAllowedBuiltins();

    QJsonObject toJson() const;
    static SecurityPolicy fromJson(const QJsonObject& json);
};

struct ExecutionRequest {
    QString pluginName;
    QVariantMap parameters;
    ExecutionMode executionMode = ExecutionMode::Sandboxed;
    std::optional<int> timeoutSeconds; // engine default when unset
    std::optional<ResourceLimits> resourceLimits;
    std::optional<SecurityPolicy> securityPolicy;
    QString userId;
    QString sessionId;
    QString requestId; // generated by the engine when empty
};

struct ExecutionResult {
    QString requestId;
    QString pluginName;
    ExecutionStatus status = ExecutionStatus::Pending;
    QVariant result;
    QString error;
    double executionTime = 0.0; // seconds
    QDateTime startedAt;
    QDateTime completedAt;
    QVariantMap metadata;
    QString userId;
    QString sessionId;

    bool isTerminal() const;
};

struct SecurityViolation {
    QString capability;
    QString detail;
    QString severity = QStringLiteral("medium");

    QString toString() const {
        return QStringLiteral("[%1] %2: %3").arg(severity, capability, detail);
    }
};

struct PluginFault {
    PluginError kind = PluginError::Execution;
    QString message;
    QString traceback;
    QList<SecurityViolation> violations;
    QString workerStderr; // tail of the plugin host's stderr, process modes only
};

struct PluginOutput {
    QVariant value;
    QStringList printed;
    QList<SecurityViolation> violations;
    QString workerStderr;
};

// What one unit of plugin work produces, whichever worker ran it.
using PluginOutcome = Expected<PluginOutput, PluginFault>;

struct PluginManifest {
    QString name;
    QString version;
    QString entryPoint;
    QVariantMap extensions; // parameters / input_schema / allow_additional_parameters / imports / library

    static Expected<PluginManifest, QString> fromJson(const QJsonObject& json);
};

struct PluginMetadata {
    PluginManifest manifest;
    QString filesystemPath;
    PluginStatus status = PluginStatus::Registered;

    bool isExecutable() const;
    QString libraryPath() const;
};

struct ExecutionMetrics {
    qint64 executionsTotal = 0;
    qint64 executionsSuccessful = 0;
    qint64 executionsFailed = 0;
    qint64 executionsTimeout = 0;
    qint64 executionsCancelled = 0;
    double averageExecutionTime = 0.0;
    double totalExecutionTime = 0.0;
    double successRate = 0.0;
    int activeExecutions = 0;

    QVariantMap toVariantMap() const;
};

QString toString(ExecutionMode mode);
QString toString(ExecutionStatus status);
QString toString(PluginStatus status);
QString toString(PluginError error);

std::optional<ExecutionMode> executionModeFromString(const QString& name);
std::optional<PluginError> pluginErrorFromString(const QString& name);

QVariantList violationsToVariant(const QList<SecurityViolation>& violations);
QJsonArray violationsToJson(const QList<SecurityViolation>& violations);
QList<SecurityViolation> violationsFromJson(const QJsonArray& json);

} // namespace Corral

Q_DECLARE_METATYPE(Corral::ExecutionResult)
