#include "PluginTypes.hpp"

#include <QtCore/QDir>
#include <QtCore/QFileInfo>
#include <QtCore/QJsonArray>

namespace Corral {

namespace {

int positiveOr(int value, int fallback) {
    return value > 0 ? value : fallback;
}

QJsonArray toJsonArray(const QStringList& list) {
    QJsonArray array;
    for (const QString& item : list) {
        array.append(item);
    }
    return array;
}

QStringList toStringList(const QJsonValue& value, const QStringList& fallback = QStringList()) {
    if (!value.isArray()) {
        return fallback;
    }
    QStringList list;
    for (const QJsonValue& item : value.toArray()) {
        list.append(item.toString());
    }
    return list;
}

} // namespace

ResourceLimits ResourceLimits::mergedOnto(const ResourceLimits& defaults) const {
    ResourceLimits merged;
    merged.maxMemoryMb = positiveOr(maxMemoryMb, defaults.maxMemoryMb);
    merged.maxCpuTimeSeconds = positiveOr(maxCpuTimeSeconds, defaults.maxCpuTimeSeconds);
    merged.maxWallTimeSeconds = positiveOr(maxWallTimeSeconds, defaults.maxWallTimeSeconds);
    merged.maxFileDescriptors = positiveOr(maxFileDescriptors, defaults.maxFileDescriptors);
    merged.maxProcesses = positiveOr(maxProcesses, defaults.maxProcesses);
    merged.maxThreads = positiveOr(maxThreads, defaults.maxThreads);
    merged.maxOutputSizeKb = positiveOr(maxOutputSizeKb, defaults.maxOutputSizeKb);
    return merged;
}

QJsonObject ResourceLimits::toJson() const {
    QJsonObject json;
    json["max_memory_mb"] = maxMemoryMb;
    json["max_cpu_time_seconds"] = maxCpuTimeSeconds;
    json["max_wall_time_seconds"] = maxWallTimeSeconds;
    json["max_file_descriptors"] = maxFileDescriptors;
    json["max_processes"] = maxProcesses;
    json["max_threads"] = maxThreads;
    json["max_output_size_kb"] = maxOutputSizeKb;
    return json;
}

ResourceLimits ResourceLimits::fromJson(const QJsonObject& json, const ResourceLimits& defaults) {
    ResourceLimits limits;
    limits.maxMemoryMb = json.value("max_memory_mb").toInt(0);
    limits.maxCpuTimeSeconds = json.value("max_cpu_time_seconds").toInt(0);
    limits.maxWallTimeSeconds = json.value("max_wall_time_seconds").toInt(0);
    limits.maxFileDescriptors = json.value("max_file_descriptors").toInt(0);
    limits.maxProcesses = json.value("max_processes").toInt(0);
    limits.maxThreads = json.value("max_threads").toInt(0);
    limits.maxOutputSizeKb = json.value("max_output_size_kb").toInt(0);
    return limits.mergedOnto(defaults);
}

QStringList SecurityPolicy::defaultAllowedBuiltins() {
    return {
        "len", "str", "int", "float", "bool", "list", "dict", "tuple", "set",
        "range", "enumerate", "zip", "min", "max", "sum", "abs", "round",
        "sorted", "reversed", "isinstance", "print"
    };
}

QJsonObject SecurityPolicy::toJson() const {
    QJsonObject json;
    json["allow_network"] = allowNetwork;
    json["allow_file_system"] = allowFileSystem;
    json["allow_subprocess"] = allowSubprocess;
    json["allow_imports"] = toJsonArray(allowImports);
    json["blocked_imports"] = toJsonArray(blockedImports);
    json["allowed_builtins"] = toJsonArray(allowedBuiltins);
    return json;
}

SecurityPolicy SecurityPolicy::fromJson(const QJsonObject& json) {
    SecurityPolicy policy;
    policy.allowNetwork = json.value("allow_network").toBool(false);
    policy.allowFileSystem = json.value("allow_file_system").toBool(false);
    policy.allowSubprocess = json.value("allow_subprocess").toBool(false);
    policy.allowImports = toStringList(json.value("allow_imports"));
    policy.blockedImports = toStringList(json.value("blocked_imports"));
    policy.allowedBuiltins = toStringList(json.value("allowed_builtins"), defaultAllowedBuiltins());
    return policy;
}

bool ExecutionResult::isTerminal() const {
    return status != ExecutionStatus::Pending && status != ExecutionStatus::Running;
}

Expected<PluginManifest, QString> PluginManifest::fromJson(const QJsonObject& json) {
    PluginManifest manifest;
    manifest.name = json.value("name").toString();
    manifest.version = json.value("version").toString(QStringLiteral("0.0.0"));
    manifest.entryPoint = json.value("entry_point").toString();

    if (manifest.name.isEmpty()) {
        return makeUnexpected(QStringLiteral("Manifest is missing 'name'"));
    }
    if (manifest.entryPoint.isEmpty()) {
        return makeUnexpected(QStringLiteral("Manifest '%1' is missing 'entry_point'").arg(manifest.name));
    }

    for (auto it = json.constBegin(); it != json.constEnd(); ++it) {
        if (it.key() == "name" || it.key() == "version" || it.key() == "entry_point") {
            continue;
        }
        manifest.extensions.insert(it.key(), it.value().toVariant());
    }
    return manifest;
}

bool PluginMetadata::isExecutable() const {
    return status == PluginStatus::Registered
        || status == PluginStatus::Loaded
        || status == PluginStatus::Active;
}

QString PluginMetadata::libraryPath() const {
    QFileInfo info(filesystemPath);
    if (!info.isDir()) {
        return filesystemPath;
    }
    QString library = manifest.extensions.value("library").toString();
    if (library.isEmpty()) {
        library = QStringLiteral("lib%1.so").arg(manifest.name);
    }
    return QDir(filesystemPath).filePath(library);
}

QVariantMap ExecutionMetrics::toVariantMap() const {
    QVariantMap map;
    map["executions_total"] = executionsTotal;
    map["executions_successful"] = executionsSuccessful;
    map["executions_failed"] = executionsFailed;
    map["executions_timeout"] = executionsTimeout;
    map["executions_cancelled"] = executionsCancelled;
    map["average_execution_time"] = averageExecutionTime;
    map["total_execution_time"] = totalExecutionTime;
    map["success_rate"] = successRate;
    map["active_executions"] = activeExecutions;
    return map;
}

QString toString(ExecutionMode mode) {
    switch (mode) {
        case ExecutionMode::Direct: return "direct";
        case ExecutionMode::ThreadIsolated: return "thread_isolated";
        case ExecutionMode::ProcessIsolated: return "process_isolated";
        case ExecutionMode::Sandboxed: return "sandboxed";
    }
    return "unknown";
}

QString toString(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::Pending: return "pending";
        case ExecutionStatus::Running: return "running";
        case ExecutionStatus::Completed: return "completed";
        case ExecutionStatus::Failed: return "failed";
        case ExecutionStatus::Timeout: return "timeout";
        case ExecutionStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

QString toString(PluginStatus status) {
    switch (status) {
        case PluginStatus::Discovered: return "discovered";
        case PluginStatus::Registered: return "registered";
        case PluginStatus::Loaded: return "loaded";
        case PluginStatus::Active: return "active";
        case PluginStatus::Disabled: return "disabled";
        case PluginStatus::Error: return "error";
    }
    return "unknown";
}

QString toString(PluginError error) {
    switch (error) {
        case PluginError::Validation: return "validation";
        case PluginError::NotFound: return "not_found";
        case PluginError::ImportRestricted: return "import_restricted";
        case PluginError::PermissionDenied: return "permission_denied";
        case PluginError::Timeout: return "timeout";
        case PluginError::Cancelled: return "cancelled";
        case PluginError::OutputTooLarge: return "output_too_large";
        case PluginError::Execution: return "execution";
    }
    return "unknown";
}

std::optional<ExecutionMode> executionModeFromString(const QString& name) {
    const QString normalized = name.trimmed().toLower().replace('-', '_');
    if (normalized == "direct") return ExecutionMode::Direct;
    if (normalized == "thread_isolated") return ExecutionMode::ThreadIsolated;
    if (normalized == "process_isolated") return ExecutionMode::ProcessIsolated;
    if (normalized == "sandboxed") return ExecutionMode::Sandboxed;
    return std::nullopt;
}

std::optional<PluginError> pluginErrorFromString(const QString& name) {
    static const PluginError kinds[] = {
        PluginError::Validation, PluginError::NotFound, PluginError::ImportRestricted,
        PluginError::PermissionDenied, PluginError::Timeout, PluginError::Cancelled,
        PluginError::OutputTooLarge, PluginError::Execution
    };
    for (PluginError kind : kinds) {
        if (toString(kind) == name) {
            return kind;
        }
    }
    return std::nullopt;
}

QVariantList violationsToVariant(const QList<SecurityViolation>& violations) {
    QVariantList list;
    for (const SecurityViolation& violation : violations) {
        QVariantMap entry;
        entry["capability"] = violation.capability;
        entry["detail"] = violation.detail;
        entry["severity"] = violation.severity;
        list.append(entry);
    }
    return list;
}

QJsonArray violationsToJson(const QList<SecurityViolation>& violations) {
    QJsonArray array;
    for (const SecurityViolation& violation : violations) {
        QJsonObject entry;
        entry["capability"] = violation.capability;
        entry["detail"] = violation.detail;
        entry["severity"] = violation.severity;
        array.append(entry);
    }
    return array;
}

QList<SecurityViolation> violationsFromJson(const QJsonArray& json) {
    QList<SecurityViolation> violations;
    for (const QJsonValue& value : json) {
        const QJsonObject entry = value.toObject();
        SecurityViolation violation;
        violation.capability = entry.value("capability").toString();
        violation.detail = entry.value("detail").toString();
        violation.severity = entry.value("severity").toString(QStringLiteral("medium"));
        violations.append(violation);
    }
    return violations;
}

} // namespace Corral
