#include "Config.hpp"
#include "Logger.hpp"
#include <QtCore/QDir>
#include <QtCore/QFileInfo>
#include <QtCore/QStringList>

namespace Corral {

Config& Config::instance() {
    static Config instance;
    return instance;
}

void Config::initialize(const QString& organizationName, const QString& applicationName) {
    settings_ = std::make_unique<QSettings>(organizationName, applicationName);
    ensureDirectoriesExist();
    CORRAL_INFO("Config initialized for {}/{}",
                organizationName.toStdString(), applicationName.toStdString());
}

void Config::initializeFromFile(const QString& iniPath) {
    settings_ = std::make_unique<QSettings>(iniPath, QSettings::IniFormat);
    if (settings_->status() != QSettings::NoError) {
        CORRAL_WARN("Config file {} could not be read, using defaults", iniPath.toStdString());
    }
    CORRAL_INFO("Config initialized from {}", iniPath.toStdString());
}

QVariant Config::getValue(const QString& key, const QVariant& defaultValue) const {
    if (!settings_) return defaultValue;
    return settings_->value(key, defaultValue);
}

void Config::setValue(const QString& key, const QVariant& value) {
    if (settings_) {
        settings_->setValue(key, value);
    }
}

QString Config::getString(const QString& key, const QString& defaultValue) const {
    return getValue(key, defaultValue).toString();
}

int Config::getInt(const QString& key, int defaultValue) const {
    return getValue(key, defaultValue).toInt();
}

bool Config::getBool(const QString& key, bool defaultValue) const {
    return getValue(key, defaultValue).toBool();
}

double Config::getDouble(const QString& key, double defaultValue) const {
    return getValue(key, defaultValue).toDouble();
}

QStringList Config::getStringList(const QString& key, const QStringList& defaultValue) const {
    return getValue(key, defaultValue).toStringList();
}

void Config::setString(const QString& key, const QString& value) {
    setValue(key, value);
}

void Config::setInt(const QString& key, int value) {
    setValue(key, value);
}

void Config::setBool(const QString& key, bool value) {
    setValue(key, value);
}

void Config::setDouble(const QString& key, double value) {
    setValue(key, value);
}

Config::EngineSettings Config::getEngineSettings() const {
    EngineSettings settings;
    settings.threadPoolSize = getInt("engine/threadPoolSize", 4);
    settings.processPoolSize = getInt("engine/processPoolSize", 2);
    settings.historyLimit = getInt("engine/historyLimit", 1000);
    settings.defaultTimeoutSeconds = getInt("engine/defaultTimeoutSeconds", 30);
    settings.pluginHostExecutable = getString("engine/pluginHostExecutable");
    settings.applyLimitsInSharedProcess = getBool("engine/applyLimitsInSharedProcess", false);

    ResourceLimits& limits = settings.defaultLimits;
    limits.maxMemoryMb = getInt("limits/maxMemoryMb", limits.maxMemoryMb);
    limits.maxCpuTimeSeconds = getInt("limits/maxCpuTimeSeconds", limits.maxCpuTimeSeconds);
    limits.maxWallTimeSeconds = getInt("limits/maxWallTimeSeconds", limits.maxWallTimeSeconds);
    limits.maxFileDescriptors = getInt("limits/maxFileDescriptors", limits.maxFileDescriptors);
    limits.maxProcesses = getInt("limits/maxProcesses", limits.maxProcesses);
    limits.maxThreads = getInt("limits/maxThreads", limits.maxThreads);
    limits.maxOutputSizeKb = getInt("limits/maxOutputSizeKb", limits.maxOutputSizeKb);
    // Garbage in the store never produces a zero limit
    limits = limits.mergedOnto(ResourceLimits());

    SecurityPolicy& policy = settings.defaultPolicy;
    policy.allowNetwork = getBool("policy/allowNetwork", false);
    policy.allowFileSystem = getBool("policy/allowFileSystem", false);
    policy.allowSubprocess = getBool("policy/allowSubprocess", false);
    policy.allowImports = getStringList("policy/allowImports");
    policy.blockedImports = getStringList("policy/blockedImports");
    policy.allowedBuiltins = getStringList("policy/allowedBuiltins",
                                           SecurityPolicy::defaultAllowedBuiltins());

    if (settings.threadPoolSize < 1) settings.threadPoolSize = 1;
    if (settings.processPoolSize < 1) settings.processPoolSize = 1;
    if (settings.historyLimit < 1) settings.historyLimit = 1000;
    if (settings.defaultTimeoutSeconds < 1) settings.defaultTimeoutSeconds = 30;

    return settings;
}

Config::LoggingSettings Config::getLoggingSettings() const {
    LoggingSettings settings;
    settings.level = getString("logging/level", "info");
    settings.logFilePath = getString("logging/logFilePath", getLogPath() + "/corral.log");
    return settings;
}

void Config::setEngineSettings(const EngineSettings& settings) {
    setValue("engine/threadPoolSize", settings.threadPoolSize);
    setValue("engine/processPoolSize", settings.processPoolSize);
    setValue("engine/historyLimit", settings.historyLimit);
    setValue("engine/defaultTimeoutSeconds", settings.defaultTimeoutSeconds);
    setValue("engine/pluginHostExecutable", settings.pluginHostExecutable);
    setValue("engine/applyLimitsInSharedProcess", settings.applyLimitsInSharedProcess);

    const ResourceLimits& limits = settings.defaultLimits;
    setValue("limits/maxMemoryMb", limits.maxMemoryMb);
    setValue("limits/maxCpuTimeSeconds", limits.maxCpuTimeSeconds);
    setValue("limits/maxWallTimeSeconds", limits.maxWallTimeSeconds);
    setValue("limits/maxFileDescriptors", limits.maxFileDescriptors);
    setValue("limits/maxProcesses", limits.maxProcesses);
    setValue("limits/maxThreads", limits.maxThreads);
    setValue("limits/maxOutputSizeKb", limits.maxOutputSizeKb);

    const SecurityPolicy& policy = settings.defaultPolicy;
    setValue("policy/allowNetwork", policy.allowNetwork);
    setValue("policy/allowFileSystem", policy.allowFileSystem);
    setValue("policy/allowSubprocess", policy.allowSubprocess);
    setValue("policy/allowImports", policy.allowImports);
    setValue("policy/blockedImports", policy.blockedImports);
    setValue("policy/allowedBuiltins", policy.allowedBuiltins);
}

void Config::setLoggingSettings(const LoggingSettings& settings) {
    setValue("logging/level", settings.level);
    setValue("logging/logFilePath", settings.logFilePath);
}

void Config::initializeLogging() const {
    const LoggingSettings settings = getLoggingSettings();
    const QString logDir = QFileInfo(settings.logFilePath).absolutePath();
    if (!QDir().mkpath(logDir)) {
        CORRAL_WARN("Failed to create log directory: {}", logDir.toStdString());
    }
    Logger::instance().initialize(settings.logFilePath.toStdString(),
                                  Logger::levelFromString(settings.level.toStdString()));
}

QString Config::getDataPath() const {
    return QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
}

QString Config::getLogPath() const {
    return getDataPath() + "/logs";
}

void Config::sync() {
    if (settings_) {
        settings_->sync();
    }
}

void Config::ensureDirectoriesExist() {
    const QStringList paths = {
        getDataPath(),
        getLogPath()
    };

    for (const QString& path : paths) {
        QDir dir;
        if (!dir.mkpath(path)) {
            CORRAL_WARN("Failed to create directory: {}", path.toStdString());
        }
    }
}

} // namespace Corral
