#pragma once

#include <QtCore/QSettings>
#include <QtCore/QStandardPaths>
#include <QtCore/QString>
#include <QtCore/QVariant>
#include <memory>

#include "core/plugin/PluginTypes.hpp"

namespace Corral {

class Config {
public:
    static Config& instance();

    void initialize(const QString& organizationName = "Corral",
                   const QString& applicationName = "PluginEngine");

    // Explicit INI file, used by the plugin host and by tests.
    void initializeFromFile(const QString& iniPath);

    bool isInitialized() const { return settings_ != nullptr; }

    // General settings
    QVariant getValue(const QString& key, const QVariant& defaultValue = QVariant()) const;
    void setValue(const QString& key, const QVariant& value);

    // Typed convenience methods
    QString getString(const QString& key, const QString& defaultValue = QString()) const;
    int getInt(const QString& key, int defaultValue = 0) const;
    bool getBool(const QString& key, bool defaultValue = false) const;
    double getDouble(const QString& key, double defaultValue = 0.0) const;
    QStringList getStringList(const QString& key, const QStringList& defaultValue = QStringList()) const;

    void setString(const QString& key, const QString& value);
    void setInt(const QString& key, int value);
    void setBool(const QString& key, bool value);
    void setDouble(const QString& key, double value);

    struct EngineSettings {
        ResourceLimits defaultLimits;
        SecurityPolicy defaultPolicy;
        int threadPoolSize = 4;
        int processPoolSize = 2;
        int historyLimit = 1000;
        int defaultTimeoutSeconds = 30;
        QString pluginHostExecutable;       // empty = next to the application binary
        bool applyLimitsInSharedProcess = false;
    };

    struct LoggingSettings {
        QString level = "info";
        QString logFilePath;
    };

    EngineSettings getEngineSettings() const;
    LoggingSettings getLoggingSettings() const;

    void setEngineSettings(const EngineSettings& settings);
    void setLoggingSettings(const LoggingSettings& settings);

    // Points Logger at the configured file and level.
    void initializeLogging() const;

    // Paths
    QString getDataPath() const;
    QString getLogPath() const;

    void sync();

private:
    Config() = default;
    std::unique_ptr<QSettings> settings_;

    void ensureDirectoriesExist();
};

} // namespace Corral
