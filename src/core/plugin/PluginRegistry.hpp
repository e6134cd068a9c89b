#pragma once

#include <QtCore/QHash>
#include <QtCore/QMutex>
#include <QtCore/QString>
#include <QtCore/QStringList>

#include "core/common/Expected.hpp"
#include "core/plugin/PluginTypes.hpp"

namespace Corral {

enum class RegistryError {
    PluginNotFound,
    InvalidManifest,
    DuplicatePlugin
};

QString toString(RegistryError error);

// Read-only view the engine needs from plugin discovery.
class PluginRegistry {
public:
    virtual ~PluginRegistry() = default;
    virtual Expected<PluginMetadata, RegistryError> getPlugin(const QString& name) const = 0;
};

class InMemoryPluginRegistry : public PluginRegistry {
public:
    InMemoryPluginRegistry() = default;

    Expected<void, RegistryError> registerPlugin(const PluginMetadata& metadata);
    Expected<void, RegistryError> setStatus(const QString& name, PluginStatus status);
    bool unregisterPlugin(const QString& name);
    QStringList pluginNames() const;

    Expected<PluginMetadata, RegistryError> getPlugin(const QString& name) const override;

private:
    mutable QMutex mutex_;
    QHash<QString, PluginMetadata> plugins_;
};

} // namespace Corral
