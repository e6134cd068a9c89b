#include "PluginRegistry.hpp"
#include "core/common/Logger.hpp"

#include <QtCore/QMutexLocker>

namespace Corral {

QString toString(RegistryError error) {
    switch (error) {
        case RegistryError::PluginNotFound: return "plugin_not_found";
        case RegistryError::InvalidManifest: return "invalid_manifest";
        case RegistryError::DuplicatePlugin: return "duplicate_plugin";
    }
    return "unknown";
}

Expected<void, RegistryError> InMemoryPluginRegistry::registerPlugin(const PluginMetadata& metadata) {
    if (metadata.manifest.name.isEmpty() || metadata.manifest.entryPoint.isEmpty()) {
        CORRAL_WARN("Rejecting plugin registration with incomplete manifest (name: '{}')",
                    metadata.manifest.name.toStdString());
        return makeUnexpected(RegistryError::InvalidManifest);
    }

    QMutexLocker locker(&mutex_);
    if (plugins_.contains(metadata.manifest.name)) {
        return makeUnexpected(RegistryError::DuplicatePlugin);
    }
    plugins_.insert(metadata.manifest.name, metadata);
    CORRAL_DEBUG("Registered plugin {} {} at {}",
                 metadata.manifest.name.toStdString(),
                 metadata.manifest.version.toStdString(),
                 metadata.filesystemPath.toStdString());
    return {};
}

Expected<void, RegistryError> InMemoryPluginRegistry::setStatus(const QString& name, PluginStatus status) {
    QMutexLocker locker(&mutex_);
    auto it = plugins_.find(name);
    if (it == plugins_.end()) {
        return makeUnexpected(RegistryError::PluginNotFound);
    }
    it->status = status;
    return {};
}

bool InMemoryPluginRegistry::unregisterPlugin(const QString& name) {
    QMutexLocker locker(&mutex_);
    return plugins_.remove(name) > 0;
}

QStringList InMemoryPluginRegistry::pluginNames() const {
    QMutexLocker locker(&mutex_);
    QStringList names = plugins_.keys();
    names.sort();
    return names;
}

Expected<PluginMetadata, RegistryError> InMemoryPluginRegistry::getPlugin(const QString& name) const {
    QMutexLocker locker(&mutex_);
    auto it = plugins_.constFind(name);
    if (it == plugins_.constEnd()) {
        return makeUnexpected(RegistryError::PluginNotFound);
    }
    return it.value();
}

} // namespace Corral
