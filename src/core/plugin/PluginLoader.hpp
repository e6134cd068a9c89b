#pragma once

#include <QtCore/QString>

#include "core/common/Expected.hpp"
#include "core/plugin/PluginApi.hpp"

namespace Corral {

class PluginLoader {
public:
    // Loads the shared library and resolves the exported entry point.
    // The library stays loaded for the lifetime of the process.
    static Expected<PluginEntryPoint, PluginFault> resolve(const QString& libraryPath,
                                                           const QString& entryPoint);

    static bool isValidSymbolName(const QString& entryPoint);
};

} // namespace Corral
