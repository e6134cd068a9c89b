#include "PluginLoader.hpp"
#include "core/common/Logger.hpp"

#include <QtCore/QFileInfo>
#include <QtCore/QLibrary>
#include <QtCore/QRegularExpression>

namespace Corral {

namespace {

PluginFault notFound(const QString& message) {
    PluginFault fault;
    fault.kind = PluginError::NotFound;
    fault.message = message;
    return fault;
}

} // namespace

bool PluginLoader::isValidSymbolName(const QString& entryPoint) {
    static const QRegularExpression symbolPattern("^[A-Za-z_][A-Za-z0-9_]*$");
    return symbolPattern.match(entryPoint).hasMatch();
}

Expected<PluginEntryPoint, PluginFault> PluginLoader::resolve(const QString& libraryPath,
                                                              const QString& entryPoint) {
    if (!isValidSymbolName(entryPoint)) {
        return makeUnexpected(notFound(QStringLiteral("Invalid entry point name '%1'").arg(entryPoint)));
    }

    QFileInfo info(libraryPath);
    if (!info.exists()) {
        return makeUnexpected(notFound(QStringLiteral("Plugin library not found: %1").arg(libraryPath)));
    }

    QLibrary library(info.absoluteFilePath());
    if (!library.load()) {
        CORRAL_WARN("Failed to load plugin library {}: {}",
                    libraryPath.toStdString(), library.errorString().toStdString());
        return makeUnexpected(notFound(QStringLiteral("Cannot load plugin library %1: %2")
                                           .arg(libraryPath, library.errorString())));
    }

    QFunctionPointer symbol = library.resolve(entryPoint.toUtf8().constData());
    if (!symbol) {
        return makeUnexpected(notFound(QStringLiteral("Entry point '%1' not exported by %2")
                                           .arg(entryPoint, libraryPath)));
    }

    CORRAL_DEBUG("Resolved {} in {}", entryPoint.toStdString(), libraryPath.toStdString());
    return reinterpret_cast<PluginEntryPoint>(symbol);
}

} // namespace Corral
