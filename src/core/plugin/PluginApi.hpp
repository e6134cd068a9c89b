#pragma once

#include <QtCore/QFile>
#include <QtCore/QFuture>
#include <QtCore/QString>
#include <QtCore/QVariant>
#include <QtCore/QtGlobal>
#include <memory>

#include "core/common/Expected.hpp"
#include "core/plugin/PluginTypes.hpp"

// Interfaces a plugin shared library is written against. Everything here is
// either inline or pure virtual, so a plugin does not link against corral_core.

namespace Corral {

// Guarded operations available to plugin code for one invocation. A denied
// request returns a PluginFault and is recorded as a security violation.
class PluginCapabilities {
public:
    virtual ~PluginCapabilities() = default;

    virtual bool isBuiltinAllowed(const QString& name) const = 0;
    virtual Expected<void, PluginFault> requireBuiltin(const QString& name) = 0;
    virtual Expected<void, PluginFault> importModule(const QString& moduleName) = 0;
    virtual Expected<std::unique_ptr<QFile>, PluginFault> openFile(const QString& path,
                                                                    QIODevice::OpenMode mode) = 0;
    virtual Expected<void, PluginFault> requireNetwork(const QString& host) = 0;
    virtual Expected<void, PluginFault> requireSubprocess(const QString& program) = 0;

    // Captured into the result metadata, never written to the process stdout.
    virtual void print(const QString& line) = 0;
};

class PluginContext {
public:
    virtual ~PluginContext() = default;

    virtual const QVariantMap& parameters() const = 0;
    virtual PluginCapabilities& capabilities() = 0;

    // Raised by cancel() in thread-isolated mode. Long-running plugins poll it.
    virtual bool isCancellationRequested() const = 0;

    virtual void setResult(const QVariant& value) = 0;
    virtual void fail(const QString& message) = 0;
    virtual void fail(const PluginFault& fault) = 0;

    // Completes the invocation with the future's value. A future that throws
    // fails the invocation; a cancelled future cancels it.
    virtual void resolveLater(const QFuture<QVariant>& pending) = 0;
};

using PluginEntryPoint = void (*)(PluginContext& context);

} // namespace Corral

#define CORRAL_PLUGIN_ENTRY(symbol) \
    extern "C" Q_DECL_EXPORT void symbol(Corral::PluginContext& context)
