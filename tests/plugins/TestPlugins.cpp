#include <QtConcurrent/QtConcurrent>
#include <QtCore/QElapsedTimer>
#include <QtCore/QException>
#include <QtCore/QPoint>
#include <QtCore/QThread>
#include <QtCore/QVariantList>

#include <cstdio>
#include <cstdlib>
#include <stdexcept>

#include "../../src/core/plugin/PluginApi.hpp"

// Entry points loaded by the engine, invoker and plugin host tests.

namespace {

class AsyncTaskError : public QException {
public:
    explicit AsyncTaskError(const QByteArray& message) : message_(message) {}

    const char* what() const noexcept override { return message_.constData(); }
    void raise() const override { throw *this; }
    AsyncTaskError* clone() const override { return new AsyncTaskError(*this); }

private:
    QByteArray message_;
};

Corral::PluginFault cancelledFault() {
    Corral::PluginFault fault;
    fault.kind = Corral::PluginError::Cancelled;
    fault.message = QStringLiteral("Plugin stopped on cancellation request");
    return fault;
}

} // namespace

CORRAL_PLUGIN_ENTRY(echo_plugin) {
    context.setResult(context.parameters());
}

CORRAL_PLUGIN_ENTRY(sleepy_plugin) {
    const int durationMs = context.parameters().value("duration_ms", 5000).toInt();
    QElapsedTimer timer;
    timer.start();
    while (timer.elapsed() < durationMs) {
        if (context.isCancellationRequested()) {
            context.fail(cancelledFault());
            return;
        }
        QThread::msleep(50);
    }
    context.setResult(QVariantMap{{"slept_ms", durationMs}});
}

CORRAL_PLUGIN_ENTRY(big_output_plugin) {
    const int size = context.parameters().value("size_bytes", 2 * 1024 * 1024).toInt();
    const QString payload(size, QLatin1Char('x'));
    if (context.parameters().value("as_string", false).toBool()) {
        context.setResult(payload);
    } else {
        context.setResult(QVariantMap{{"data", payload}});
    }
}

CORRAL_PLUGIN_ENTRY(fail_plugin) {
    context.fail(context.parameters().value("message", "deliberate failure").toString());
}

CORRAL_PLUGIN_ENTRY(throw_plugin) {
    throw std::runtime_error("plugin exploded");
}

CORRAL_PLUGIN_ENTRY(read_file_plugin) {
    auto file = context.capabilities().openFile(context.parameters().value("path").toString(),
                                                QIODevice::ReadOnly | QIODevice::Text);
    if (!file) {
        context.fail(file.error());
        return;
    }
    context.setResult(QString::fromUtf8(file.value()->readAll()));
}

CORRAL_PLUGIN_ENTRY(import_plugin) {
    const QStringList modules = context.parameters().value("modules").toStringList();
    for (const QString& module : modules) {
        auto imported = context.capabilities().importModule(module);
        if (!imported) {
            context.fail(imported.error());
            return;
        }
    }
    context.setResult(modules);
}

CORRAL_PLUGIN_ENTRY(network_plugin) {
    auto allowed = context.capabilities().requireNetwork(context.parameters().value("host", "example.org").toString());
    if (!allowed) {
        context.fail(allowed.error());
        return;
    }
    context.setResult(QStringLiteral("connected"));
}

CORRAL_PLUGIN_ENTRY(async_echo_plugin) {
    const QVariantMap parameters = context.parameters();
    context.resolveLater(QtConcurrent::run([parameters]() -> QVariant {
        QThread::msleep(20);
        return parameters;
    }));
}

CORRAL_PLUGIN_ENTRY(async_throw_plugin) {
    context.resolveLater(QtConcurrent::run([]() -> QVariant {
        throw AsyncTaskError("async failure");
    }));
}

CORRAL_PLUGIN_ENTRY(non_serializable_plugin) {
    context.setResult(QVariant::fromValue(QPoint(3, 4)));
}

CORRAL_PLUGIN_ENTRY(crash_plugin) {
    std::abort();
}

CORRAL_PLUGIN_ENTRY(print_plugin) {
    // Raw stdout must not corrupt the plugin host response
    std::printf("stray output\n");
    std::fflush(stdout);

    const int count = context.parameters().value("count", 3).toInt();
    for (int i = 0; i < count; ++i) {
        context.capabilities().print(QStringLiteral("line %1").arg(i));
    }
    context.setResult(count);
}
