#include "PluginInvoker.hpp"
#include "core/common/Logger.hpp"
#include "core/plugin/PluginApi.hpp"
#include "core/plugin/PluginLoader.hpp"

#include <QtCore/QFuture>
#include <QtCore/QJsonArray>
#include <QtCore/QThread>
#include <cstdlib>
#include <exception>
#include <memory>
#include <typeinfo>

#if defined(__GNUG__)
#include <cxxabi.h>
#endif

namespace Corral {

namespace {

constexpr unsigned long DEFERRED_POLL_INTERVAL_MS = 10;

class InvocationContext : public PluginContext {
public:
    enum class State {
        Unset,
        Value,
        Failed,
        Deferred
    };

    InvocationContext(const QVariantMap& parameters,
                      CapabilityTable& capabilities,
                      const PluginInvoker::CancellationCheck& cancellationRequested)
        : parameters_(parameters)
        , capabilities_(capabilities)
        , cancellationRequested_(cancellationRequested) {
    }

    const QVariantMap& parameters() const override { return parameters_; }
    PluginCapabilities& capabilities() override { return capabilities_; }

    bool isCancellationRequested() const override {
        return cancellationRequested_ && cancellationRequested_();
    }

    void setResult(const QVariant& value) override {
        state_ = State::Value;
        value_ = value;
    }

    void fail(const QString& message) override {
        PluginFault fault;
        fault.kind = PluginError::Execution;
        fault.message = message;
        fail(fault);
    }

    void fail(const PluginFault& fault) override {
        state_ = State::Failed;
        fault_ = fault;
    }

    void resolveLater(const QFuture<QVariant>& pending) override {
        state_ = State::Deferred;
        pending_ = pending;
    }

    State state() const { return state_; }
    const QVariant& value() const { return value_; }
    const PluginFault& fault() const { return fault_; }
    QFuture<QVariant> pending() const { return pending_; }

private:
    const QVariantMap& parameters_;
    CapabilityTable& capabilities_;
    const PluginInvoker::CancellationCheck& cancellationRequested_;
    State state_ = State::Unset;
    QVariant value_;
    PluginFault fault_;
    QFuture<QVariant> pending_;
};

QString exceptionTypeName(const std::exception& exception) {
    const char* mangled = typeid(exception).name();
#if defined(__GNUG__)
    int status = 0;
    std::unique_ptr<char, void (*)(void*)> demangled(
        abi::__cxa_demangle(mangled, nullptr, nullptr, &status), std::free);
    if (status == 0 && demangled) {
        return QString::fromLatin1(demangled.get());
    }
#endif
    return QString::fromLatin1(mangled);
}

PluginFault faultFromException(const Invocation& invocation, const QString& typeName, const QString& what) {
    PluginFault fault;
    fault.kind = PluginError::Execution;
    fault.message = what.isEmpty() ? typeName : what;
    fault.traceback = QStringLiteral("%1: %2\n  in plugin '%3' entry point '%4' (%5)")
                          .arg(typeName, what, invocation.pluginName, invocation.entryPoint, invocation.libraryPath);
    return fault;
}

PluginFault cancelledFault(const QString& message) {
    PluginFault fault;
    fault.kind = PluginError::Cancelled;
    fault.message = message;
    return fault;
}

} // namespace

PluginOutcome PluginInvoker::invoke(const Invocation& invocation,
                                    LimitScope scope,
                                    const CancellationCheck& cancellationRequested,
                                    bool applyLimitsInSharedProcess) {
    Sandbox sandbox(invocation.limits, invocation.policy, scope, applyLimitsInSharedProcess);
    return sandbox.run([&](CapabilityTable& capabilities) {
        return runEntryPoint(invocation, capabilities, cancellationRequested);
    });
}

PluginOutcome PluginInvoker::runEntryPoint(const Invocation& invocation,
                                           CapabilityTable& capabilities,
                                           const CancellationCheck& cancellationRequested) {
    auto withViolations = [&capabilities](PluginFault fault) -> PluginOutcome {
        fault.violations = capabilities.violations();
        return makeUnexpected(std::move(fault));
    };

    for (const QString& module : invocation.declaredImports) {
        auto imported = capabilities.importModule(module);
        if (!imported) {
            return withViolations(imported.error());
        }
    }

    auto entryPoint = PluginLoader::resolve(invocation.libraryPath, invocation.entryPoint);
    if (!entryPoint) {
        return withViolations(entryPoint.error());
    }

    CORRAL_DEBUG("Invoking {}::{} for request {}",
                 invocation.pluginName.toStdString(), invocation.entryPoint.toStdString(), invocation.requestId.toStdString());

    InvocationContext context(invocation.parameters, capabilities, cancellationRequested);
    try {
        entryPoint.value()(context);
    } catch (const std::exception& e) {
        return withViolations(faultFromException(invocation, exceptionTypeName(e), QString::fromUtf8(e.what())));
    } catch (...) {
        return withViolations(faultFromException(invocation, QStringLiteral("unknown exception"), QString()));
    }

    QVariant value;
    switch (context.state()) {
        case InvocationContext::State::Failed:
            return withViolations(context.fault());
        case InvocationContext::State::Value:
            value = context.value();
            break;
        case InvocationContext::State::Unset:
            break;
        case InvocationContext::State::Deferred: {
            QFuture<QVariant> pending = context.pending();
            while (!pending.isFinished()) {
                if (context.isCancellationRequested()) {
                    pending.cancel();
                    return withViolations(cancelledFault(QStringLiteral("Execution cancelled")));
                }
                QThread::msleep(DEFERRED_POLL_INTERVAL_MS);
            }
            try {
                // Rethrows an exception stored by the asynchronous work
                pending.waitForFinished();
            } catch (const std::exception& e) {
                return withViolations(faultFromException(invocation, exceptionTypeName(e), QString::fromUtf8(e.what())));
            }
            if (pending.isCanceled()) {
                return withViolations(cancelledFault(QStringLiteral("Asynchronous plugin work was cancelled")));
            }
            if (pending.resultCount() > 0) {
                value = pending.result();
            }
            break;
        }
    }

    PluginOutput output;
    output.value = value;
    output.printed = capabilities.printedLines();
    output.violations = capabilities.violations();
    return output;
}

QJsonObject Invocation::toJson() const {
    QJsonObject json;
    json["request_id"] = requestId;
    json["plugin_name"] = pluginName;
    json["library_path"] = libraryPath;
    json["entry_point"] = entryPoint;
    json["parameters"] = QJsonObject::fromVariantMap(parameters);
    json["resource_limits"] = limits.toJson();
    json["security_policy"] = policy.toJson();
    json["declared_imports"] = QJsonArray::fromStringList(declaredImports);
    return json;
}

Expected<Invocation, QString> Invocation::fromJson(const QJsonObject& json) {
    Invocation invocation;
    invocation.requestId = json.value("request_id").toString();
    invocation.pluginName = json.value("plugin_name").toString();
    invocation.libraryPath = json.value("library_path").toString();
    invocation.entryPoint = json.value("entry_point").toString();

    if (invocation.pluginName.isEmpty() || invocation.libraryPath.isEmpty() || invocation.entryPoint.isEmpty()) {
        return makeUnexpected(QStringLiteral("Invocation is missing plugin_name, library_path or entry_point"));
    }

    invocation.parameters = json.value("parameters").toObject().toVariantMap();
    invocation.limits = ResourceLimits::fromJson(json.value("resource_limits").toObject());
    invocation.policy = SecurityPolicy::fromJson(json.value("security_policy").toObject());
    for (const QJsonValue& module : json.value("declared_imports").toArray()) {
        invocation.declaredImports.append(module.toString());
    }
    return invocation;
}

QJsonObject PluginInvoker::outcomeToJson(const PluginOutcome& outcome) {
    QJsonObject json;
    if (outcome) {
        const PluginOutput& output = outcome.value();
        json["ok"] = true;
        json["result"] = QJsonValue::fromVariant(output.value);
        json["printed"] = QJsonArray::fromStringList(output.printed);
        json["violations"] = violationsToJson(output.violations);
    } else {
        const PluginFault& fault = outcome.error();
        json["ok"] = false;
        json["kind"] = toString(fault.kind);
        json["message"] = fault.message;
        json["traceback"] = fault.traceback;
        json["violations"] = violationsToJson(fault.violations);
    }
    return json;
}

PluginOutcome PluginInvoker::outcomeFromJson(const QJsonObject& json) {
    if (!json.contains("ok")) {
        PluginFault fault;
        fault.message = QStringLiteral("Malformed worker response");
        return makeUnexpected(fault);
    }

    if (json.value("ok").toBool()) {
        PluginOutput output;
        output.value = json.value("result").toVariant();
        for (const QJsonValue& line : json.value("printed").toArray()) {
            output.printed.append(line.toString());
        }
        output.violations = violationsFromJson(json.value("violations").toArray());
        return output;
    }

    PluginFault fault;
    fault.kind = pluginErrorFromString(json.value("kind").toString()).value_or(PluginError::Execution);
    fault.message = json.value("message").toString();
    fault.traceback = json.value("traceback").toString();
    fault.violations = violationsFromJson(json.value("violations").toArray());
    return makeUnexpected(fault);
}

} // namespace Corral
