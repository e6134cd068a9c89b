#include <QtTest/QtTest>
#include <QtCore/QJsonArray>
#include <atomic>

#include "utils/TestUtils.hpp"
#include "../src/core/execution/PluginInvoker.hpp"

using namespace Corral;
using namespace Corral::Test;

class TestPluginInvoker : public QObject {
    Q_OBJECT

private slots:
    void testEchoReturnsParameters();
    void testPluginReportedFailure();
    void testThrowingPluginBecomesExecutionFault();
    void testMissingEntryPoint();
    void testMissingLibrary();
    void testDeclaredImportsCheckedBeforeEntryPoint();
    void testFileAccessDeniedIsRecorded();
    void testAsynchronousResult();
    void testAsynchronousException();
    void testCooperativeCancellation();
    void testPrintedLinesAreCaptured();
    void testWireFormat();

private:
    static Invocation invocationFor(const QString& entryPoint, const QVariantMap& parameters = QVariantMap()) {
        Invocation invocation;
        invocation.requestId = "invoker-test";
        invocation.pluginName = entryPoint;
        invocation.libraryPath = TestUtils::testPluginLibrary();
        invocation.entryPoint = entryPoint;
        invocation.parameters = parameters;
        return invocation;
    }
};

void TestPluginInvoker::testEchoReturnsParameters() {
    const QVariantMap parameters{{"text", "hi"}, {"n", 3}};
    auto outcome = PluginInvoker::invoke(invocationFor("echo_plugin", parameters), LimitScope::SharedProcess);

    ASSERT_EXPECTED_VALUE(outcome);
    QCOMPARE(outcome.value().value.toMap(), parameters);
    QVERIFY(outcome.value().violations.isEmpty());
}

void TestPluginInvoker::testPluginReportedFailure() {
    auto outcome = PluginInvoker::invoke(invocationFor("fail_plugin", {{"message", "bad input"}}), LimitScope::SharedProcess);

    QVERIFY(outcome.hasError());
    QCOMPARE(outcome.error().kind, PluginError::Execution);
    QCOMPARE(outcome.error().message, QString("bad input"));
}

void TestPluginInvoker::testThrowingPluginBecomesExecutionFault() {
    auto outcome = PluginInvoker::invoke(invocationFor("throw_plugin"), LimitScope::SharedProcess);

    QVERIFY(outcome.hasError());
    QCOMPARE(outcome.error().kind, PluginError::Execution);
    QCOMPARE(outcome.error().message, QString("plugin exploded"));
    QVERIFY(outcome.error().traceback.contains("runtime_error"));
    QVERIFY(outcome.error().traceback.contains("throw_plugin"));
}

void TestPluginInvoker::testMissingEntryPoint() {
    auto outcome = PluginInvoker::invoke(invocationFor("no_such_symbol"), LimitScope::SharedProcess);

    QVERIFY(outcome.hasError());
    QCOMPARE(outcome.error().kind, PluginError::NotFound);
    QVERIFY(outcome.error().message.contains("no_such_symbol"));
}

void TestPluginInvoker::testMissingLibrary() {
    Invocation invocation = invocationFor("echo_plugin");
    invocation.libraryPath = TestUtils::getTempPath() + "/libmissing.so";

    auto outcome = PluginInvoker::invoke(invocation, LimitScope::SharedProcess);
    QVERIFY(outcome.hasError());
    QCOMPARE(outcome.error().kind, PluginError::NotFound);
}

void TestPluginInvoker::testDeclaredImportsCheckedBeforeEntryPoint() {
    // The library path is bogus: a denied import must stop before loading it
    Invocation invocation = invocationFor("echo_plugin");
    invocation.libraryPath = TestUtils::getTempPath() + "/libnever_loaded.so";
    invocation.declaredImports = {"json", "socket.server"};
    invocation.policy.blockedImports = {"socket"};

    auto outcome = PluginInvoker::invoke(invocation, LimitScope::SharedProcess);
    QVERIFY(outcome.hasError());
    QCOMPARE(outcome.error().kind, PluginError::ImportRestricted);
    QCOMPARE(outcome.error().violations.size(), 1);
    QVERIFY(outcome.error().violations.first().detail.contains("socket.server"));
}

void TestPluginInvoker::testFileAccessDeniedIsRecorded() {
    TEST_SCOPE("invoker_file_access");
    const QString path = TestUtils::createTestTextFile(_testScope.getTempDirectory(), "secret");

    auto denied = PluginInvoker::invoke(invocationFor("read_file_plugin", {{"path", path}}), LimitScope::SharedProcess);
    QVERIFY(denied.hasError());
    QCOMPARE(denied.error().kind, PluginError::PermissionDenied);
    QCOMPARE(denied.error().violations.size(), 1);
    QCOMPARE(denied.error().violations.first().capability, QString("file_system"));

    Invocation allowed = invocationFor("read_file_plugin", {{"path", path}});
    allowed.policy.allowFileSystem = true;
    auto read = PluginInvoker::invoke(allowed, LimitScope::SharedProcess);
    ASSERT_EXPECTED_VALUE(read);
    QCOMPARE(read.value().value.toString(), QString("secret"));
}

void TestPluginInvoker::testAsynchronousResult() {
    const QVariantMap parameters{{"text", "later"}};
    auto outcome = PluginInvoker::invoke(invocationFor("async_echo_plugin", parameters), LimitScope::SharedProcess);

    ASSERT_EXPECTED_VALUE(outcome);
    QCOMPARE(outcome.value().value.toMap(), parameters);
}

void TestPluginInvoker::testAsynchronousException() {
    auto outcome = PluginInvoker::invoke(invocationFor("async_throw_plugin"), LimitScope::SharedProcess);

    QVERIFY(outcome.hasError());
    QCOMPARE(outcome.error().kind, PluginError::Execution);
    QCOMPARE(outcome.error().message, QString("async failure"));
}

void TestPluginInvoker::testCooperativeCancellation() {
    std::atomic<bool> cancelled{true};
    QElapsedTimer timer;
    timer.start();

    auto outcome = PluginInvoker::invoke(invocationFor("sleepy_plugin", {{"duration_ms", 5000}}),
                                         LimitScope::SharedProcess,
                                         [&cancelled]() { return cancelled.load(); });

    QVERIFY(outcome.hasError());
    QCOMPARE(outcome.error().kind, PluginError::Cancelled);
    QVERIFY(timer.elapsed() < 2000);
}

void TestPluginInvoker::testPrintedLinesAreCaptured() {
    auto outcome = PluginInvoker::invoke(invocationFor("print_plugin", {{"count", 2}}), LimitScope::SharedProcess);

    ASSERT_EXPECTED_VALUE(outcome);
    QCOMPARE(outcome.value().printed, QStringList({"line 0", "line 1"}));
    QCOMPARE(outcome.value().value.toInt(), 2);
}

void TestPluginInvoker::testWireFormat() {
    Invocation invocation = invocationFor("echo_plugin", {{"text", "hi"}});
    invocation.limits.maxOutputSizeKb = 4;
    invocation.policy.blockedImports = {"socket"};
    invocation.declaredImports = {"json"};

    const QJsonObject json = invocation.toJson();
    QCOMPARE(json.value("entry_point").toString(), QString("echo_plugin"));
    QCOMPARE(json.value("resource_limits").toObject().value("max_output_size_kb").toInt(), 4);
    QCOMPARE(json.value("security_policy").toObject().value("blocked_imports").toArray().size(), 1);

    auto parsed = Invocation::fromJson(json);
    ASSERT_EXPECTED_VALUE(parsed);
    QCOMPARE(parsed.value().parameters.value("text").toString(), QString("hi"));
    QCOMPARE(parsed.value().declaredImports, QStringList({"json"}));
    QCOMPARE(parsed.value().policy.blockedImports, QStringList({"socket"}));

    QJsonObject incomplete = json;
    incomplete.remove("library_path");
    QVERIFY(Invocation::fromJson(incomplete).hasError());

    PluginFault fault;
    fault.kind = PluginError::OutputTooLarge;
    fault.message = "too big";
    fault.violations.append(SecurityViolation{"network", "Network access denied: x", "high"});
    const QJsonObject failure = PluginInvoker::outcomeToJson(PluginOutcome(makeUnexpected(fault)));
    QCOMPARE(failure.value("ok").toBool(), false);
    QCOMPARE(failure.value("kind").toString(), QString("output_too_large"));

    auto decoded = PluginInvoker::outcomeFromJson(failure);
    QVERIFY(decoded.hasError());
    QCOMPARE(decoded.error().kind, PluginError::OutputTooLarge);
    QCOMPARE(decoded.error().violations.size(), 1);
    QCOMPARE(decoded.error().violations.first().severity, QString("high"));

    QVERIFY(PluginInvoker::outcomeFromJson(QJsonObject{{"result", 1}}).hasError());
}

int runTestPluginInvoker(int argc, char** argv) {
    TestPluginInvoker test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_plugin_invoker.moc"
