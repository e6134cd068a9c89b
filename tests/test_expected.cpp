#include <QtTest/QtTest>
#include <memory>
#include "../src/core/common/Expected.hpp"

using namespace Corral;

class TestExpected : public QObject {
    Q_OBJECT

private slots:
    void testValueConstruction() {
        Expected<int, QString> result(42);

        QVERIFY(result.hasValue());
        QVERIFY(!result.hasError());
        QVERIFY(static_cast<bool>(result));
        QCOMPARE(result.value(), 42);
    }

    void testErrorConstruction() {
        Expected<int, QString> result = makeUnexpected(QString("Error occurred"));

        QVERIFY(!result.hasValue());
        QVERIFY(result.hasError());
        QCOMPARE(result.error(), QString("Error occurred"));
    }

    void testConvertibleValueAndErrorTypes() {
        // Both sides are QString: only makeUnexpected produces an error
        Expected<QString, QString> value(QString("payload"));
        QVERIFY(value.hasValue());
        QCOMPARE(value.value(), QString("payload"));

        Expected<QString, QString> error = makeUnexpected(QString("reason"));
        QVERIFY(error.hasError());
        QCOMPARE(error.error(), QString("reason"));
    }

    void testWrongAccessorThrows() {
        Expected<int, QString> success(1);
        QVERIFY_THROWS_EXCEPTION(std::logic_error, success.error());

        Expected<int, QString> failure = makeUnexpected(QString("Failed"));
        QVERIFY_THROWS_EXCEPTION(std::logic_error, failure.value());
    }

    void testMonadicOperations() {
        Expected<int, QString> success(10);

        auto doubled = success.transform([](int x) { return x * 2; });
        QVERIFY(doubled.hasValue());
        QCOMPARE(doubled.value(), 20);

        Expected<int, QString> failure = makeUnexpected(QString("Failed"));
        auto failedTransform = failure.transform([](int x) { return x * 2; });
        QVERIFY(failedTransform.hasError());
        QCOMPARE(failedTransform.error(), QString("Failed"));
    }

    void testValueOr() {
        Expected<int, QString> success(42);
        QCOMPARE(success.valueOr(0), 42);

        Expected<int, QString> failure = makeUnexpected(QString("Error"));
        QCOMPARE(failure.valueOr(99), 99);
    }

    void testVoidSpecialization() {
        Expected<void, QString> ok;
        QVERIFY(ok.hasValue());

        Expected<void, QString> failed = makeUnexpected(QString("denied"));
        QVERIFY(failed.hasError());
        QCOMPARE(failed.error(), QString("denied"));

        ok = failed;
        QVERIFY(ok.hasError());
        QCOMPARE(ok.error(), QString("denied"));
    }

    void testMoveOnlyValue() {
        Expected<std::unique_ptr<int>, QString> result(std::make_unique<int>(7));
        QVERIFY(result.hasValue());

        std::unique_ptr<int> owned = std::move(result).value();
        QVERIFY(owned);
        QCOMPARE(*owned, 7);
    }

    void testCopySemantics() {
        Expected<int, QString> original(123);
        Expected<int, QString> copy = original;

        QVERIFY(copy.hasValue());
        QCOMPARE(copy.value(), 123);

        // Original should still be valid
        QVERIFY(original.hasValue());
        QCOMPARE(original.value(), 123);

        Expected<int, QString> failure = makeUnexpected(QString("gone"));
        copy = failure;
        QVERIFY(copy.hasError());
        QCOMPARE(copy.error(), QString("gone"));
    }
};

int runTestExpected(int argc, char** argv) {
    TestExpected test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_expected.moc"
