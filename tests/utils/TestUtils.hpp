#pragma once

#include <QtTest/QtTest>
#include <QtCore/QEventLoop>
#include <QtCore/QFuture>
#include <QtCore/QFutureWatcher>
#include <QtCore/QObject>
#include <QtCore/QString>
#include <QtCore/QTemporaryDir>
#include <QtCore/QTimer>
#include <functional>
#include <type_traits>
#include <vector>

#include "../../src/core/common/Expected.hpp"
#include "../../src/core/common/Logger.hpp"
#include "../../src/core/plugin/PluginRegistry.hpp"
#include "../../src/core/plugin/PluginTypes.hpp"

namespace Corral {
namespace Test {

/**
 * @brief Shared helpers for the Corral test suites
 */
class TestUtils : public QObject {
    Q_OBJECT

public:
    explicit TestUtils(QObject* parent = nullptr);
    ~TestUtils() override;

    // Test environment setup
    static void initializeTestEnvironment();
    static void cleanupTestEnvironment();

    // Temporary directory management
    static QString createTempDirectory(const QString& prefix = "corral_test");
    static void cleanupTempDirectory(const QString& path);
    static QString getTempPath();
    static QString createTestTextFile(const QString& directory, const QString& content,
                                      const QString& filename = "test.txt");

    // Test plugins built next to the tests
    static QString testPluginLibrary();
    static QString pluginHostExecutable();
    static PluginMetadata makePluginMetadata(const QString& name,
                                             const QString& entryPoint,
                                             const QVariantMap& extensions = QVariantMap());
    static std::shared_ptr<InMemoryPluginRegistry> createTestRegistry();

    // Async testing utilities
    template<typename T>
    static T waitForFuture(QFuture<T> future, int timeoutMs = 5000);

    static bool waitForCondition(std::function<bool()> condition, int timeoutMs = 5000, int checkIntervalMs = 20);

    // Test assertions with better error messages
    template<typename T, typename E>
    static void assertExpectedValue(const Expected<T, E>& result, const QString& context = QString());

    template<typename T, typename E>
    static void assertExpectedError(const Expected<T, E>& result, E expectedError, const QString& context = QString());

    static void logMessage(const QString& message);

private:
    static QTemporaryDir* tempDir_;

    template<typename E>
    static QString describeError(const E& error);
};

/**
 * @brief RAII helper for test scope management
 */
class TestScope {
public:
    explicit TestScope(const QString& testName);
    ~TestScope();

    QString getTempDirectory() const;
    void addCleanupCallback(std::function<void()> callback);

private:
    QString testName_;
    QString tempDirectory_;
    std::vector<std::function<void()>> cleanupCallbacks_;
};

// Template implementations
template<typename T>
T TestUtils::waitForFuture(QFuture<T> future, int timeoutMs) {
    if (!future.isFinished()) {
        QEventLoop loop;
        QTimer timer;
        timer.setSingleShot(true);

        QFutureWatcher<T> watcher;
        QObject::connect(&watcher, &QFutureWatcher<T>::finished, &loop, &QEventLoop::quit);
        QObject::connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);

        watcher.setFuture(future);
        timer.start(timeoutMs);
        loop.exec();
    }

    if (!future.isFinished() || future.resultCount() == 0) {
        logMessage(QString("waitForFuture timeout after %1ms").arg(timeoutMs));
        static_assert(std::is_default_constructible_v<T>, "T must be default constructible for timeout case");
        return T{};
    }

    return future.result();
}

template<typename E>
QString TestUtils::describeError(const E& error) {
    if constexpr (std::is_enum_v<E>) {
        return QString("error code %1").arg(static_cast<int>(error));
    } else if constexpr (std::is_same_v<E, PluginFault>) {
        return QString("%1: %2").arg(toString(error.kind), error.message);
    } else if constexpr (std::is_same_v<E, QString>) {
        return error;
    } else {
        return error.message;
    }
}

template<typename T, typename E>
void TestUtils::assertExpectedValue(const Expected<T, E>& result, const QString& context) {
    if (result.hasError()) {
        QString message = QString("Expected value but got error");
        if (!context.isEmpty()) {
            message += QString(" in %1").arg(context);
        }
        message += QString(": %1").arg(describeError(result.error()));
        QFAIL(qPrintable(message));
    }
}

template<typename T, typename E>
void TestUtils::assertExpectedError(const Expected<T, E>& result, E expectedError, const QString& context) {
    if (result.hasValue()) {
        QString message = QString("Expected error but got value");
        if (!context.isEmpty()) {
            message += QString(" in %1").arg(context);
        }
        QFAIL(qPrintable(message));
    }

    if (result.error() != expectedError) {
        QString message = QString("Expected error %1 but got error %2")
                         .arg(static_cast<int>(expectedError))
                         .arg(static_cast<int>(result.error()));
        if (!context.isEmpty()) {
            message += QString(" in %1").arg(context);
        }
        QFAIL(qPrintable(message));
    }
}

// Convenience macros for testing
#define ASSERT_EXPECTED_VALUE(result) TestUtils::assertExpectedValue(result, QString("%1:%2").arg(__FILE__).arg(__LINE__))
#define ASSERT_EXPECTED_ERROR(result, error) TestUtils::assertExpectedError(result, error, QString("%1:%2").arg(__FILE__).arg(__LINE__))

#define TEST_SCOPE(name) TestScope _testScope(name)

} // namespace Test
} // namespace Corral
