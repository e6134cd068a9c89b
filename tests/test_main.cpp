#include <QtTest/QtTest>
#include <QtCore/QCoreApplication>
#include <QtCore/QDebug>

#include "utils/TestUtils.hpp"
#include "../src/core/common/Logger.hpp"

// Test classes live in separate compilation units
extern int runTestExpected(int argc, char** argv);
extern int runTestConfig(int argc, char** argv);
extern int runTestParameterValidator(int argc, char** argv);
extern int runTestCapabilitySandbox(int argc, char** argv);
extern int runTestPluginInvoker(int argc, char** argv);
extern int runTestWorkerPools(int argc, char** argv);
extern int runTestExecutionEngine(int argc, char** argv);

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);

    Corral::Logger::instance().initialize("corral-tests.log", Corral::Logger::Level::Trace);
    Corral::Test::TestUtils::initializeTestEnvironment();

    int totalResult = 0;
    int testCount = 0;
    int passedTests = 0;

    struct TestInfo {
        const char* name;
        int (*function)(int, char**);
    };

    TestInfo tests[] = {
        {"Expected", runTestExpected},
        {"Config", runTestConfig},
        {"ParameterValidator", runTestParameterValidator},
        {"CapabilitySandbox", runTestCapabilitySandbox},
        {"PluginInvoker", runTestPluginInvoker},
        {"WorkerPools", runTestWorkerPools},
        {"ExecutionEngine", runTestExecutionEngine}
    };

    for (const auto& test : tests) {
        qDebug() << "\n========================================";
        qDebug() << "Running test suite:" << test.name;
        qDebug() << "========================================";

        testCount++;
        int result = test.function(argc, argv);

        if (result == 0) {
            qDebug() << "Test suite" << test.name << "PASSED";
            passedTests++;
        } else {
            qDebug() << "Test suite" << test.name << "FAILED with code" << result;
            totalResult |= result;
        }
    }

    Corral::Test::TestUtils::cleanupTestEnvironment();

    qDebug() << "\n========================================";
    qDebug() << "TEST SUMMARY";
    qDebug() << "========================================";
    qDebug() << "Total test suites:" << testCount;
    qDebug() << "Passed:" << passedTests;
    qDebug() << "Failed:" << (testCount - passedTests);
    qDebug() << "Overall result:" << (totalResult == 0 ? "PASS" : "FAIL");

    return totalResult;
}
