#include <QtCore/QCommandLineParser>
#include <QtCore/QCoreApplication>
#include <QtCore/QFile>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonParseError>

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <unistd.h>

#include "core/common/Config.hpp"
#include "core/common/Logger.hpp"
#include "core/execution/PluginInvoker.hpp"
#include "core/security/ParameterValidator.hpp"

namespace {

constexpr int EXIT_BAD_REQUEST = 2;
constexpr int EXIT_IO_ERROR = 3;

// Whoever claims first writes the only response: main() or a limit signal.
std::atomic<bool> responseClaimed{false};
int responseChannel = -1;
QByteArray wallTimeResponse;
QByteArray cpuTimeResponse;

QByteArray limitResponse(const QString& message) {
    Corral::PluginFault fault;
    fault.kind = Corral::PluginError::Timeout;
    fault.message = message;
    const QJsonObject response = Corral::PluginInvoker::outcomeToJson(Corral::PluginOutcome(Corral::makeUnexpected(fault)));
    return QJsonDocument(response).toJson(QJsonDocument::Compact);
}

// Signal context: write(2) and _exit(2) only
void onLimitSignal(int signal) {
    if (responseClaimed.exchange(true)) {
        return;
    }
    const QByteArray& payload = signal == SIGALRM ? wallTimeResponse : cpuTimeResponse;
    const char* data = payload.constData();
    qsizetype remaining = payload.size();
    while (remaining > 0) {
        const ssize_t written = ::write(responseChannel, data, static_cast<size_t>(remaining));
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        data += written;
        remaining -= written;
    }
    _exit(0);
}

bool installLimitHandlers(const Corral::ResourceLimits& limits) {
    wallTimeResponse = limitResponse(QStringLiteral("Plugin exceeded its wall time limit of %1 seconds")
                                         .arg(limits.maxWallTimeSeconds));
    cpuTimeResponse = limitResponse(QStringLiteral("Plugin exceeded its CPU time limit of %1 seconds")
                                        .arg(limits.maxCpuTimeSeconds));

    struct sigaction action {};
    action.sa_handler = onLimitSignal;
    sigemptyset(&action.sa_mask);
    return sigaction(SIGALRM, &action, nullptr) == 0 && sigaction(SIGXCPU, &action, nullptr) == 0;
}

bool writeResponse(int responseFd, const QJsonObject& response) {
    if (responseClaimed.exchange(true)) {
        // A limit handler is answering and about to exit
        for (;;) {
            pause();
        }
    }

    QFile output;
    if (!output.open(responseFd, QIODevice::WriteOnly, QFileDevice::AutoCloseHandle)) {
        Corral::Logger::instance().critical("Cannot open response channel: {}", output.errorString().toStdString());
        return false;
    }
    const QByteArray payload = QJsonDocument(response).toJson(QJsonDocument::Compact);
    const bool written = output.write(payload) == payload.size() && output.flush();
    if (!written) {
        Corral::Logger::instance().critical("Failed to write response: {}", output.errorString().toStdString());
    }
    return written;
}

} // namespace

int main(int argc, char* argv[])
{
    // The response goes to a private copy of stdout. Anything else written
    // to stdout, by the plugin included, ends up on stderr.
    const int responseFd = dup(STDOUT_FILENO);
    if (responseFd < 0 || dup2(STDERR_FILENO, STDOUT_FILENO) < 0) {
        std::perror("corral-plugin-host: redirecting stdout");
        return EXIT_IO_ERROR;
    }

    QCoreApplication app(argc, argv);
    app.setApplicationName("corral-plugin-host");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("Corral");

    QCommandLineParser parser;
    parser.setApplicationDescription("Runs one plugin invocation read as JSON from stdin.");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption requestIdOption("request-id", "Request id, used in log lines.", "id");
    QCommandLineOption logLevelOption("log-level", "trace, debug, info, warn, error or critical.", "level");
    QCommandLineOption configOption("config", "INI file whose logging/level applies when no level is given.", "path");
    parser.addOption(requestIdOption);
    parser.addOption(logLevelOption);
    parser.addOption(configOption);
    parser.process(app);

    // Precedence: --log-level, CORRAL_LOG_LEVEL, the config file, warn
    auto& logger = Corral::Logger::instance();
    QString level = qEnvironmentVariable("CORRAL_LOG_LEVEL", "warn");
    logger.initializeStderr(Corral::Logger::levelFromString(level.toStdString(), Corral::Logger::Level::Warn));
    if (parser.isSet(configOption)) {
        Corral::Config::instance().initializeFromFile(parser.value(configOption));
        if (!qEnvironmentVariableIsSet("CORRAL_LOG_LEVEL")) {
            level = Corral::Config::instance().getLoggingSettings().level;
        }
    }
    if (parser.isSet(logLevelOption)) {
        level = parser.value(logLevelOption);
    }
    logger.setLevel(Corral::Logger::levelFromString(level.toStdString(), Corral::Logger::Level::Warn));

    const QString requestId = parser.value(requestIdOption);

    QFile input;
    if (!input.open(stdin, QIODevice::ReadOnly)) {
        logger.critical("Cannot read request {}: {}", requestId.toStdString(), input.errorString().toStdString());
        return EXIT_IO_ERROR;
    }
    const QByteArray payload = input.readAll();

    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(payload, &parseError);
    if (parseError.error != QJsonParseError::NoError || !document.isObject()) {
        logger.error("Request {} is not a JSON object: {}", requestId.toStdString(),
                     parseError.errorString().toStdString());
        return EXIT_BAD_REQUEST;
    }

    auto invocation = Corral::Invocation::fromJson(document.object());
    if (!invocation) {
        logger.error("Request {} rejected: {}", requestId.toStdString(), invocation.error().toStdString());
        return EXIT_BAD_REQUEST;
    }

    logger.debug("Running {}::{} for request {}", invocation.value().pluginName.toStdString(),
                 invocation.value().entryPoint.toStdString(), requestId.toStdString());

    responseChannel = responseFd;
    if (!installLimitHandlers(invocation.value().limits)) {
        logger.warn("Request {}: limit signal handlers not installed, a limit kill reports a crash",
                    requestId.toStdString());
    }

    Corral::PluginOutcome outcome = Corral::PluginInvoker::invoke(invocation.value(), Corral::LimitScope::DedicatedProcess);

    // Values with no JSON form cross the pipe as their debug text; the engine
    // applies the output budget.
    if (outcome && !Corral::ParameterValidator::isJsonSerializable(outcome.value().value)) {
        outcome.value().value = Corral::ParameterValidator::debugRepresentation(outcome.value().value);
    }

    if (!writeResponse(responseFd, Corral::PluginInvoker::outcomeToJson(outcome))) {
        return EXIT_IO_ERROR;
    }
    return 0;
}
