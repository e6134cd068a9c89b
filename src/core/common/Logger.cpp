#include "Logger.hpp"
#include <spdlog/pattern_formatter.h>
#include <algorithm>
#include <cctype>

namespace Corral {

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::Logger()
    : logger_(std::make_shared<spdlog::logger>(
          "corral", std::make_shared<spdlog::sinks::stderr_color_sink_mt>())) {
    logger_->set_pattern("[%H:%M:%S] [%^%l%$] [%t] %v");
    logger_->set_level(spdlog::level::info);
}

void Logger::initialize(const std::string& logFilePath, Level level) {
    try {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logFilePath, 1024 * 1024 * 5, 3); // 5MB, 3 files

        console_sink->set_pattern("[%H:%M:%S] [%^%l%$] [%t] %v");
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%f] [%l] [%t] %v");

        logger_ = std::make_shared<spdlog::logger>("corral",
            spdlog::sinks_init_list{console_sink, file_sink});
        setLevel(level);

        CORRAL_INFO("Logger initialized with file: {}", logFilePath);

    } catch (const spdlog::spdlog_ex& ex) {
        // Keep the stderr logger created by the constructor
        logger_->error("Logger initialization failed: {}", ex.what());
    }
}

void Logger::initializeStderr(Level level) {
    auto stderr_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    stderr_sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] [pid %P] %v");
    logger_ = std::make_shared<spdlog::logger>("corral", stderr_sink);
    setLevel(level);
}

void Logger::setLevel(Level level) {
    if (logger_) {
        logger_->set_level(static_cast<spdlog::level::level_enum>(level));
    }
}

Logger::Level Logger::levelFromString(const std::string& name, Level fallback) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "trace") return Level::Trace;
    if (lowered == "debug") return Level::Debug;
    if (lowered == "info") return Level::Info;
    if (lowered == "warn" || lowered == "warning") return Level::Warn;
    if (lowered == "error") return Level::Error;
    if (lowered == "critical") return Level::Critical;
    return fallback;
}

} // namespace Corral
