#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fmt/core.h>
#include <memory>
#include <string>

namespace Corral {

class Logger {
public:
    enum class Level {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warn = 3,
        Error = 4,
        Critical = 5
    };

    static Logger& instance();

    // Console plus rotating file sink. Used by embedding applications and tests.
    void initialize(const std::string& logFilePath = "corral.log",
                   Level level = Level::Info);

    // Stderr only. The plugin host keeps stdout for its response channel.
    void initializeStderr(Level level = Level::Info);

    void setLevel(Level level);
    static Level levelFromString(const std::string& name, Level fallback = Level::Info);

    template<typename... Args>
    void trace(fmt::format_string<Args...> format, Args&&... args) {
        logger_->trace(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(fmt::format_string<Args...> format, Args&&... args) {
        logger_->debug(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(fmt::format_string<Args...> format, Args&&... args) {
        logger_->info(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(fmt::format_string<Args...> format, Args&&... args) {
        logger_->warn(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(fmt::format_string<Args...> format, Args&&... args) {
        logger_->error(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void critical(fmt::format_string<Args...> format, Args&&... args) {
        logger_->critical(format, std::forward<Args>(args)...);
    }

private:
    Logger();
    std::shared_ptr<spdlog::logger> logger_;
};

#define CORRAL_TRACE(...) Corral::Logger::instance().trace(__VA_ARGS__)
#define CORRAL_DEBUG(...) Corral::Logger::instance().debug(__VA_ARGS__)
#define CORRAL_INFO(...) Corral::Logger::instance().info(__VA_ARGS__)
#define CORRAL_WARN(...) Corral::Logger::instance().warn(__VA_ARGS__)
#define CORRAL_ERROR(...) Corral::Logger::instance().error(__VA_ARGS__)
#define CORRAL_CRITICAL(...) Corral::Logger::instance().critical(__VA_ARGS__)

} // namespace Corral
