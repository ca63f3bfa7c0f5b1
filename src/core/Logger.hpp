#pragma once

/**
 * Logger.hpp
 *
 * Process-wide logging for the downloader and its front end, on top of spdlog.
 */

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <filesystem>

namespace modelfetch::core {

/**
 * Log level enumeration
 */
enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off
};

/**
 * Sinks and thresholds, normally taken from the "logging" config section
 */
struct LogSettings {
    LogLevel level{LogLevel::Info};

    // Empty = no file sink
    std::string directory;

    bool console{true};
    size_t maxFileBytes{10 * 1024 * 1024};
    size_t maxFiles{5};
};

/**
 * Logger - Thread-safe singleton logger
 *
 * Console output goes to stderr so reports on stdout stay clean; the
 * rotating file (modelfetch.log) always records down to trace.
 *
 * Until initialize() is called every call is a no-op, which keeps the
 * library silent when embedded in a host that does its own logging.
 */
class Logger {
public:
    static Logger& instance() {
        static Logger instance;
        return instance;
    }

    /**
     * (Re)build the sinks. A log directory that cannot be created falls
     * back to console-only output and says so.
     */
    void initialize(const LogSettings& settings) {
        std::vector<spdlog::sink_ptr> sinks;
        std::string fileProblem;

        if (settings.console) {
            auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console->set_level(toSpdlogLevel(settings.level));
            console->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
            sinks.push_back(console);
        }

        if (!settings.directory.empty()) {
            try {
                std::filesystem::path dir(settings.directory);
                std::filesystem::create_directories(dir);

                auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    (dir / "modelfetch.log").string(), settings.maxFileBytes, settings.maxFiles);
                file->set_level(spdlog::level::trace);
                file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
                sinks.push_back(file);
            } catch (const std::exception& e) {
                // spdlog_ex or filesystem_error
                fileProblem = e.what();
            }
        }

        auto logger = std::make_shared<spdlog::logger>("modelfetch", sinks.begin(), sinks.end());
        logger->set_level(lowestLevel(settings));
        logger->flush_on(spdlog::level::warn);

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_logger = logger;
        }

        if (!fileProblem.empty()) {
            logger->warn("Log file disabled, cannot use {}: {}", settings.directory, fileProblem);
        }
    }

    /**
     * Flush and go back to silent mode
     */
    void shutdown() {
        std::shared_ptr<spdlog::logger> logger;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            logger.swap(m_logger);
        }
        if (logger) {
            logger->flush();
        }
    }

    bool isInitialized() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_logger != nullptr;
    }

    /**
     * Parse a level name as written in the config file ("debug", "warn", ...)
     * @return Matching level, Info when unknown
     */
    static LogLevel parseLevel(const std::string& name) {
        if (name == "trace") return LogLevel::Trace;
        if (name == "debug") return LogLevel::Debug;
        if (name == "warn" || name == "warning") return LogLevel::Warn;
        if (name == "error") return LogLevel::Error;
        if (name == "critical") return LogLevel::Critical;
        if (name == "off") return LogLevel::Off;
        return LogLevel::Info;
    }

    void flush() {
        if (auto logger = current()) {
            logger->flush();
        }
    }

    template<typename... Args>
    void log(spdlog::level::level_enum level, spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (auto logger = current()) {
            logger->log(level, fmt, std::forward<Args>(args)...);
        }
    }

private:
    Logger() = default;
    ~Logger() {
        flush();
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::shared_ptr<spdlog::logger> current() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_logger;
    }

    // The file sink wants trace even when the console is quieter
    static spdlog::level::level_enum lowestLevel(const LogSettings& settings) {
        if (!settings.directory.empty()) {
            return spdlog::level::trace;
        }
        return toSpdlogLevel(settings.level);
    }

    static spdlog::level::level_enum toSpdlogLevel(LogLevel level) {
        switch (level) {
            case LogLevel::Trace:    return spdlog::level::trace;
            case LogLevel::Debug:    return spdlog::level::debug;
            case LogLevel::Info:     return spdlog::level::info;
            case LogLevel::Warn:     return spdlog::level::warn;
            case LogLevel::Error:    return spdlog::level::err;
            case LogLevel::Critical: return spdlog::level::critical;
            case LogLevel::Off:      return spdlog::level::off;
        }
        return spdlog::level::info;
    }

private:
    mutable std::mutex m_mutex;
    std::shared_ptr<spdlog::logger> m_logger;
};

} // namespace modelfetch::core

// Convenience macros
#define LOG_TRACE(...)    modelfetch::core::Logger::instance().log(spdlog::level::trace, __VA_ARGS__)
#define LOG_DEBUG(...)    modelfetch::core::Logger::instance().log(spdlog::level::debug, __VA_ARGS__)
#define LOG_INFO(...)     modelfetch::core::Logger::instance().log(spdlog::level::info, __VA_ARGS__)
#define LOG_WARN(...)     modelfetch::core::Logger::instance().log(spdlog::level::warn, __VA_ARGS__)
#define LOG_ERROR(...)    modelfetch::core::Logger::instance().log(spdlog::level::err, __VA_ARGS__)
#define LOG_CRITICAL(...) modelfetch::core::Logger::instance().log(spdlog::level::critical, __VA_ARGS__)
