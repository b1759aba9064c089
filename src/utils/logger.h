#pragma once

#include <string>
#include <memory>
#include <mutex>
#include <functional>
#include <vector>
#include <iostream>
#include <spdlog/spdlog.h>
#include <spdlog/common.h>
#include "labellink_export.h"

namespace llink {

/**
 * Log level enumeration
 */
enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR_LEVEL = 4,
    CRITICAL = 5,
    OFF = 6
};

/**
 * Log configuration structure
 */
struct LogConfig {
    LogLevel level = LogLevel::INFO;           // Log level
    bool enableConsole = true;                 // Whether to output to console
    bool enableFile = false;                   // Whether to output to file
    std::string fileName;                      // Log file path
    size_t maxFileSize = 10 * 1024 * 1024;     // Maximum file size (10MB)
    size_t maxFiles = 5;                       // Maximum number of files
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] [%s:%#] %v";
};

/**
 * Log callback function type
 * Parameters: level, message
 */
using LogCallback = std::function<void(LogLevel level, const std::string& message)>;

/**
 * Process-wide log manager
 * Records are dropped until initialize() has been called
 */
class LABELLINK_API Logger {
public:
    static Logger& getInstance();

    /**
     * Initialize the logging system
     * @param config Log configuration
     * @return true if successful
     */
    bool initialize(const LogConfig& config = LogConfig{});

    void setLevel(LogLevel level);
    LogLevel getLevel() const;

    /**
     * Add a log callback function
     * Callbacks receive every record that passes the level filter
     */
    void addCallback(const LogCallback& callback);
    void clearCallbacks();

    void flush();

    bool isEnabled(LogLevel level) const;
    bool isInitialized() const { return m_initialized; }

    /**
     * Shut down the logging system
     */
    void shutdown();

    template<typename... Args>
    void logWithLocation(LogLevel level, const char* file, int line, const std::string& format, Args&&... args) {
        if (!m_logger || !m_initialized || !isEnabled(level)) {
            return;
        }

        std::string message;
        try {
            if constexpr (sizeof...(args) > 0) {
                message = fmt::format(fmt::runtime(format), std::forward<Args>(args)...);
            } else {
                message = format;
            }
        } catch (const fmt::format_error& e) {
            message = format + " <format error: " + e.what() + ">";
        }

        spdlog::source_loc loc{file, line, ""};
        m_logger->log(loc, toSpdlogLevel(level), message);
        dispatch(level, message);
    }

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void dispatch(LogLevel level, const std::string& message);

    spdlog::level::level_enum toSpdlogLevel(LogLevel level) const;

    std::shared_ptr<spdlog::logger> m_logger;
    std::vector<LogCallback> m_callbacks;
    mutable std::mutex m_callbackMutex;
    LogConfig m_config;
    bool m_initialized = false;
};

/**
 * Log macros with file location information
 */
#define LABELLINK_LOG_TRACE(...)    llink::Logger::getInstance().logWithLocation(llink::LogLevel::TRACE, __FILE__, __LINE__, __VA_ARGS__)
#define LABELLINK_LOG_DEBUG(...)    llink::Logger::getInstance().logWithLocation(llink::LogLevel::DEBUG, __FILE__, __LINE__, __VA_ARGS__)
#define LABELLINK_LOG_INFO(...)     llink::Logger::getInstance().logWithLocation(llink::LogLevel::INFO, __FILE__, __LINE__, __VA_ARGS__)
#define LABELLINK_LOG_WARN(...)     llink::Logger::getInstance().logWithLocation(llink::LogLevel::WARN, __FILE__, __LINE__, __VA_ARGS__)
#define LABELLINK_LOG_ERROR(...)    llink::Logger::getInstance().logWithLocation(llink::LogLevel::ERROR_LEVEL, __FILE__, __LINE__, __VA_ARGS__)
#define LABELLINK_LOG_CRITICAL(...) llink::Logger::getInstance().logWithLocation(llink::LogLevel::CRITICAL, __FILE__, __LINE__, __VA_ARGS__)

} // namespace llink
