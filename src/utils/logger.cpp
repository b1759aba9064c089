#include "utils/logger.h"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace llink
{
    Logger &Logger::getInstance()
    {
        static Logger instance;
        return instance;
    }

    Logger::~Logger()
    {
        // Static destruction order is unknown, so only flush here
        if (m_initialized && m_logger)
        {
            m_initialized = false;
            m_logger->flush();
        }
    }

    bool Logger::initialize(const LogConfig &config)
    {
        if (m_initialized)
        {
            return true;
        }

        try
        {
            m_config = config;
            std::vector<spdlog::sink_ptr> sinks;

            if (config.enableConsole)
            {
                auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
                consoleSink->set_pattern(config.pattern);
                sinks.push_back(consoleSink);
            }

            if (config.enableFile && !config.fileName.empty())
            {
                auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    config.fileName, config.maxFileSize, config.maxFiles);
                fileSink->set_pattern(config.pattern);
                sinks.push_back(fileSink);
            }

            // An OFF level with no sinks still needs a logger object for callbacks
            m_logger = std::make_shared<spdlog::logger>("labellink", sinks.begin(), sinks.end());
            m_logger->set_level(toSpdlogLevel(config.level));
            m_logger->flush_on(spdlog::level::warn);

            m_initialized = true;
            return true;
        }
        catch (const spdlog::spdlog_ex &e)
        {
            std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
            return false;
        }
    }

    void Logger::setLevel(LogLevel level)
    {
        m_config.level = level;
        if (m_logger)
        {
            m_logger->set_level(toSpdlogLevel(level));
        }
    }

    LogLevel Logger::getLevel() const
    {
        return m_config.level;
    }

    void Logger::addCallback(const LogCallback &callback)
    {
        if (callback)
        {
            std::lock_guard<std::mutex> lock(m_callbackMutex);
            m_callbacks.push_back(callback);
        }
    }

    void Logger::clearCallbacks()
    {
        std::lock_guard<std::mutex> lock(m_callbackMutex);
        m_callbacks.clear();
    }

    void Logger::dispatch(LogLevel level, const std::string &message)
    {
        std::vector<LogCallback> callbacks;
        {
            std::lock_guard<std::mutex> lock(m_callbackMutex);
            callbacks = m_callbacks;
        }

        for (const auto &callback : callbacks)
        {
            try
            {
                callback(level, message);
            }
            catch (const std::exception &e)
            {
                // Never log from here, a throwing callback would recurse
                std::cerr << "Log callback error: " << e.what() << std::endl;
            }
        }
    }

    void Logger::flush()
    {
        if (m_logger)
        {
            m_logger->flush();
        }
    }

    bool Logger::isEnabled(LogLevel level) const
    {
        if (!m_logger)
        {
            return false;
        }
        return m_logger->should_log(toSpdlogLevel(level));
    }

    void Logger::shutdown()
    {
        if (!m_initialized)
        {
            return;
        }

        flush();
        clearCallbacks();
        m_logger.reset();
        m_initialized = false;
    }

    spdlog::level::level_enum Logger::toSpdlogLevel(LogLevel level) const
    {
        switch (level)
        {
        case LogLevel::TRACE:
            return spdlog::level::trace;
        case LogLevel::DEBUG:
            return spdlog::level::debug;
        case LogLevel::INFO:
            return spdlog::level::info;
        case LogLevel::WARN:
            return spdlog::level::warn;
        case LogLevel::ERROR_LEVEL:
            return spdlog::level::err;
        case LogLevel::CRITICAL:
            return spdlog::level::critical;
        case LogLevel::OFF:
            return spdlog::level::off;
        default:
            return spdlog::level::info;
        }
    }

} // namespace llink
