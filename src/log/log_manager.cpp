#include "log_manager.h"
#include "log_properties.h"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>
#include <iostream>
#include <vector>

LogManager& LogManager::instance()
{
    static LogManager instance;
    return instance;
}

void LogManager::initialize(const std::string& logDirectory)
{
    if (m_initialized) {
        return;
    }

    try {
        m_logDirectory = logDirectory;
        LogProperties props = LogProperties::load(logDirectory);

        std::filesystem::create_directories(logDirectory);

        std::vector<spdlog::sink_ptr> sinks;

        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(props.consoleLevel);
        console_sink->set_pattern(props.consolePattern);
        sinks.push_back(console_sink);

        m_logFilePath = (std::filesystem::path(logDirectory) / props.fileName).string();
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            m_logFilePath, props.maxFileSize, props.maxFiles);
        file_sink->set_level(props.fileLevel);
        file_sink->set_pattern(props.filePattern);
        sinks.push_back(file_sink);

        m_logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
        m_logger->set_level(props.loggerLevel);
        m_logger->flush_on(spdlog::level::warn);

        spdlog::register_logger(m_logger);
        spdlog::set_default_logger(m_logger);

        m_initialized = true;

        LOG_INFO("LogManager initialized, log file: {}", m_logFilePath);
    } catch (const std::exception& e) {
        // Logging stays disabled; LOG_* macros keep being no-ops.
        std::cerr << "Failed to initialize LogManager: " << e.what() << std::endl;
        m_logger.reset();
        m_initialized = false;
    }
}

void LogManager::shutdown()
{
    if (!m_initialized) {
        return;
    }

    LOG_INFO("LogManager shutting down...");

    if (m_logger) {
        m_logger->flush();
        spdlog::drop_all();
        m_logger.reset();
    }

    m_initialized = false;
}

void LogManager::setLogLevel(LogLevel level)
{
    if (!m_logger) return;

    spdlog::level::level_enum spdLevel;
    switch (level) {
        case LogLevel::Trace:    spdLevel = spdlog::level::trace; break;
        case LogLevel::Debug:    spdLevel = spdlog::level::debug; break;
        case LogLevel::Info:     spdLevel = spdlog::level::info; break;
        case LogLevel::Warn:     spdLevel = spdlog::level::warn; break;
        case LogLevel::Error:    spdLevel = spdlog::level::err; break;
        case LogLevel::Critical: spdLevel = spdlog::level::critical; break;
        default:                 spdLevel = spdlog::level::info; break;
    }

    m_logger->set_level(spdLevel);
    LOG_DEBUG("Log level changed to: {}", static_cast<int>(level));
}

LogManager::LogLevel LogManager::getLogLevel() const
{
    if (!m_logger) return LogLevel::Info;

    switch (m_logger->level()) {
        case spdlog::level::trace:    return LogLevel::Trace;
        case spdlog::level::debug:    return LogLevel::Debug;
        case spdlog::level::info:     return LogLevel::Info;
        case spdlog::level::warn:     return LogLevel::Warn;
        case spdlog::level::err:      return LogLevel::Error;
        case spdlog::level::critical: return LogLevel::Critical;
        default:                      return LogLevel::Info;
    }
}

void LogManager::flush()
{
    if (m_logger) {
        m_logger->flush();
    }
}
