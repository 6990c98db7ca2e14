#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

/**
 * Log Manager - centralized logging using spdlog
 * Owns the "ring_buffer" logger (console + rotating file sinks).
 * Until initialize() is called every LOG_* macro is a no-op, so library
 * code can log without requiring the host application to set anything up.
 */
class LogManager
{
public:
    enum class LogLevel {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warn = 3,
        Error = 4,
        Critical = 5
    };

    static constexpr const char* kLoggerName = "ring_buffer";

    static LogManager& instance();

    // Reads log.properties (see LogProperties) and creates the sinks
    void initialize(const std::string& logDirectory = "log");
    void shutdown();
    bool isInitialized() const { return m_initialized; }

    void setLogLevel(LogLevel level);
    LogLevel getLogLevel() const;

    void flush();
    std::string logFilePath() const { return m_logFilePath; }

private:
    LogManager() = default;
    ~LogManager() = default;
    LogManager(const LogManager&) = delete;
    LogManager& operator=(const LogManager&) = delete;

    std::shared_ptr<spdlog::logger> m_logger;
    std::string m_logDirectory;
    std::string m_logFilePath;
    bool m_initialized = false;
};

// Source location is forwarded so file sink patterns using [%s:%#] are filled in.
#define RINGBUF_LOG(level, ...) do { auto _lg = spdlog::get(LogManager::kLoggerName); if (_lg) _lg->log(spdlog::source_loc{__FILE__, __LINE__, SPDLOG_FUNCTION}, level, __VA_ARGS__); } while(0)

#define LOG_TRACE(...)    RINGBUF_LOG(spdlog::level::trace, __VA_ARGS__)
#define LOG_DEBUG(...)    RINGBUF_LOG(spdlog::level::debug, __VA_ARGS__)
#define LOG_INFO(...)     RINGBUF_LOG(spdlog::level::info, __VA_ARGS__)
#define LOG_WARN(...)     RINGBUF_LOG(spdlog::level::warn, __VA_ARGS__)
#define LOG_ERROR(...)    RINGBUF_LOG(spdlog::level::err, __VA_ARGS__)
#define LOG_CRITICAL(...) RINGBUF_LOG(spdlog::level::critical, __VA_ARGS__)
