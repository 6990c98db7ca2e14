#pragma once

#include <spdlog/common.h>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * Settings read from an optional log.properties file.
 *
 * Format is one `key=value` per line, `#` starts a comment line, keys are
 * case-insensitive. Anything not present keeps the default below.
 */
struct LogProperties
{
    spdlog::level::level_enum loggerLevel = spdlog::level::debug;
    spdlog::level::level_enum consoleLevel = spdlog::level::info;
    spdlog::level::level_enum fileLevel = spdlog::level::trace;
    std::string consolePattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";
    std::string filePattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] [%s:%#] %v";
    std::string fileName = "ring_buffer.log";
    size_t maxFileSize = 1024ULL * 1024ULL * 10ULL; // 10MB
    size_t maxFiles = 5;

    // Parse raw key/value text. Malformed lines are skipped.
    static std::unordered_map<std::string, std::string> parse(const std::string& text);

    // Apply parsed keys on top of the defaults
    static LogProperties fromMap(const std::unordered_map<std::string, std::string>& props);

    // First existing file among candidates, or nullopt
    static std::optional<std::filesystem::path> locate(const std::filesystem::path& logDirectory);
    static std::vector<std::filesystem::path> searchPaths(const std::filesystem::path& logDirectory);

    // locate() + parse() + fromMap(); defaults when no file exists
    static LogProperties load(const std::filesystem::path& logDirectory);
};

// "TRACE", "debug", "Warn", ... -> spdlog level. nullopt for unknown names.
std::optional<spdlog::level::level_enum> parseLogLevel(std::string name);
