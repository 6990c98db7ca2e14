#include "log_properties.h"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace {

std::string trim(const std::string& s)
{
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return {};
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

void applyLevel(const std::unordered_map<std::string, std::string>& props,
                const std::string& key, spdlog::level::level_enum& target)
{
    auto it = props.find(key);
    if (it == props.end()) return;
    if (auto lvl = parseLogLevel(it->second)) {
        target = *lvl;
    } else {
        std::cerr << "log.properties: unknown level '" << it->second << "' for " << key << std::endl;
    }
}

void applySize(const std::unordered_map<std::string, std::string>& props,
               const std::string& key, size_t& target)
{
    auto it = props.find(key);
    if (it == props.end()) return;
    try {
        target = static_cast<size_t>(std::stoull(it->second));
    } catch (const std::invalid_argument&) {
        std::cerr << "log.properties: " << key << " is not a number: " << it->second << std::endl;
    } catch (const std::out_of_range&) {
        std::cerr << "log.properties: " << key << " is out of range: " << it->second << std::endl;
    }
}

} // namespace

std::optional<spdlog::level::level_enum> parseLogLevel(std::string name)
{
    for (auto& c : name) c = static_cast<char>(::toupper(static_cast<unsigned char>(c)));
    name = trim(name);
    if (name == "TRACE") return spdlog::level::trace;
    if (name == "DEBUG") return spdlog::level::debug;
    if (name == "INFO") return spdlog::level::info;
    if (name == "WARN" || name == "WARNING") return spdlog::level::warn;
    if (name == "ERROR") return spdlog::level::err;
    if (name == "CRITICAL") return spdlog::level::critical;
    if (name == "OFF") return spdlog::level::off;
    return std::nullopt;
}

std::unordered_map<std::string, std::string> LogProperties::parse(const std::string& text)
{
    std::unordered_map<std::string, std::string> props;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        auto start = line.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) continue;
        if (line[start] == '#') continue;
        auto eq = line.find('=', start);
        if (eq == std::string::npos) continue;
        std::string key = trim(line.substr(start, eq - start));
        if (key.empty()) continue;
        for (auto& c : key) c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
        props[key] = trim(line.substr(eq + 1));
    }
    return props;
}

LogProperties LogProperties::fromMap(const std::unordered_map<std::string, std::string>& props)
{
    LogProperties result;
    applyLevel(props, "level", result.loggerLevel);
    applyLevel(props, "console_level", result.consoleLevel);
    applyLevel(props, "file_level", result.fileLevel);
    applySize(props, "max_size", result.maxFileSize);
    applySize(props, "max_files", result.maxFiles);

    auto it = props.find("console_pattern");
    if (it != props.end() && !it->second.empty()) result.consolePattern = it->second;
    it = props.find("file_pattern");
    if (it != props.end() && !it->second.empty()) result.filePattern = it->second;
    it = props.find("file");
    if (it != props.end() && !it->second.empty()) result.fileName = it->second;
    return result;
}

std::vector<std::filesystem::path> LogProperties::searchPaths(const std::filesystem::path& logDirectory)
{
    return {
        std::filesystem::current_path() / "config" / "log.properties",
        logDirectory / "log.properties",
        std::filesystem::current_path() / "log.properties"
    };
}

std::optional<std::filesystem::path> LogProperties::locate(const std::filesystem::path& logDirectory)
{
    for (const auto& p : searchPaths(logDirectory)) {
        std::error_code ec;
        if (std::filesystem::is_regular_file(p, ec)) {
            return p;
        }
    }
    return std::nullopt;
}

LogProperties LogProperties::load(const std::filesystem::path& logDirectory)
{
    auto path = locate(logDirectory);
    if (!path) {
        return LogProperties{};
    }

    std::ifstream ifs(*path);
    if (!ifs) {
        std::cerr << "Cannot open " << path->string() << ", using default log settings" << std::endl;
        return LogProperties{};
    }
    std::ostringstream content;
    content << ifs.rdbuf();
    return fromMap(parse(content.str()));
}
