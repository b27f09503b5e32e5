#include "logger.hpp"

#include "console.hpp"

namespace condeval {

namespace {

const char* levelColor(LogLevel level) {
    switch (level) {
    case LogLevel::Debug:
        return Color::GRAY;
    case LogLevel::Info:
        return Color::CYAN;
    case LogLevel::Warning:
        return Color::YELLOW;
    case LogLevel::Error:
        return Color::RED;
    default:
        return Color::RESET;
    }
}

} // namespace

const char* logLevelName(LogLevel level) {
    switch (level) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warning:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::None:
        return "NONE";
    }
    return "?";
}

ConsoleLogger::ConsoleLogger(LogLevel threshold, std::ostream& stream)
    : stream(stream), minLevel(threshold) {}

void ConsoleLogger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex);
    if (minLevel == LogLevel::None || level < minLevel) {
        return;
    }
    stream << levelColor(level) << "[" << logLevelName(level) << "] " << Color::RESET << message << "\n";
}

void ConsoleLogger::setThreshold(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex);
    minLevel = level;
}

LogLevel ConsoleLogger::threshold() const {
    std::lock_guard<std::mutex> lock(mutex);
    return minLevel;
}

} // namespace condeval
