#pragma once

#include <iostream>
#include <mutex>
#include <ostream>
#include <string>

namespace condeval {

// Уровни журнала. None отключает вывод полностью.
enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error,
    None
};

const char* logLevelName(LogLevel level);

// Журнал диагностических сообщений движка.
// Реализации должны допускать вызовы из нескольких потоков.
class Logger {
public:
    virtual ~Logger() = default;

    virtual void log(LogLevel level, const std::string& message) = 0;

    void debug(const std::string& message) { log(LogLevel::Debug, message); }
    void info(const std::string& message) { log(LogLevel::Info, message); }
    void warn(const std::string& message) { log(LogLevel::Warning, message); }
    void error(const std::string& message) { log(LogLevel::Error, message); }
};

// Цветной вывод в поток (по умолчанию std::cerr) с порогом уровня
class ConsoleLogger final : public Logger {
public:
    explicit ConsoleLogger(LogLevel threshold = LogLevel::Info, std::ostream& stream = std::cerr);

    void log(LogLevel level, const std::string& message) override;

    void setThreshold(LogLevel level);
    LogLevel threshold() const;

private:
    std::ostream& stream;
    LogLevel minLevel;
    mutable std::mutex mutex; // Сообщения из разных потоков не перемешиваются
};

// Журнал, который ничего не выводит
class NullLogger final : public Logger {
public:
    void log(LogLevel, const std::string&) override {}
};

} // namespace condeval
