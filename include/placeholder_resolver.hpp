#pragma once

#include <string>
#include <utility>

namespace condeval {

// Вызывающая сторона, для которой проверяется условие.
// Движок не знает её устройства и передаёт её резолверу как есть.
class Caller {
public:
    virtual ~Caller() = default;

    // Имя для диагностических сообщений
    virtual std::string name() const = 0;
};

// Внешний сервис подстановки плейсхолдеров.
// Должен возвращать текст с подставленными известными ссылками,
// неизвестные ссылки оставлять без изменений и быть безопасным
// для многократного и параллельного вызова.
class PlaceholderResolver {
public:
    virtual ~PlaceholderResolver() = default;

    virtual std::string resolve(const Caller& caller, const std::string& rawText) const = 0;
};

// Простейшая вызывающая сторона, известная только по имени
class NamedCaller final : public Caller {
public:
    explicit NamedCaller(std::string callerName) : callerName(std::move(callerName)) {}

    std::string name() const override { return callerName; }

private:
    std::string callerName;
};

} // namespace condeval
