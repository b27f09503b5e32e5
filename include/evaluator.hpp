#pragma once

#include <functional>
#include <future>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

#include "ast.hpp"
#include "callback_executor.hpp"
#include "logger.hpp"
#include "placeholder_resolver.hpp"
#include "thread_pool.hpp"

namespace condeval {

// Класс-фасад для проверки условий.
// Объединяет этапы токенизации, парсинга и вычисления AST и предоставляет
// блокирующий и асинхронный варианты проверки одного условия и списка условий.
//
// Резолвер, журнал, пул и контекст обработчиков должны пережить объект,
// а сам объект — все запущенные им асинхронные проверки.
class ConditionEvaluator {
public:
    // Обработчик результата асинхронной проверки
    using CompletionCallback = std::function<void(bool)>;

    ConditionEvaluator(const PlaceholderResolver& resolver,
                       Logger& logger,
                       ThreadPool& workers,
                       CallbackExecutor& callbacks);

    // Разбирает выражение в AST, пригодное для многократного вычисления.
    // Выбрасывает ParseError при синтаксических ошибках
    static NodePtr compile(const std::string& expression);

    // Вычисляет заранее разобранное выражение для вызывающей стороны
    bool evaluate(const Node& ast, const Caller& caller) const;

    // Проверяет одно условие. Пример: "%level% >= 10 && %world% == nether"
    // Выбрасывает ParseError, если выражение некорректно
    bool evaluate(const Caller& caller, const std::string& expression) const;

    // Проверяет все условия по порядку (неявное И).
    // Останавливается на первом ложном или некорректном условии,
    // пустой список считается выполненным.
    bool evaluateAll(const Caller& caller, const std::vector<std::string>& expressions) const;

    // Проверяет условие в пуле потоков.
    // Никогда не выбрасывает ошибок разбора или вычисления: они записываются
    // в журнал, а результатом становится false.
    // Обработчик и заполнение future выполняются в контексте обработчиков.
    std::future<bool> evaluateAsync(std::shared_ptr<const Caller> caller,
                                    std::string expression,
                                    CompletionCallback onComplete = {}) const;

    // Асинхронная проверка списка условий: строго последовательная цепочка,
    // следующее условие отправляется в пул только после результата предыдущего.
    // Запрос остановки прерывает цепочку между условиями с результатом false.
    std::future<bool> evaluateAllAsync(std::shared_ptr<const Caller> caller,
                                       std::vector<std::string> expressions,
                                       CompletionCallback onComplete = {},
                                       std::stop_token stopToken = {}) const;

private:
    struct Chain;

    const PlaceholderResolver& resolver;
    Logger& logger;
    ThreadPool& workers;
    CallbackExecutor& callbacks;

    // Очередной шаг асинхронной цепочки; вызывается в контексте обработчиков
    void continueChain(const std::shared_ptr<Chain>& chain, std::size_t index) const;

    // Завершение цепочки: обработчик и future
    void finishChain(const std::shared_ptr<Chain>& chain, bool result) const;

    // Вызов пользовательского обработчика с записью его ошибок в журнал
    void notify(const CompletionCallback& onComplete, bool result) const;
};

} // namespace condeval
