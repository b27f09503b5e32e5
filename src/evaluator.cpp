#include "evaluator.hpp"

#include "parse_error.hpp"
#include "parser.hpp"
#include "tokenizer.hpp"

#include <exception>
#include <utility>

namespace condeval {

namespace {

const char* toText(bool value) {
    return value ? "true" : "false";
}

} // namespace

// Состояние асинхронной проверки списка условий
struct ConditionEvaluator::Chain {
    std::shared_ptr<const Caller> caller;
    std::vector<std::string> expressions;
    CompletionCallback onComplete;
    std::stop_token stopToken;
    std::promise<bool> promise;
};

ConditionEvaluator::ConditionEvaluator(const PlaceholderResolver& resolver,
                                       Logger& logger,
                                       ThreadPool& workers,
                                       CallbackExecutor& callbacks)
    : resolver(resolver), logger(logger), workers(workers), callbacks(callbacks) {}

// Полный цикл разбора:
// 1. Токенизация (Tokenizer) — по одному токену по запросу парсера
// 2. Парсинг (Parser) -> построение AST и проверка конца выражения
NodePtr ConditionEvaluator::compile(const std::string& expression) {
    Tokenizer tokenizer(expression);
    Parser parser(tokenizer);
    return parser.parse();
}

bool ConditionEvaluator::evaluate(const Node& ast, const Caller& caller) const {
    return condeval::evaluate(ast, caller, resolver);
}

bool ConditionEvaluator::evaluate(const Caller& caller, const std::string& expression) const {
    auto ast = compile(expression);
    bool result = evaluate(*ast, caller);
    logger.debug("Условие \"" + expression + "\" для " + caller.name() + ": " + toText(result));
    return result;
}

bool ConditionEvaluator::evaluateAll(const Caller& caller, const std::vector<std::string>& expressions) const {
    for (const auto& expression : expressions) {
        try {
            if (!evaluate(caller, expression)) {
                logger.debug("Проверка списка остановлена на условии: " + expression);
                return false;
            }
        }
        catch (const ParseError& ex) {
            logger.warn("Ошибка разбора условия \"" + expression + "\": " + ex.what());
            return false;
        }
    }
    return true;
}

std::future<bool> ConditionEvaluator::evaluateAsync(std::shared_ptr<const Caller> caller,
                                                    std::string expression,
                                                    CompletionCallback onComplete) const {
    struct Pending {
        std::shared_ptr<const Caller> caller;
        std::string expression;
        CompletionCallback onComplete;
        std::promise<bool> promise;
    };

    auto pending = std::make_shared<Pending>();
    pending->caller = std::move(caller);
    pending->expression = std::move(expression);
    pending->onComplete = std::move(onComplete);
    std::future<bool> future = pending->promise.get_future();

    // Результат передаётся в контекст обработчиков
    auto complete = [this, pending](bool result) {
        callbacks.post([this, pending, result]() {
            notify(pending->onComplete, result);
            pending->promise.set_value(result);
        });
    };

    if (!pending->caller) {
        logger.warn("Асинхронная проверка условия \"" + pending->expression + "\" без вызывающей стороны");
        complete(false);
        return future;
    }

    try {
        workers.enqueue([this, pending, complete]() {
            bool result = false;
            try {
                result = evaluate(*pending->caller, pending->expression);
            }
            catch (const std::exception& ex) {
                logger.warn("Асинхронная проверка условия \"" + pending->expression +
                            "\" не удалась: " + ex.what());
            }
            catch (...) {
                logger.warn("Асинхронная проверка условия \"" + pending->expression +
                            "\" не удалась: неизвестное исключение");
            }
            complete(result);
        });
    }
    catch (const std::exception& ex) {
        logger.warn("Не удалось поставить проверку условия \"" + pending->expression +
                    "\" в очередь: " + ex.what());
        complete(false);
    }
    return future;
}

std::future<bool> ConditionEvaluator::evaluateAllAsync(std::shared_ptr<const Caller> caller,
                                                       std::vector<std::string> expressions,
                                                       CompletionCallback onComplete,
                                                       std::stop_token stopToken) const {
    auto chain = std::make_shared<Chain>();
    chain->caller = std::move(caller);
    chain->expressions = std::move(expressions);
    chain->onComplete = std::move(onComplete);
    chain->stopToken = std::move(stopToken);
    std::future<bool> future = chain->promise.get_future();

    if (chain->expressions.empty()) {
        callbacks.post([this, chain]() { finishChain(chain, true); });
        return future;
    }

    continueChain(chain, 0);
    return future;
}

void ConditionEvaluator::continueChain(const std::shared_ptr<Chain>& chain, std::size_t index) const {
    if (index >= chain->expressions.size()) {
        finishChain(chain, true);
        return;
    }
    if (chain->stopToken.stop_requested()) {
        logger.debug("Проверка списка отменена перед условием " + std::to_string(index + 1));
        finishChain(chain, false);
        return;
    }

    // Следующее условие запускается только из обработчика текущего
    evaluateAsync(chain->caller, chain->expressions[index], [this, chain, index](bool passed) {
        if (!passed) {
            logger.debug("Асинхронная проверка списка остановлена на условии: " + chain->expressions[index]);
            finishChain(chain, false);
            return;
        }
        continueChain(chain, index + 1);
    });
}

void ConditionEvaluator::finishChain(const std::shared_ptr<Chain>& chain, bool result) const {
    notify(chain->onComplete, result);
    chain->promise.set_value(result);
}

void ConditionEvaluator::notify(const CompletionCallback& onComplete, bool result) const {
    if (!onComplete) {
        return;
    }
    try {
        onComplete(result);
    }
    catch (const std::exception& ex) {
        logger.error(std::string("Обработчик результата проверки выбросил исключение: ") + ex.what());
    }
    catch (...) {
        logger.error("Обработчик результата проверки выбросил неизвестное исключение");
    }
}

} // namespace condeval
