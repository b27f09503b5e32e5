#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>

namespace condeval {

// Контекст, в котором выполняются обработчики завершения асинхронных проверок
// (например, главный поток приложения).
class CallbackExecutor {
public:
    virtual ~CallbackExecutor() = default;

    // Передаёт задачу на выполнение. Может вызываться из любого потока.
    virtual void post(std::function<void()> task) = 0;
};

// Выполняет задачу сразу в вызывающем потоке (обычно в рабочем потоке пула)
class InlineExecutor final : public CallbackExecutor {
public:
    void post(std::function<void()> task) override { task(); }
};

// Очередь задач, которую владелец разбирает в своём потоке.
// Задачи выполняются только при вызове runPending / runPendingFor.
class TaskQueue final : public CallbackExecutor {
public:
    void post(std::function<void()> task) override;

    // Выполняет все накопленные задачи, возвращает их количество.
    // Задачи, добавленные во время разбора, выполняются в этом же вызове.
    std::size_t runPending();

    // Ждёт появления задач не дольше timeout, затем выполняет накопленные
    std::size_t runPendingFor(std::chrono::milliseconds timeout);

    std::size_t pending() const;

private:
    std::queue<std::function<void()>> tasks;
    mutable std::mutex mutex;
    std::condition_variable condition;
};

} // namespace condeval
