#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace condeval {

// Пул рабочих потоков для проверки условий вне вызывающего потока.
// Допускает одновременную постановку задач из нескольких потоков.
class ThreadPool {
public:
    // При threadCount == 0 создаётся один поток
    explicit ThreadPool(std::size_t threadCount);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Добавляет новую задачу в очередь.
    // Возвращает std::future для получения результата выполнения.
    // Выбрасывает std::runtime_error, если пул уже остановлен
    template <class Func, class... Args>
    auto enqueue(Func&& func, Args&&... args)
        -> std::future<std::invoke_result_t<Func, Args...>>;

    std::size_t size() const { return workers.size(); }

private:
    std::vector<std::thread> workers;          // Рабочие потоки
    std::queue<std::function<void()>> tasks;   // Очередь задач

    std::mutex mutex;                          // Защищает очередь и флаг остановки
    std::condition_variable condition;         // Будит потоки при появлении задач
    bool stop = false;                         // Флаг остановки пула

    // Основной цикл рабочего потока
    void workerLoop();
};

template <class Func, class... Args>
inline auto ThreadPool::enqueue(Func&& func, Args&&... args)
    -> std::future<std::invoke_result_t<Func, Args...>> {
    using Return = std::invoke_result_t<Func, Args...>;

    // Аргументы сохраняются по значению вместе с функцией
    auto task = std::make_shared<std::packaged_task<Return()>>(
        [func = std::forward<Func>(func),
         arguments = std::make_tuple(std::forward<Args>(args)...)]() mutable -> Return {
            return std::apply(std::move(func), std::move(arguments));
        });

    std::future<Return> result = task->get_future();
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (stop) {
            throw std::runtime_error("Пул потоков уже остановлен");
        }
        tasks.emplace([task]() { (*task)(); });
    }

    condition.notify_one();
    return result;
}

} // namespace condeval
