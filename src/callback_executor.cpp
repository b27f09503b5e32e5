#include "callback_executor.hpp"

#include <utility>

namespace condeval {

void TaskQueue::post(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        tasks.push(std::move(task));
    }
    condition.notify_one();
}

std::size_t TaskQueue::runPending() {
    std::size_t executed = 0;
    while (true) {
        std::function<void()> task;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (tasks.empty()) {
                return executed;
            }
            task = std::move(tasks.front());
            tasks.pop();
        }

        // Выполняем задачу вне блокировки: она может добавить новые
        task();
        ++executed;
    }
}

std::size_t TaskQueue::runPendingFor(std::chrono::milliseconds timeout) {
    {
        std::unique_lock<std::mutex> lock(mutex);
        condition.wait_for(lock, timeout, [this]() { return !tasks.empty(); });
    }
    return runPending();
}

std::size_t TaskQueue::pending() const {
    std::lock_guard<std::mutex> lock(mutex);
    return tasks.size();
}

} // namespace condeval
