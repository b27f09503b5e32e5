#pragma once

#include <atomic>
#include <cstddef>

// Отображение прогресса проверки условий.
// Запускается в отдельном потоке и завершается, когда completed достигает total.
void displayProgress(const std::atomic<std::size_t>& completed, std::size_t total);
