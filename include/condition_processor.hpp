#pragma once

#include "csv_writer.hpp"
#include "evaluator.hpp"
#include "placeholder_resolver.hpp"
#include "thread_pool.hpp"

#include <atomic>
#include <cstddef>
#include <filesystem>

// Итоги проверки файла условий
struct ProcessingStats {
    std::size_t passed = 0;  // Условие выполнено
    std::size_t failed = 0;  // Условие не выполнено
    std::size_t errors = 0;  // Ошибка разбора или вычисления
};

// Потоковая проверка файла условий: одна строка — одно условие.
// Строки отправляются в пул потоков, результаты собираются пакетами по batchSize
// и записываются в CSV в порядке строк файла.
// completed увеличивается после каждой проверенной строки (для прогресс-бара).
ProcessingStats processConditionsFile(const std::filesystem::path& path,
                                      const condeval::ConditionEvaluator& evaluator,
                                      const condeval::Caller& caller,
                                      condeval::ThreadPool& pool,
                                      const condeval::CsvWriter& writer,
                                      std::atomic<std::size_t>& completed,
                                      std::size_t batchSize = 1000);
