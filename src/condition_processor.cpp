#include "condition_processor.hpp"

#include "parse_error.hpp"

#include <fstream>
#include <future>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

// Проверка одной строки; ошибки превращаются в запись со статусом error
condeval::CheckRecord checkLine(const condeval::ConditionEvaluator& evaluator,
                                const condeval::Caller& caller,
                                std::size_t lineNumber,
                                std::string text) {
    condeval::CheckRecord record{lineNumber, std::move(text), std::nullopt, "success", ""};
    try {
        record.result = evaluator.evaluate(caller, record.expression);
    }
    catch (const condeval::ParseError& ex) {
        record.status = "error";
        record.message = ex.what();
    }
    catch (const std::exception& ex) {
        record.status = "error";
        record.message = std::string("Ошибка вычисления: ") + ex.what();
    }
    catch (...) {
        record.status = "error";
        record.message = "Ошибка вычисления: неизвестное исключение";
    }
    return record;
}

} // namespace

ProcessingStats processConditionsFile(const std::filesystem::path& path,
                                      const condeval::ConditionEvaluator& evaluator,
                                      const condeval::Caller& caller,
                                      condeval::ThreadPool& pool,
                                      const condeval::CsvWriter& writer,
                                      std::atomic<std::size_t>& completed,
                                      std::size_t batchSize) {
    std::ifstream input(path);
    if (!input.is_open()) {
        throw std::runtime_error("Не удалось открыть файл условий: " + path.string());
    }

    ProcessingStats stats;
    std::vector<std::future<condeval::CheckRecord>> futures;
    futures.reserve(batchSize);

    // Futures собираются в порядке постановки, поэтому порядок строк сохраняется
    auto flushBatch = [&]() {
        std::vector<condeval::CheckRecord> batch;
        batch.reserve(futures.size());
        for (auto& future : futures) {
            batch.push_back(future.get());
            const auto& record = batch.back();
            if (!record.result.has_value()) {
                ++stats.errors;
            } else if (*record.result) {
                ++stats.passed;
            } else {
                ++stats.failed;
            }
        }
        writer.write(batch);
        futures.clear();
    };

    std::string line;
    std::size_t lineNumber = 0;
    try {
        while (std::getline(input, line)) {
            ++lineNumber;
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }

            futures.push_back(pool.enqueue(
                [&evaluator, &caller, &completed, lineNumber](std::string text) {
                    auto record = checkLine(evaluator, caller, lineNumber, std::move(text));
                    completed.fetch_add(1);
                    return record;
                },
                std::move(line)));

            if (futures.size() >= batchSize) {
                flushBatch();
            }
        }

        flushBatch();
    }
    catch (...) {
        // Задачи в пуле ссылаются на evaluator и caller: дожидаемся их до выхода
        for (auto& future : futures) {
            if (future.valid()) {
                future.wait();
            }
        }
        throw;
    }
    return stats;
}
