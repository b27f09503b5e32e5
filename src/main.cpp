#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "callback_executor.hpp"
#include "condition_processor.hpp"
#include "console.hpp"
#include "csv_writer.hpp"
#include "evaluator.hpp"
#include "file_utils.hpp"
#include "generate_mode.hpp"
#include "logger.hpp"
#include "progress_bar.hpp"
#include "thread_pool.hpp"
#include "user_input.hpp"
#include "variable_table.hpp"

namespace {

// Имя вызывающей стороны для %caller% в условиях из консоли
constexpr const char* kConsoleCaller = "console";

void printError(const std::exception& ex) {
    std::cerr << "\n" << Color::RED << Color::BOLD << "✗ Ошибка: "
        << Color::RESET << Color::RED << ex.what() << Color::RESET << "\n\n";
}

// Один прогон: выбор файлов, проверка условий и вывод статистики
void runCheckSession() {
    std::filesystem::path inputPath = selectConditionsFile();
    std::optional<std::filesystem::path> variablesPath = selectVariablesFile();
    std::filesystem::path outputPath = selectOutputFile(inputPath);
    std::size_t threadCount = selectThreadCount();
    bool verbose = askVerbose();

    condeval::VariableTable variables;
    if (variablesPath) {
        variables = condeval::VariableTable::loadFromFile(*variablesPath);
    }

    std::cout << "\n";
    std::cout << Color::BOLD << "Конфигурация:\n" << Color::RESET;
    std::cout << "  Файл условий:   " << Color::YELLOW << inputPath << Color::RESET << "\n";
    std::cout << "  Переменные:     " << Color::YELLOW
        << (variablesPath ? variablesPath->string() : std::string("нет")) << Color::RESET
        << " (" << variables.size() << ")\n";
    std::cout << "  Выходной файл:  " << Color::YELLOW << outputPath << Color::RESET << "\n";
    std::cout << "  Потоков:        " << Color::CYAN << threadCount << Color::RESET << "\n\n";

    // 0. Быстрый подсчет количества строк в файле
    std::cout << Color::BOLD << "Подсчет строк в файле..." << Color::RESET << std::flush;
    std::size_t totalLines = countLinesInFile(inputPath);
    std::cout << " " << Color::GREEN << "✓" << Color::RESET << " (" << totalLines << " строк)\n\n";

    // 1. Проверка условий в пуле потоков с потоковой записью результатов
    std::cout << Color::BOLD << "Проверка условий:\n" << Color::RESET;
    auto startProcess = std::chrono::steady_clock::now();

    condeval::ConsoleLogger logger(verbose ? condeval::LogLevel::Debug : condeval::LogLevel::Warning);
    condeval::ThreadPool pool(threadCount);
    condeval::InlineExecutor callbacks;
    condeval::ConditionEvaluator evaluator(variables, logger, pool, callbacks);
    condeval::NamedCaller caller(kConsoleCaller);
    condeval::CsvWriter writer(outputPath);

    std::atomic<std::size_t> completed{0};
    std::thread progressThread(displayProgress, std::cref(completed), totalLines);

    ProcessingStats stats;
    try {
        stats = processConditionsFile(inputPath, evaluator, caller, pool, writer, completed);
    }
    catch (const std::exception&) {
        // Прогресс-бар должен завершиться, иначе поток не присоединить
        completed.store(totalLines);
        progressThread.join();
        throw;
    }
    // Строк могло оказаться меньше, если файл менялся во время работы
    completed.store(totalLines);
    progressThread.join();

    auto processDuration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startProcess);
    std::size_t checked = stats.passed + stats.failed + stats.errors;

    // 2. Итоговая статистика
    std::cout << "\n" << Color::BOLD << "Статистика:\n" << Color::RESET;
    std::cout << "  Всего условий:    " << Color::CYAN << checked << Color::RESET << "\n";
    std::cout << "  Выполнено:        " << Color::GREEN << stats.passed << Color::RESET << "\n";
    std::cout << "  Не выполнено:     " << Color::YELLOW << stats.failed << Color::RESET << "\n";
    if (stats.errors > 0) {
        std::cout << "  Ошибок:           " << Color::RED << stats.errors << Color::RESET << "\n";
    }
    std::cout << "  Время обработки:  " << Color::MAGENTA << processDuration.count() << " мс" << Color::RESET << "\n";
    if (processDuration.count() > 0) {
        std::cout << "  Производительность: " << Color::YELLOW
            << static_cast<long long>(checked * 1000.0 / processDuration.count())
            << " усл/сек" << Color::RESET << "\n";
    }
    std::cout << "\n" << Color::GREEN << "Результаты сохранены в: " << outputPath << Color::RESET << "\n\n";
}

} // namespace

// Точка входа в программу
int main(int argc, char** argv) {
    if (argc >= 2 && std::string(argv[1]) == "generate") {
        try {
            runGenerateMode();
            return 0;
        }
        catch (const std::exception& ex) {
            printError(ex);
            return 1;
        }
    }

    printHeader();

    bool continueProcessing = true;
    while (continueProcessing) {
        try {
            runCheckSession();
        }
        catch (const std::exception& ex) {
            printError(ex);
        }

        // При ошибке тоже спрашиваем, хочет ли пользователь попробовать снова
        try {
            continueProcessing = askContinue();
        }
        catch (const std::exception&) {
            // Ввод закрыт: продолжать нечего
            continueProcessing = false;
        }
        if (continueProcessing) {
            std::cout << "\n";
        }
    }

    std::cout << Color::CYAN << "Работа завершена. До свидания!" << Color::RESET << "\n\n";
    return 0;
}
