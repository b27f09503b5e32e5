#include "generate_mode.hpp"
#include "condition_generator.hpp"
#include "console.hpp"
#include "file_utils.hpp"
#include "user_input.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

void runGenerateMode() {
    printHeader();

    std::cout << Color::BOLD << Color::CYAN << "Режим генерации условий\n" << Color::RESET << "\n";

    // 1. Количество условий и имя файла
    std::size_t conditionCount = askConditionCount();
    std::filesystem::path fileName = selectGeneratedFileName(conditionCount);

    // 2. Файл создаётся в папке tests (относительное имя) или по абсолютному пути
    std::filesystem::path testsDir = findProjectRoot() / "tests";
    std::filesystem::create_directories(testsDir);
    std::filesystem::path outputPath = fileName.is_absolute() ? fileName : testsDir / fileName;

    std::cout << "\n";
    std::cout << Color::BOLD << "Конфигурация:\n" << Color::RESET;
    std::cout << "  Количество условий: " << Color::CYAN << conditionCount << Color::RESET << "\n";
    std::cout << "  Выходной файл:      " << Color::YELLOW << outputPath << Color::RESET << "\n\n";

    // 3. Генерация
    std::cout << Color::BOLD << "Генерация условий..." << Color::RESET << std::flush;
    auto start = std::chrono::steady_clock::now();

    std::ofstream output(outputPath);
    if (!output.is_open()) {
        throw std::runtime_error("Не удалось создать файл: " + outputPath.string());
    }

    condeval::ConditionGenerator generator;
    for (std::size_t i = 0; i < conditionCount; ++i) {
        // Глубина вложенности от 0 до 3
        output << generator.generate(static_cast<int>(i % 4)) << "\n";

        if ((i + 1) % 10000 == 0) {
            std::cout << "\r  " << Color::CYAN << (i + 1) << "/" << conditionCount
                << " условий сгенерировано..." << Color::RESET << std::flush;
        }
    }
    output.close();
    if (!output) {
        throw std::runtime_error("Ошибка записи в файл: " + outputPath.string());
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    std::cout << "\r  " << Color::GREEN << "✓" << Color::RESET << " ("
        << conditionCount << " условий, " << duration.count() << " мс)\n\n";
    std::cout << Color::GREEN << "Файл успешно создан: " << outputPath << Color::RESET << "\n\n";
}
