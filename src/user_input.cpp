#include "user_input.hpp"
#include "console.hpp"
#include "file_utils.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <vector>

namespace {

// Чтение строки ответа с обрезкой пробелов по краям
std::string readAnswer(const std::string& prompt) {
    std::cout << Color::BOLD << prompt << Color::RESET;
    std::string input;
    if (!std::getline(std::cin, input)) {
        throw std::runtime_error("Ввод завершён");
    }

    const auto first = input.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
        return "";
    }
    return input.substr(first, input.find_last_not_of(" \t\r") - first + 1);
}

bool isAllDigits(const std::string& text) {
    return !text.empty() && std::all_of(text.begin(), text.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    });
}

bool isYes(std::string answer) {
    std::transform(answer.begin(), answer.end(), answer.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return answer == "y" || answer == "yes" || answer == "д" || answer == "да";
}

// Список найденных файлов с номерами
void printCandidates(const std::vector<std::filesystem::path>& files, const std::string& title) {
    std::cout << Color::BOLD << title << Color::RESET;
    for (std::size_t i = 0; i < files.size(); ++i) {
        std::cout << "  " << Color::CYAN << (i + 1) << Color::RESET << ". "
            << Color::YELLOW << files[i].filename().string() << Color::RESET << "\n";
    }
    std::cout << "\n";
}

// Выбор по номеру из списка или по пути
std::filesystem::path pickFile(const std::vector<std::filesystem::path>& files, const std::string& answer) {
    if (isAllDigits(answer) && !files.empty()) {
        std::size_t index = parsePositiveNumber(answer);
        if (index > files.size()) {
            throw std::runtime_error("Номер файла вне допустимого диапазона");
        }
        return files[index - 1];
    }

    std::filesystem::path path = answer;
    if (!std::filesystem::exists(path)) {
        throw std::runtime_error("Файл не найден: " + path.string());
    }
    return path;
}

// Путь с нужным расширением; относительный путь берётся от базовой директории
std::filesystem::path withExtension(std::filesystem::path path, const std::filesystem::path& baseDir,
                                    const std::string& ext) {
    if (!path.is_absolute()) {
        path = baseDir / path;
    }
    if (path.extension() != ext) {
        path.replace_extension(ext);
    }
    return path;
}

} // namespace

std::size_t parsePositiveNumber(const std::string& value) {
    std::size_t result = 0;
    try {
        result = std::stoul(value);
    }
    catch (const std::exception&) {
        throw std::runtime_error("Некорректное числовое значение: " + value);
    }
    if (result == 0) {
        throw std::runtime_error("Число должно быть положительным");
    }
    return result;
}

std::filesystem::path selectConditionsFile() {
    std::filesystem::path testsDir = findProjectRoot() / "tests";
    auto files = findFilesWithExtension(testsDir, ".txt");

    if (files.empty()) {
        std::cout << Color::YELLOW << "Внимание: " << Color::RESET
            << "не найдено файлов условий (.txt) в папке " << Color::CYAN << testsDir << Color::RESET << "\n\n";
    }
    else {
        printCandidates(files, "Найденные файлы условий в папке tests:\n");
    }

    std::string answer = readAnswer("Введите номер файла или путь до файла условий: ");
    if (answer.empty()) {
        throw std::runtime_error("Пустой ввод");
    }
    return pickFile(files, answer);
}

std::optional<std::filesystem::path> selectVariablesFile() {
    std::filesystem::path testsDir = findProjectRoot() / "tests";
    auto files = findFilesWithExtension(testsDir, ".vars");
    if (!files.empty()) {
        printCandidates(files, "Найденные файлы переменных в папке tests:\n");
    }

    std::string answer = readAnswer("Номер или путь файла переменных (Enter — без переменных): ");
    if (answer.empty()) {
        return std::nullopt;
    }
    return pickFile(files, answer);
}

std::filesystem::path selectOutputFile(const std::filesystem::path& inputPath) {
    std::cout << Color::BOLD << "Выберите способ задания выходного файла:\n" << Color::RESET;
    std::cout << "  " << Color::CYAN << "1" << Color::RESET << ". Название по умолчанию (имя входного файла + _results_ + время)\n";
    std::cout << "  " << Color::CYAN << "2" << Color::RESET << ". Кастомное название\n\n";

    std::string choice = readAnswer("Ваш выбор (1 или 2): ");
    if (choice == "1") {
        return inputPath.parent_path() /
            (inputPath.stem().string() + "_results_" + getCurrentTimeString() + ".csv");
    }
    if (choice == "2") {
        std::string customName = readAnswer(
            "Введите название выходного файла (можно с путем, расширение .csv добавится автоматически): ");
        if (customName.empty()) {
            throw std::runtime_error("Пустое название файла");
        }
        return withExtension(customName, inputPath.parent_path(), ".csv");
    }
    throw std::runtime_error("Некорректный выбор. Используйте 1 или 2");
}

std::size_t selectThreadCount() {
    std::size_t defaultThreads = std::thread::hardware_concurrency();
    if (defaultThreads == 0) {
        defaultThreads = 2; // Резервное значение
    }

    std::string answer = readAnswer("Введите количество потоков (по умолчанию: " +
                                    std::to_string(defaultThreads) + "): ");
    if (answer.empty()) {
        return defaultThreads;
    }
    return parsePositiveNumber(answer);
}

bool askVerbose() {
    return isYes(readAnswer("Показывать отладочные сообщения? (y/n): "));
}

bool askContinue() {
    return isYes(readAnswer("Обработать еще один файл? (y/n): "));
}

std::size_t askConditionCount() {
    std::string answer = readAnswer("Введите количество условий для генерации: ");
    if (answer.empty()) {
        throw std::runtime_error("Пустой ввод");
    }
    return parsePositiveNumber(answer);
}

std::filesystem::path selectGeneratedFileName(std::size_t conditionCount) {
    std::cout << Color::BOLD << "Выберите способ задания имени файла:\n" << Color::RESET;
    std::cout << "  " << Color::CYAN << "1" << Color::RESET << ". Автоматическое название (conditions_"
        << conditionCount << ".txt)\n";
    std::cout << "  " << Color::CYAN << "2" << Color::RESET << ". Кастомное название\n\n";

    std::string choice = readAnswer("Ваш выбор (1 или 2): ");
    if (choice == "1") {
        return std::filesystem::path("conditions_" + std::to_string(conditionCount) + ".txt");
    }
    if (choice == "2") {
        std::string customName = readAnswer("Введите название файла (расширение .txt добавится автоматически): ");
        if (customName.empty()) {
            throw std::runtime_error("Пустое название файла");
        }
        return withExtension(customName, {}, ".txt");
    }
    throw std::runtime_error("Некорректный выбор. Используйте 1 или 2");
}
