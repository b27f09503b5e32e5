#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

// Безопасный парсинг положительного числа из строки
std::size_t parsePositiveNumber(const std::string& value);

// Интерактивный выбор файла условий (.txt в папке tests или произвольный путь)
std::filesystem::path selectConditionsFile();

// Интерактивный выбор файла переменных (.vars в папке tests или путь).
// Пустой ввод означает работу без переменных
std::optional<std::filesystem::path> selectVariablesFile();

// Интерактивный выбор выходного файла
std::filesystem::path selectOutputFile(const std::filesystem::path& inputPath);

// Интерактивный ввод количества потоков
std::size_t selectThreadCount();

// Запрос подробного журнала (сообщения уровня DEBUG)
bool askVerbose();

// Запрос продолжения работы с другим файлом
bool askContinue();

// Интерактивный ввод количества условий для генерации
std::size_t askConditionCount();

// Интерактивный выбор имени файла для генерации
std::filesystem::path selectGeneratedFileName(std::size_t conditionCount);
