#pragma once

#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

namespace condeval {

// Результат проверки одной строки файла условий
struct CheckRecord {
    std::size_t lineNumber;       // Номер строки в исходном файле
    std::string expression;       // Исходный текст условия
    std::optional<bool> result;   // Значение условия (если разбор успешен)
    std::string status;           // Статус (success или error)
    std::string message;          // Сообщение об ошибке (если есть)
};

// Запись результатов проверки в формате CSV
// Формат: line,expression,status,result,message
class CsvWriter {
public:
    // Конструктор создаёт файл (перезаписывая его) и записывает заголовок
    // Выбрасывает std::runtime_error, если файл не открывается
    explicit CsvWriter(std::filesystem::path targetPath);

    // Дописывает пакет результатов
    // Выбрасывает std::runtime_error, если файл не открывается или запись не удалась
    void write(const std::vector<CheckRecord>& records) const;

private:
    std::filesystem::path path; // Путь к выходному файлу

    std::ofstream openForAppend() const;
    void ensureWritten(std::ofstream& stream) const;
    static void writeRow(std::ostream& stream, const CheckRecord& record);
};

} // namespace condeval
