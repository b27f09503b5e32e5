#include "csv_writer.hpp"

#include <stdexcept>
#include <utility>

namespace condeval {

namespace {

// Значение в кавычках; внутренние двойные кавычки удваиваются
std::string quoted(const std::string& value) {
    std::string result = "\"";
    for (char ch : value) {
        if (ch == '"') {
            result += '"';
        }
        result += ch;
    }
    result += '"';
    return result;
}

} // namespace

CsvWriter::CsvWriter(std::filesystem::path targetPath) : path(std::move(targetPath)) {
    std::ofstream stream(path, std::ios::trunc);
    if (!stream.is_open()) {
        throw std::runtime_error("Не удалось открыть файл для записи CSV: " + path.string());
    }
    stream << "line,expression,status,result,message\n";
    ensureWritten(stream);
}

void CsvWriter::write(const std::vector<CheckRecord>& records) const {
    std::ofstream stream = openForAppend();
    for (const auto& record : records) {
        writeRow(stream, record);
    }
    ensureWritten(stream);
}

std::ofstream CsvWriter::openForAppend() const {
    std::ofstream stream(path, std::ios::app);
    if (!stream.is_open()) {
        throw std::runtime_error("Не удалось открыть файл для записи CSV: " + path.string());
    }
    return stream;
}

// Буфер сбрасывается сразу, чтобы ошибка записи не потерялась в деструкторе потока
void CsvWriter::ensureWritten(std::ofstream& stream) const {
    stream.flush();
    if (!stream) {
        throw std::runtime_error("Ошибка записи в файл CSV: " + path.string());
    }
}

void CsvWriter::writeRow(std::ostream& stream, const CheckRecord& record) {
    stream << record.lineNumber << ',' << quoted(record.expression) << ',' << record.status << ',';
    // Пустое значение, если условие не удалось разобрать
    if (record.result.has_value()) {
        stream << (*record.result ? "true" : "false");
    }
    stream << ',' << quoted(record.message) << '\n';
}

} // namespace condeval
