#include "variable_table.hpp"

#include <fstream>
#include <stdexcept>
#include <utility>

namespace condeval {

namespace {

constexpr const char* kCallerVariable = "caller";

std::string trimmed(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t\r");
    return text.substr(first, last - first + 1);
}

} // namespace

VariableTable VariableTable::loadFromFile(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        throw std::runtime_error("Не удалось открыть файл переменных: " + path.string());
    }

    VariableTable table;
    std::string line;
    std::size_t lineNumber = 0;
    while (std::getline(input, line)) {
        ++lineNumber;
        std::string content = trimmed(line);
        if (content.empty() || content.front() == '#') {
            continue;
        }

        const auto separator = content.find('=');
        if (separator == std::string::npos || separator == 0) {
            throw std::runtime_error("Некорректная строка " + std::to_string(lineNumber) +
                                     " в файле переменных: ожидалось name=value");
        }
        table.set(trimmed(content.substr(0, separator)), trimmed(content.substr(separator + 1)));
    }
    return table;
}

void VariableTable::set(const std::string& name, std::string value) {
    variables[name] = std::move(value);
}

bool VariableTable::contains(const std::string& name) const {
    return variables.find(name) != variables.end();
}

std::string VariableTable::resolve(const Caller& caller, const std::string& rawText) const {
    std::string current = rawText;
    for (std::size_t pass = 0; pass < kMaxPasses; ++pass) {
        std::string next = substitute(caller, current);
        if (next == current) {
            break;
        }
        current = std::move(next);
    }
    return current;
}

std::string VariableTable::substitute(const Caller& caller, const std::string& text) const {
    std::string result;
    result.reserve(text.size());

    std::size_t index = 0;
    while (index < text.size()) {
        if (text[index] != '%') {
            result.push_back(text[index++]);
            continue;
        }

        const auto closing = text.find('%', index + 1);
        if (closing == std::string::npos) {
            result.append(text, index, std::string::npos);
            break;
        }

        const std::string name = text.substr(index + 1, closing - index - 1);
        if (name == kCallerVariable) {
            result += caller.name();
            index = closing + 1;
        } else if (auto it = variables.find(name); it != variables.end()) {
            result += it->second;
            index = closing + 1;
        } else {
            // Неизвестная ссылка: закрывающий '%' может открывать следующую
            result.push_back('%');
            ++index;
        }
    }
    return result;
}

} // namespace condeval
