#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <unordered_map>

#include "placeholder_resolver.hpp"

namespace condeval {

// Резолвер на основе таблицы переменных.
// Заменяет ссылки вида %name% значениями из таблицы, %caller% — именем вызывающей стороны.
// Подстановка повторяется, пока текст меняется (вложенные ссылки), но не более kMaxPasses раз.
// Неизвестные ссылки остаются как есть.
class VariableTable final : public PlaceholderResolver {
public:
    static constexpr std::size_t kMaxPasses = 10;

    VariableTable() = default;

    // Загрузка из файла формата name=value, строки с '#' и пустые строки пропускаются
    // Выбрасывает std::runtime_error, если файл не открывается или строка без '='
    static VariableTable loadFromFile(const std::filesystem::path& path);

    void set(const std::string& name, std::string value);
    bool contains(const std::string& name) const;
    std::size_t size() const { return variables.size(); }

    std::string resolve(const Caller& caller, const std::string& rawText) const override;

private:
    std::unordered_map<std::string, std::string> variables;

    // Один проход подстановки
    std::string substitute(const Caller& caller, const std::string& text) const;
};

} // namespace condeval
