#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "comparator.hpp"

namespace condeval {

// Сравнение двух уже подставленных значений.
// Числовые операторы на нечисловых значениях дают false, а не ошибку.
// Если одно из значений булево ("true"/"false"), сравнение логическое.
// В остальных случаях значения сравниваются как строки.
bool compareValues(const std::string& left, const std::string& right, Comparator comparator);

// Число с плавающей точкой из строки (пробелы по краям допускаются)
std::optional<double> parseNumber(std::string_view text);

// Булево значение из строки без учёта регистра, с обрезкой пробелов
std::optional<bool> parseBoolean(std::string_view text);

// Строковое сравнение по оператору, включая лексикографический порядок для >, >=, <, <=
bool compareStrings(const std::string& left, const std::string& right, Comparator comparator);

} // namespace condeval
