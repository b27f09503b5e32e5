#pragma once

#include <array>
#include <cstddef>
#include <string_view>

namespace condeval {

// Операторы сравнения языка условий
enum class Comparator {
    Greater,        // >
    GreaterEqual,   // >=
    Less,           // <
    LessEqual,      // <=
    Equal,          // ==
    NotEqual,       // !=
    Contains,       // >>  левая строка содержит правую
    NotContains,    // !>>
    ContainedIn,    // <<  левая строка содержится в правой
    NotContainedIn  // !<<
};

// Символы операторов в порядке сопоставления лексером.
// Длинные операторы стоят раньше своих префиксов.
// Одиночный '=' распознаётся лексером, но оператором не является.
inline constexpr std::array<std::string_view, 11> kOperatorSymbols = {
    "!>>", "!<<", ">=", "<=", "==", "!=", ">>", "<<", ">", "<", "="
};

// Преобразует символ в оператор.
// Выбрасывает ParseError для неизвестного символа.
Comparator comparatorFromSymbol(std::string_view symbol, std::size_t position = 0);

// Текстовый символ оператора
std::string_view symbolOf(Comparator comparator);

// Истина для >, >=, <, <=
bool isNumericComparator(Comparator comparator);

} // namespace condeval
