#pragma once

#include <string>
#include <string_view>

#include "token.hpp"

namespace condeval {

// Класс лексического анализатора (лексера)
// Выдаёт токены выражения условия по одному, по требованию парсера.
// Хранит только позицию чтения и текущий токен.
class Tokenizer {
public:
    // Конструктор принимает исходную строку и сразу читает первый токен
    // Выбрасывает ParseError, если первый токен некорректен
    explicit Tokenizer(std::string sourceText);

    // Текущий токен
    const Token& current() const { return token; }

    // Переход к следующему токену.
    // После конца строки всегда остаётся на токене End.
    // Выбрасывает ParseError при незакрытой кавычке
    void advance();

private:
    const std::string source; // Исходная строка
    std::size_t index = 0;    // Текущая позиция чтения
    Token token{TokenType::End, "", 0};

    bool isAtEnd() const;
    char peek() const;

    // Совпадает ли текст в текущей позиции с образцом
    bool matches(std::string_view pattern) const;

    // Начинается ли в текущей позиции связка или оператор сравнения
    bool startsOperator() const;

    void skipWhitespace();

    // Считывает операнд до пробела, скобки, связки или оператора.
    // Внутри кавычек эти символы не действуют, '\' экранирует следующий символ
    Token makeLiteral();
};

// Значение операнда: если литерал целиком заключён в парные кавычки,
// кавычки снимаются, а последовательности \x заменяются на x.
// Иначе текст возвращается как есть.
std::string literalValue(std::string_view literal);

} // namespace condeval
