#pragma once

#include <cstddef>
#include <string>

namespace condeval {

// Типы токенов языка условий
enum class TokenType {
    LParen,   // (
    RParen,   // )
    And,      // &&
    Or,       // ||
    Operator, // оператор сравнения
    Literal,  // операнд (в том числе в кавычках)
    End       // конец выражения
};

// Токен: тип, исходный текст и позиция начала во входной строке
struct Token {
    TokenType type;
    std::string text;
    std::size_t position;
};

// Человекочитаемое имя типа токена для сообщений об ошибках
const char* tokenTypeName(TokenType type);

} // namespace condeval
