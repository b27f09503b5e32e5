#pragma once

#include <cstddef>
#include <string>

#include "ast.hpp"
#include "token.hpp"
#include "tokenizer.hpp"

namespace condeval {

// Класс синтаксического анализатора (парсера)
// Строит AST выражения условия методом рекурсивного спуска.
// Позиция чтения принадлежит лексеру, парсер лишь продвигает её.
//
// Грамматика (от низкого приоритета к высокому):
//   expr       := or
//   or         := and ("||" and)*
//   and        := primary ("&&" primary)*
//   primary    := "(" expr ")" | comparison
//   comparison := LITERAL OPERATOR LITERAL
class Parser {
public:
    // Ограничения глубины AST: рекурсивный разбор и вычисление не должны переполнить стек
    static constexpr std::size_t kMaxNesting = 256;
    static constexpr std::size_t kMaxComparisons = 4096;

    explicit Parser(Tokenizer& tokenizer);

    // Разбирает выражение целиком и проверяет, что за ним ничего не осталось
    // Выбрасывает ParseError при синтаксических ошибках
    NodePtr parse();

    // Разбирает одно выражение, не проверяя конец входа
    NodePtr parseExpression();

private:
    Tokenizer& tokenizer;
    std::size_t nesting = 0;      // Текущая глубина скобок
    std::size_t comparisons = 0;  // Разобрано сравнений

    // Ожидает токен заданного типа, возвращает его и продвигает лексер.
    // Иначе выбрасывает ParseError с текстом what и описанием текущего токена
    Token expect(TokenType type, const std::string& what);

    NodePtr parseOr();
    NodePtr parseAnd();
    NodePtr parsePrimary();
    NodePtr parseComparison();
};

} // namespace condeval
