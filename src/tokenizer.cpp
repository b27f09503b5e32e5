#include "tokenizer.hpp"

#include "comparator.hpp"
#include "parse_error.hpp"

#include <cctype>
#include <utility>

namespace condeval {

namespace {

bool isQuote(char ch) {
    return ch == '\'' || ch == '"';
}

} // namespace

const char* tokenTypeName(TokenType type) {
    switch (type) {
    case TokenType::LParen:
        return "открывающая скобка";
    case TokenType::RParen:
        return "закрывающая скобка";
    case TokenType::And:
        return "&&";
    case TokenType::Or:
        return "||";
    case TokenType::Operator:
        return "оператор";
    case TokenType::Literal:
        return "операнд";
    case TokenType::End:
        return "конец выражения";
    }
    return "неизвестный токен";
}

Tokenizer::Tokenizer(std::string sourceText) : source(std::move(sourceText)) {
    advance();
}

// Чтение следующего токена
void Tokenizer::advance() {
    skipWhitespace();
    if (isAtEnd()) {
        token = {TokenType::End, "", index};
        return;
    }

    const std::size_t start = index;
    const char ch = peek();

    // Скобки
    if (ch == '(') {
        ++index;
        token = {TokenType::LParen, "(", start};
        return;
    }
    if (ch == ')') {
        ++index;
        token = {TokenType::RParen, ")", start};
        return;
    }

    // Логические связки проверяются раньше операторов сравнения
    if (matches("&&")) {
        index += 2;
        token = {TokenType::And, "&&", start};
        return;
    }
    if (matches("||")) {
        index += 2;
        token = {TokenType::Or, "||", start};
        return;
    }

    // Операторы сравнения: порядок kOperatorSymbols гарантирует самое длинное совпадение
    for (std::string_view symbol : kOperatorSymbols) {
        if (matches(symbol)) {
            index += symbol.size();
            token = {TokenType::Operator, std::string(symbol), start};
            return;
        }
    }

    token = makeLiteral();
}

bool Tokenizer::isAtEnd() const {
    return index >= source.size();
}

char Tokenizer::peek() const {
    return source[index];
}

bool Tokenizer::matches(std::string_view pattern) const {
    return source.compare(index, pattern.size(), pattern) == 0;
}

bool Tokenizer::startsOperator() const {
    if (matches("&&") || matches("||")) {
        return true;
    }
    for (std::string_view symbol : kOperatorSymbols) {
        if (matches(symbol)) {
            return true;
        }
    }
    return false;
}

void Tokenizer::skipWhitespace() {
    while (!isAtEnd() && std::isspace(static_cast<unsigned char>(peek()))) {
        ++index;
    }
}

Token Tokenizer::makeLiteral() {
    const std::size_t start = index;
    while (!isAtEnd()) {
        const char ch = peek();

        if (isQuote(ch)) {
            // Закрывающая кавычка завершает литерал
            const std::size_t quoteStart = index;
            ++index;
            while (true) {
                if (isAtEnd()) {
                    throw ParseError("Незакрытая кавычка на позиции " + std::to_string(quoteStart),
                                     source.substr(start), quoteStart);
                }
                const char inner = peek();
                if (inner == '\\') {
                    // Экранированный символ пропускается вместе с '\'
                    index += 2;
                    continue;
                }
                ++index;
                if (inner == ch) {
                    break;
                }
            }
            break;
        }

        if (std::isspace(static_cast<unsigned char>(ch)) || ch == '(' || ch == ')' || startsOperator()) {
            break;
        }
        ++index;
    }
    return {TokenType::Literal, source.substr(start, index - start), start};
}

std::string literalValue(std::string_view literal) {
    if (literal.size() < 2 || !isQuote(literal.front()) || literal.back() != literal.front()) {
        return std::string(literal);
    }

    std::string value;
    value.reserve(literal.size() - 2);
    const std::string_view inner = literal.substr(1, literal.size() - 2);
    for (std::size_t i = 0; i < inner.size(); ++i) {
        if (inner[i] == '\\' && i + 1 < inner.size()) {
            ++i;
        }
        value.push_back(inner[i]);
    }
    return value;
}

} // namespace condeval
