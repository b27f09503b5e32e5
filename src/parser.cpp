#include "parser.hpp"

#include "comparator.hpp"
#include "parse_error.hpp"

#include <utility>

namespace condeval {

namespace {

// Описание токена для сообщений: текст и тип, либо конец выражения
std::string describeToken(const Token& token) {
    if (token.type == TokenType::End) {
        return tokenTypeName(token.type);
    }
    return "'" + token.text + "' (" + tokenTypeName(token.type) + ")";
}

[[noreturn]] void fail(const std::string& what, const Token& token) {
    throw ParseError(what + ": " + describeToken(token) + " на позиции " + std::to_string(token.position),
                     token.text, token.position);
}

} // namespace

Parser::Parser(Tokenizer& tokenizer) : tokenizer(tokenizer) {}

NodePtr Parser::parse() {
    auto node = parseExpression();
    if (tokenizer.current().type != TokenType::End) {
        fail("Лишнее содержимое после выражения", tokenizer.current());
    }
    return node;
}

NodePtr Parser::parseExpression() {
    return parseOr();
}

Token Parser::expect(TokenType type, const std::string& what) {
    Token token = tokenizer.current();
    if (token.type != type) {
        fail(what, token);
    }
    tokenizer.advance();
    return token;
}

// Грамматика: or -> and { "||" and }
NodePtr Parser::parseOr() {
    auto node = parseAnd();
    while (tokenizer.current().type == TokenType::Or) {
        tokenizer.advance();
        node = makeOr(std::move(node), parseAnd());
    }
    return node;
}

// Грамматика: and -> primary { "&&" primary }
NodePtr Parser::parseAnd() {
    auto node = parsePrimary();
    while (tokenizer.current().type == TokenType::And) {
        tokenizer.advance();
        node = makeAnd(std::move(node), parsePrimary());
    }
    return node;
}

// Грамматика: primary -> "(" expr ")" | comparison
NodePtr Parser::parsePrimary() {
    if (tokenizer.current().type == TokenType::LParen) {
        if (++nesting > kMaxNesting) {
            fail("Слишком глубокая вложенность скобок", tokenizer.current());
        }
        tokenizer.advance();
        auto node = parseExpression();
        expect(TokenType::RParen, "Ожидалась закрывающая скобка");
        --nesting;
        return node;
    }
    return parseComparison();
}

// Грамматика: comparison -> LITERAL OPERATOR LITERAL
NodePtr Parser::parseComparison() {
    if (++comparisons > kMaxComparisons) {
        fail("Слишком много сравнений в выражении", tokenizer.current());
    }
    Token left = expect(TokenType::Literal, "Ожидался левый операнд");
    Token op = expect(TokenType::Operator, "Ожидался оператор сравнения");
    // Оператор проверяется сразу, чтобы '=' не дожил до вычисления
    Comparator comparator = comparatorFromSymbol(op.text, op.position);
    Token right = expect(TokenType::Literal, "Ожидался правый операнд");
    return makeComparison(literalValue(left.text), comparator, literalValue(right.text));
}

} // namespace condeval
