// Генератор условий для тестирования.
// Строит случайные выражения из сравнений, связок && и || и скобок.
// С малой вероятностью вносит ошибки (незакрытые скобки, одиночный '=', лишний хвост).
//

#pragma once

#include <array>
#include <cstdio>
#include <random>
#include <string>
#include <string_view>

namespace condeval {

// Вероятность генерации ошибки (5%)
constexpr double kErrorProbability = 0.05;

class ConditionGenerator {
public:
    ConditionGenerator() : gen(std::random_device{}()) {}

    // Детерминированная последовательность для воспроизводимых наборов
    explicit ConditionGenerator(unsigned seed) : gen(seed) {}

    std::string generate(int depth) {
        return introduceError(generateNode(depth));
    }

private:
    std::mt19937 gen;

    // Переменные из tests/sample.vars и операторы для каждого вида операнда
    static constexpr std::array<std::string_view, 3> kNumericVariables = {"%level%", "%balance%", "%online%"};
    static constexpr std::array<std::string_view, 3> kTextVariables = {"%world%", "%rank%", "%caller%"};
    static constexpr std::array<std::string_view, 4> kNumericOperators = {">", ">=", "<", "<="};
    static constexpr std::array<std::string_view, 6> kTextOperators = {"==", "!=", ">>", "!>>", "<<", "!<<"};
    static constexpr std::array<std::string_view, 5> kWords = {"nether", "overworld", "vip", "'admin team'", "end"};

    template <std::size_t N>
    std::string_view pick(const std::array<std::string_view, N>& items) {
        std::uniform_int_distribution<std::size_t> dist(0, N - 1);
        return items[dist(gen)];
    }

    bool chance(double probability) {
        std::uniform_real_distribution<> dist(0.0, 1.0);
        return dist(gen) < probability;
    }

    std::string generateNumber() {
        std::uniform_real_distribution<> dist(0.0, 100.0);
        char buffer[32];
        std::snprintf(buffer, sizeof(buffer), "%.1f", dist(gen));
        return buffer;
    }

    std::string generateComparison() {
        std::string result;
        if (chance(0.5)) {
            result.append(pick(kNumericVariables)).append(" ").append(pick(kNumericOperators)).append(" ");
            result.append(generateNumber());
        } else {
            result.append(pick(kTextVariables)).append(" ").append(pick(kTextOperators)).append(" ");
            result.append(pick(kWords));
        }
        return result;
    }

    std::string generateNode(int depth) {
        // На нулевой глубине или с вероятностью 30% — одиночное сравнение
        if (depth <= 0 || chance(0.3)) {
            return generateComparison();
        }

        std::string left = generateNode(depth - 1);
        std::string right = generateNode(depth - 1);
        std::string result = "(" + left + (chance(0.5) ? " && " : " || ") + right + ")";
        return result;
    }

    // Вносит ошибки в выражение с малой вероятностью
    std::string introduceError(std::string expr) {
        if (!chance(kErrorProbability)) {
            return expr;
        }

        std::uniform_int_distribution<> errorType(0, 2);
        switch (errorType(gen)) {
        case 0: { // Незакрытая скобка
            auto pos = expr.rfind(')');
            if (pos != std::string::npos) {
                expr.erase(pos, 1);
            } else {
                expr.insert(0, "(");
            }
            return expr;
        }
        case 1: { // Одиночный '=' вместо оператора сравнения
            auto pos = expr.find("==");
            if (pos != std::string::npos) {
                expr.erase(pos, 1);
            } else {
                expr += " && %level% = 1";
            }
            return expr;
        }
        default: // Лишний хвост после выражения
            return expr + " )";
        }
    }
};

} // namespace condeval
