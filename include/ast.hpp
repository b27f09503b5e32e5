#pragma once

#include <memory>
#include <string>
#include <variant>

#include "comparator.hpp"
#include "placeholder_resolver.hpp"

namespace condeval {

struct Node;
using NodePtr = std::unique_ptr<Node>;

// Логическое ИЛИ: правая ветвь не вычисляется, если левая истинна
struct OrNode {
    NodePtr left;
    NodePtr right;
};

// Логическое И: правая ветвь не вычисляется, если левая ложна
struct AndNode {
    NodePtr left;
    NodePtr right;
};

// Сравнение двух операндов.
// Операнды хранятся без подстановки: плейсхолдеры раскрываются при каждом вычислении,
// поэтому одно дерево можно вычислять для разных вызывающих сторон.
struct ComparisonNode {
    std::string left;
    Comparator comparator;
    std::string right;
};

// Узел абстрактного синтаксического дерева (AST).
// Набор видов узлов закрыт, обход выполняется через std::visit.
struct Node {
    std::variant<OrNode, AndNode, ComparisonNode> value;
};

NodePtr makeOr(NodePtr left, NodePtr right);
NodePtr makeAnd(NodePtr left, NodePtr right);
NodePtr makeComparison(std::string left, Comparator comparator, std::string right);

// Рекурсивно вычисляет значение дерева для вызывающей стороны
bool evaluate(const Node& node, const Caller& caller, const PlaceholderResolver& resolver);

// Текстовое представление дерева со всеми скобками, например ((a == 1) || (b == 2))
std::string describe(const Node& node);

} // namespace condeval
