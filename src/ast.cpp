#include "ast.hpp"

#include "comparison.hpp"

#include <utility>

namespace condeval {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace

NodePtr makeOr(NodePtr left, NodePtr right) {
    return std::make_unique<Node>(Node{OrNode{std::move(left), std::move(right)}});
}

NodePtr makeAnd(NodePtr left, NodePtr right) {
    return std::make_unique<Node>(Node{AndNode{std::move(left), std::move(right)}});
}

NodePtr makeComparison(std::string left, Comparator comparator, std::string right) {
    return std::make_unique<Node>(Node{ComparisonNode{std::move(left), comparator, std::move(right)}});
}

bool evaluate(const Node& node, const Caller& caller, const PlaceholderResolver& resolver) {
    return std::visit(
        Overloaded{
            [&](const OrNode& orNode) {
                return evaluate(*orNode.left, caller, resolver) ||
                       evaluate(*orNode.right, caller, resolver);
            },
            [&](const AndNode& andNode) {
                return evaluate(*andNode.left, caller, resolver) &&
                       evaluate(*andNode.right, caller, resolver);
            },
            [&](const ComparisonNode& comparison) {
                // Подстановка выполняется заново при каждом вычислении
                std::string left = resolver.resolve(caller, comparison.left);
                std::string right = resolver.resolve(caller, comparison.right);
                return compareValues(left, right, comparison.comparator);
            },
        },
        node.value);
}

std::string describe(const Node& node) {
    return std::visit(
        Overloaded{
            [](const OrNode& orNode) {
                return "(" + describe(*orNode.left) + " || " + describe(*orNode.right) + ")";
            },
            [](const AndNode& andNode) {
                return "(" + describe(*andNode.left) + " && " + describe(*andNode.right) + ")";
            },
            [](const ComparisonNode& comparison) {
                return "(" + comparison.left + " " + std::string(symbolOf(comparison.comparator)) + " " +
                       comparison.right + ")";
            },
        },
        node.value);
}

} // namespace condeval
