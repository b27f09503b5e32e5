#include "comparator.hpp"

#include "parse_error.hpp"

#include <string>

namespace condeval {

namespace {

struct ComparatorEntry {
    Comparator comparator;
    std::string_view symbol;
};

constexpr std::array<ComparatorEntry, 10> kComparators = {{
    {Comparator::Greater, ">"},
    {Comparator::GreaterEqual, ">="},
    {Comparator::Less, "<"},
    {Comparator::LessEqual, "<="},
    {Comparator::Equal, "=="},
    {Comparator::NotEqual, "!="},
    {Comparator::Contains, ">>"},
    {Comparator::NotContains, "!>>"},
    {Comparator::ContainedIn, "<<"},
    {Comparator::NotContainedIn, "!<<"},
}};

} // namespace

Comparator comparatorFromSymbol(std::string_view symbol, std::size_t position) {
    for (const auto& entry : kComparators) {
        if (entry.symbol == symbol) {
            return entry.comparator;
        }
    }
    throw ParseError("Неизвестный оператор сравнения '" + std::string(symbol) +
                         "' на позиции " + std::to_string(position),
                     std::string(symbol), position);
}

std::string_view symbolOf(Comparator comparator) {
    for (const auto& entry : kComparators) {
        if (entry.comparator == comparator) {
            return entry.symbol;
        }
    }
    return "?";
}

bool isNumericComparator(Comparator comparator) {
    switch (comparator) {
    case Comparator::Greater:
    case Comparator::GreaterEqual:
    case Comparator::Less:
    case Comparator::LessEqual:
        return true;
    default:
        return false;
    }
}

} // namespace condeval
