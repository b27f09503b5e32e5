#include "comparison.hpp"

#include <cctype>
#include <charconv>
#include <system_error>

namespace condeval {

namespace {

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

bool compareNumbers(double left, double right, Comparator comparator) {
    switch (comparator) {
    case Comparator::Greater:
        return left > right;
    case Comparator::GreaterEqual:
        return left >= right;
    case Comparator::Less:
        return left < right;
    case Comparator::LessEqual:
        return left <= right;
    default:
        return false;
    }
}

// Для булевых значений осмысленны только == и !=
bool compareBooleans(bool left, bool right, Comparator comparator) {
    switch (comparator) {
    case Comparator::Equal:
        return left == right;
    case Comparator::NotEqual:
        return left != right;
    default:
        return false;
    }
}

} // namespace

std::optional<double> parseNumber(std::string_view text) {
    text = trim(text);
    // from_chars не принимает ведущий '+'
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
    }
    if (text.empty()) {
        return std::nullopt;
    }

    double value = 0.0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last) {
        return std::nullopt;
    }
    return value;
}

std::optional<bool> parseBoolean(std::string_view text) {
    text = trim(text);
    auto equalsIgnoreCase = [text](std::string_view word) {
        if (text.size() != word.size()) {
            return false;
        }
        for (std::size_t i = 0; i < word.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(text[i])) != word[i]) {
                return false;
            }
        }
        return true;
    };

    if (equalsIgnoreCase("true")) {
        return true;
    }
    if (equalsIgnoreCase("false")) {
        return false;
    }
    return std::nullopt;
}

bool compareStrings(const std::string& left, const std::string& right, Comparator comparator) {
    switch (comparator) {
    case Comparator::Equal:
        return left == right;
    case Comparator::NotEqual:
        return left != right;
    case Comparator::Contains:
        return left.find(right) != std::string::npos;
    case Comparator::NotContains:
        return left.find(right) == std::string::npos;
    case Comparator::ContainedIn:
        return right.find(left) != std::string::npos;
    case Comparator::NotContainedIn:
        return right.find(left) == std::string::npos;
    case Comparator::Greater:
        return left.compare(right) > 0;
    case Comparator::GreaterEqual:
        return left.compare(right) >= 0;
    case Comparator::Less:
        return left.compare(right) < 0;
    case Comparator::LessEqual:
        return left.compare(right) <= 0;
    }
    return false;
}

// Порядок проверок: числовой оператор, затем булевы значения, затем строки
bool compareValues(const std::string& left, const std::string& right, Comparator comparator) {
    if (isNumericComparator(comparator)) {
        auto leftNumber = parseNumber(left);
        auto rightNumber = parseNumber(right);
        if (!leftNumber || !rightNumber) {
            return false;
        }
        return compareNumbers(*leftNumber, *rightNumber, comparator);
    }

    auto leftBoolean = parseBoolean(left);
    auto rightBoolean = parseBoolean(right);
    if (leftBoolean || rightBoolean) {
        return compareBooleans(leftBoolean.value_or(false), rightBoolean.value_or(false), comparator);
    }

    return compareStrings(left, right, comparator);
}

} // namespace condeval
