#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace condeval {

// Ошибка разбора выражения условия.
// Хранит текст токена, на котором разбор остановился, и его позицию.
class ParseError : public std::runtime_error {
public:
    ParseError(const std::string& message, std::string tokenText, std::size_t position)
        : std::runtime_error(message), tokenText(std::move(tokenText)), tokenPosition(position) {}

    const std::string& token() const noexcept { return tokenText; }
    std::size_t position() const noexcept { return tokenPosition; }

private:
    std::string tokenText;
    std::size_t tokenPosition;
};

} // namespace condeval
