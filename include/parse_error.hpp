#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace texpr {

// Виды ошибок разбора
enum class ParseErrorKind {
    ExpectedAtom,             // После оператора или в начале группы нет операнда
    UnmatchedParen,           // Скобка без пары
    UnexpectedToken,          // Лишний или недопустимый фрагмент входа
    InvalidFactorialPosition, // '!' без операнда слева
    NestingTooDeep            // Превышена допустимая глубина вложенности
};

// Стабильный идентификатор вида ошибки ("ExpectedAtom" и т.д.)
const char* toString(ParseErrorKind kind);

// Исключение, выбрасываемое лексером и парсером.
// Хранит вид ошибки и смещение (в байтах) места, где она обнаружена.
class ParseError : public std::runtime_error {
public:
    ParseError(ParseErrorKind kind, std::size_t position, const std::string& message);

    ParseErrorKind kind() const noexcept { return errorKind; }
    std::size_t position() const noexcept { return errorPosition; }

private:
    ParseErrorKind errorKind;
    std::size_t errorPosition;
};

} // namespace texpr
