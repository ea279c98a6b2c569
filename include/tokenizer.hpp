#pragma once

#include <string>
#include <vector>

#include "token.hpp"

namespace texpr {

// Класс лексического анализатора (лексера)
// Преобразует строку с выражением LaTeX в последовательность лексем.
// Незначащим считается только пробел ASCII.
class Tokenizer {
public:
    // Конструктор принимает исходную строку выражения
    explicit Tokenizer(std::string sourceText);

    // Основной метод запуска токенизации
    // Возвращает вектор лексем, заканчивающийся лексемой End
    // Выбрасывает ParseError (UnexpectedToken) при недопустимых символах
    std::vector<Token> tokenize();

private:
    const std::string source; // Исходная строка
    std::size_t index = 0;    // Текущая позиция чтения

    // Проверка достижения конца строки
    bool isAtEnd() const;

    // Возвращает текущий символ без продвижения вперед ('\0' в конце строки)
    char peek() const;

    // Возвращает текущий символ и сдвигает указатель вперед
    char advance();

    // Пропускает пробелы
    void skipWhitespace();

    // Считывает число: цифры, затем необязательно '.' и цифры
    Token makeNumber();

    // Считывает переменную: буква и необязательный индекс _k
    Token makeVariable();

    // Считывает команду после '\' (поддерживается только \cdot)
    Token makeCommand();
};

} // namespace texpr
