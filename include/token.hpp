#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace texpr {

// Типы лексем поддерживаемого подмножества LaTeX
enum class TokenType {
    Number,     // 12, 3.25
    Variable,   // x, x_1
    Plus,       // +
    Minus,      // - (унарный или бинарный, решает парсер)
    Star,       // *
    Cdot,       // \cdot
    Slash,      // /
    Caret,      // ^
    Bang,       // !
    LParen,     // (
    RParen,     // )
    End         // Конец входа
};

// Лексема: тип, исходный текст и смещение в байтах от начала строки
struct Token {
    TokenType type;
    std::string text;
    std::size_t position = 0;
    std::optional<char> subscript; // Индекс переменной (только для Variable)
};

// Человекочитаемое имя типа лексемы (для сообщений об ошибках)
const char* tokenTypeName(TokenType type);

} // namespace texpr
