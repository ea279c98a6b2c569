#pragma once

#include <iostream>
#include <string>

#include "parse_error.hpp"

// ANSI цветовые коды для форматирования вывода в терминал
namespace Color {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* BOLD = "\033[1m";
    constexpr const char* RED = "\033[31m";
    constexpr const char* GREEN = "\033[32m";
    constexpr const char* YELLOW = "\033[33m";
    constexpr const char* MAGENTA = "\033[35m";
    constexpr const char* CYAN = "\033[36m";
}

// Вывод приветственного заголовка программы
void printHeader();

// Вывод ошибки в std::cerr в едином формате "✗ Ошибка: ..."
void printError(const std::string& message);

// Вывод ошибки разбора: выражение, указатель '^' под позицией ошибки и вид ошибки
void printParseError(const std::string& expression, const texpr::ParseError& error);
