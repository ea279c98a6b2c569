#include "console.hpp"

// Вывод приветственного заголовка программы
void printHeader() {
    std::cout << Color::BOLD << Color::CYAN;
    std::cout << "\n╔═══════════════════════════════════════════════════════════╗\n";
    std::cout << "║    Парсер арифметических выражений LaTeX v1.0             ║\n";
    std::cout << "╚═══════════════════════════════════════════════════════════╝\n";
    std::cout << Color::RESET << "\n";
}

void printError(const std::string& message) {
    std::cerr << Color::RED << Color::BOLD << "✗ Ошибка: "
        << Color::RESET << Color::RED << message << Color::RESET << "\n\n";
}

void printParseError(const std::string& expression, const texpr::ParseError& error) {
    std::cerr << Color::RED << Color::BOLD << "✗ " << texpr::toString(error.kind())
        << Color::RESET << Color::RED << ": " << error.what() << Color::RESET << "\n";
    std::cerr << "  " << expression << "\n";
    std::cerr << "  " << std::string(error.position(), ' ')
        << Color::YELLOW << "^" << Color::RESET << "\n\n";
}
