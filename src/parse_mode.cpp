#include "parse_mode.hpp"
#include "console.hpp"
#include "expression_parser.hpp"
#include "parse_error.hpp"
#include "simplifier.hpp"
#include "tokenizer.hpp"
#include "user_input.hpp"

#include <iostream>
#include <stdexcept>
#include <vector>

std::pair<std::string, texpr::Rational> parseVariableAssignment(const std::string& assignment) {
    std::size_t eq = assignment.find('=');
    if (eq == std::string::npos) {
        throw std::runtime_error("Ожидалось присваивание вида x=3: " + assignment);
    }
    std::string name = trim(assignment.substr(0, eq));
    std::string value = trim(assignment.substr(eq + 1));

    // Имя переменной проверяется тем же лексером, что и выражения
    std::vector<texpr::Token> tokens;
    try {
        tokens = texpr::Tokenizer(name).tokenize();
    }
    catch (const texpr::ParseError& ex) {
        throw std::runtime_error("Некорректное имя переменной '" + name + "': " + ex.what());
    }
    if (tokens.size() != 2 || tokens.front().type != texpr::TokenType::Variable) {
        throw std::runtime_error("Некорректное имя переменной '" + name + "'");
    }

    bool negative = !value.empty() && value.front() == '-';
    texpr::Rational number;
    try {
        number = texpr::parseDecimal(negative ? value.substr(1) : value);
    }
    catch (const std::invalid_argument&) {
        throw std::runtime_error("Некорректное значение переменной " + name + ": " + value);
    }
    if (negative) {
        number = -number;
    }
    return {tokens.front().text, number};
}

int runParseMode(const std::optional<std::string>& expression, texpr::ParserOptions options,
                 const texpr::VariableMap& variables) {
    std::string input;
    if (expression) {
        input = *expression;
    } else {
        std::cout << Color::BOLD << "Введите выражение: " << Color::RESET;
        if (!std::getline(std::cin, input)) {
            throw std::runtime_error("Ввод закрыт");
        }
        // Перевод строки и '\r' не являются пробелами выражения: отрезаем их
        while (!input.empty() && (input.back() == '\r' || input.back() == '\n')) {
            input.pop_back();
        }
    }

    texpr::ExpressionParser parser(options);
    texpr::AstNodePtr tree;
    try {
        tree = parser.parse(input);
    }
    catch (const texpr::ParseError& ex) {
        printParseError(input, ex);
        return 1;
    }

    std::cout << Color::BOLD << "Дерево:    " << Color::RESET << Color::CYAN
        << tree->describe() << Color::RESET << "\n";
    std::cout << Color::BOLD << "LaTeX:     " << Color::RESET << Color::GREEN
        << tree->toLatex() << Color::RESET << "\n";
    std::cout << Color::BOLD << "Упрощение: " << Color::RESET << Color::GREEN
        << texpr::simplified(*tree)->toLatex() << Color::RESET << "\n";

    try {
        texpr::Rational value = texpr::evaluate(*tree, variables);
        std::cout << Color::BOLD << "Значение:  " << Color::RESET << Color::MAGENTA
            << texpr::formatRational(value) << Color::RESET << "\n";
    }
    catch (const texpr::EvaluationError& ex) {
        std::cout << Color::BOLD << "Значение:  " << Color::RESET << Color::YELLOW
            << "не определено (" << ex.what() << ")" << Color::RESET << "\n";
    }
    return 0;
}
