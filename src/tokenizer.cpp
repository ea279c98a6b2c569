#include "tokenizer.hpp"

#include <cctype>

#include "parse_error.hpp"

namespace texpr {

namespace {
bool isDigit(char ch) {
    return std::isdigit(static_cast<unsigned char>(ch)) != 0;
}

bool isLetter(char ch) {
    return std::isalpha(static_cast<unsigned char>(ch)) != 0;
}

bool isAlnum(char ch) {
    return std::isalnum(static_cast<unsigned char>(ch)) != 0;
}
}

Tokenizer::Tokenizer(std::string sourceText) : source(std::move(sourceText)) {}

// Основной цикл разбора: проходит по строке и выделяет лексемы
std::vector<Token> Tokenizer::tokenize() {
    std::vector<Token> tokens;
    while (!isAtEnd()) {
        skipWhitespace();
        if (isAtEnd()) {
            break;
        }

        char ch = peek();
        switch (ch) {
        // Односимвольные лексемы
        case '+':
            tokens.push_back({TokenType::Plus, "+", index, std::nullopt});
            advance();
            break;
        case '-':
            tokens.push_back({TokenType::Minus, "-", index, std::nullopt});
            advance();
            break;
        case '*':
            tokens.push_back({TokenType::Star, "*", index, std::nullopt});
            advance();
            break;
        case '/':
            tokens.push_back({TokenType::Slash, "/", index, std::nullopt});
            advance();
            break;
        case '^':
            tokens.push_back({TokenType::Caret, "^", index, std::nullopt});
            advance();
            break;
        case '!':
            tokens.push_back({TokenType::Bang, "!", index, std::nullopt});
            advance();
            break;
        case '(':
            tokens.push_back({TokenType::LParen, "(", index, std::nullopt});
            advance();
            break;
        case ')':
            tokens.push_back({TokenType::RParen, ")", index, std::nullopt});
            advance();
            break;
        case '\\':
            tokens.push_back(makeCommand());
            break;
        default:
            // Многосимвольные лексемы (числа и переменные)
            if (isDigit(ch)) {
                tokens.push_back(makeNumber());
            } else if (isLetter(ch)) {
                tokens.push_back(makeVariable());
            } else {
                throw ParseError(ParseErrorKind::UnexpectedToken, index,
                                 std::string("Недопустимый символ '") + ch + "'");
            }
            break;
        }
    }

    tokens.push_back({TokenType::End, "", index, std::nullopt});
    return tokens;
}

bool Tokenizer::isAtEnd() const {
    return index >= source.size();
}

char Tokenizer::peek() const {
    return isAtEnd() ? '\0' : source[index];
}

char Tokenizer::advance() {
    return source[index++];
}

// Табуляция и переводы строк пробелами не считаются
void Tokenizer::skipWhitespace() {
    while (!isAtEnd() && peek() == ' ') {
        advance();
    }
}

// Разбор числового литерала
// Точка входит в число, только если за ней следует цифра: "2." это число 2 и лишняя точка
Token Tokenizer::makeNumber() {
    std::size_t start = index;
    while (isDigit(peek())) {
        advance();
    }
    if (peek() == '.' && index + 1 < source.size() && isDigit(source[index + 1])) {
        advance();
        while (isDigit(peek())) {
            advance();
        }
    }
    return {TokenType::Number, source.substr(start, index - start), start, std::nullopt};
}

// Разбор переменной: одна буква и необязательный индекс из одного символа
Token Tokenizer::makeVariable() {
    std::size_t start = index;
    Token token{TokenType::Variable, std::string(1, advance()), start, std::nullopt};

    if (peek() != '_') {
        return token;
    }
    advance();

    if (!isAlnum(peek())) {
        throw ParseError(ParseErrorKind::UnexpectedToken, index,
                         "После '_' ожидался индекс из одной буквы или цифры");
    }
    token.subscript = advance();

    // Индекс состоит ровно из одного символа: x_12 и v_ab недопустимы
    if (isAlnum(peek())) {
        throw ParseError(ParseErrorKind::UnexpectedToken, index,
                         "Индекс переменной должен состоять из одного символа");
    }
    token.text = source.substr(start, index - start);
    return token;
}

// Разбор команды LaTeX: '\' и следующее за ним имя из букв
Token Tokenizer::makeCommand() {
    std::size_t start = index;
    advance();
    while (isLetter(peek())) {
        advance();
    }

    std::string command = source.substr(start, index - start);
    if (command == "\\cdot") {
        return {TokenType::Cdot, command, start, std::nullopt};
    }
    throw ParseError(ParseErrorKind::UnexpectedToken, start,
                     "Неподдерживаемая команда '" + command + "'");
}

} // namespace texpr
