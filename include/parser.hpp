#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include "ast.hpp"
#include "token.hpp"

namespace texpr {

// Верхняя граница настройки maxNestingDepth: стек рабочего потока
// должен выдерживать рекурсию такой глубины
constexpr std::size_t kMaxNestingDepthLimit = 2048;

// Настройки синтаксического анализатора
struct ParserOptions {
    // Максимальная глубина вложенности (скобки, цепочки ^, унарные минусы).
    // Защищает стек вызовов от переполнения на враждебном входе.
    std::size_t maxNestingDepth = 256;
};

// Выбрасывает std::invalid_argument, если maxNestingDepth равна 0
// или больше kMaxNestingDepthLimit
void validateOptions(const ParserOptions& options);

// Класс синтаксического анализатора (парсера)
// Строит AST из списка лексем методом восхождения по приоритетам.
class Parser {
public:
    // Конструктор принимает список лексем от лексера.
    // Недопустимые настройки отклоняются через validateOptions.
    explicit Parser(std::vector<Token> tokens, ParserOptions options = {});

    // Основной метод запуска парсинга
    // Возвращает указатель на корневой узел AST, покрывающий весь вход
    // Выбрасывает ParseError при синтаксических ошибках
    AstNodePtr parse();

private:
    const std::vector<Token> tokens; // Список лексем
    const ParserOptions options;
    std::size_t current = 0;         // Индекс текущей лексемы
    std::size_t depth = 0;           // Текущая глубина вложенности
    std::vector<bool> unmatchedOpen; // Для каждой лексемы: '(' без пары

    // Учитывает вход в очередной уровень вложенности
    class NestingGuard {
    public:
        explicit NestingGuard(Parser& parser);
        ~NestingGuard();

        NestingGuard(const NestingGuard&) = delete;
        NestingGuard& operator=(const NestingGuard&) = delete;

    private:
        Parser& parser;
    };

    // Возвращает текущую лексему без продвижения
    const Token& peek() const;

    // Возвращает последнюю поглощённую лексему
    const Token& previous() const;

    // Проверяет тип текущей лексемы без продвижения
    bool check(TokenType type) const;

    // Если текущая лексема нужного типа, сдвигает указатель и возвращает true
    bool match(TokenType type);

    // Проверка на конец списка лексем
    bool isAtEnd() const;

    // Отмечает открывающие скобки, для которых нет закрывающей
    void markUnmatchedParens();

    // --- Методы разбора (от низкого приоритета к высокому) ---

    // Восхождение по приоритетам: инфиксные операторы с приоритетом не ниже minPrecedence
    AstNodePtr parseExpression(int minPrecedence);

    // Префиксный минус
    AstNodePtr parseUnary();

    // Постфиксный факториал
    AstNodePtr parsePostfix();

    // Первичное выражение: число, переменная, скобки, умножение подряд
    AstNodePtr parsePrimary();

    // Операнд неявного умножения: переменная или скобки
    AstNodePtr parseJuxtaposed();

    // Выражение в скобках (открывающая скобка уже поглощена)
    AstNodePtr parseParenExpression();

    // Лист дерева из лексемы Number или Variable
    static AstNodePtr makeLeaf(const Token& token);
};

} // namespace texpr
