#pragma once

#include <optional>

#include "token.hpp"

namespace texpr {

// Семантические виды операторов.
// Умножение имеет три записи (\cdot, *, запись подряд), но один вид.
enum class OperatorKind {
    Negate,    // -a
    Factorial, // a!
    Add,       // a + b
    Subtract,  // a - b
    Multiply,  // a * b, a \cdot b, ab
    Divide,    // a / b
    Power      // a ^ b
};

// Положение оператора относительно операнда (операндов)
enum class Fixity {
    Prefix,
    Infix,
    Postfix
};

enum class Associativity {
    Left,
    Right
};

// Уровни приоритета, от слабого к сильному
namespace precedence {
constexpr int kAdditive = 1;
constexpr int kMultiplicative = 2;
constexpr int kNegate = 3;
constexpr int kPower = 4;
constexpr int kFactorial = 5;
constexpr int kAtom = 6;
}

// Фиксированные свойства вида оператора
struct OperatorInfo {
    OperatorKind kind;
    Fixity fixity;
    int arity;
    int precedence;
    Associativity associativity;
    const char* name;   // "Add", "Power", ...
    const char* latex;  // Каноническая запись в LaTeX
};

// Таблица приоритетов: свойства для каждого вида оператора
const OperatorInfo& operatorInfo(OperatorKind kind);

// Определяет оператор по лексеме с учётом позиции, которую указывает парсер.
// '-' в префиксной позиции это Negate, в инфиксной Subtract.
// Возвращает std::nullopt, если лексема не является оператором в этой позиции.
std::optional<OperatorKind> classifyOperator(TokenType type, Fixity fixity);

} // namespace texpr
