#pragma once

#include <map>
#include <stdexcept>
#include <string>

#include "ast.hpp"
#include "operators.hpp"
#include "rational.hpp"

namespace texpr {

// Значения переменных по имени в записи LaTeX: "x", "x_1"
using VariableMap = std::map<std::string, Rational>;

// Показатель степени и аргумент факториала ограничены, чтобы точный результат
// оставался обозримым
constexpr unsigned long kMaxExponent = 4096;
constexpr unsigned long kMaxFactorialArgument = 1000;
// Предел длины в битах числителя и знаменателя результата возведения в степень
constexpr unsigned long kMaxPowerBits = 1UL << 16;

// Ошибка вычисления: деление на ноль, незаданная переменная, операция вне
// области определения (дробный показатель, факториал отрицательного числа)
class EvaluationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Применение унарной операции (Negate, Factorial) к точному значению
Rational applyUnary(OperatorKind op, const Rational& operand);

// Применение бинарной операции (Add, Subtract, Multiply, Divide, Power)
Rational applyBinary(OperatorKind op, const Rational& left, const Rational& right);

// Точное значение дерева при заданных переменных.
// Выбрасывает EvaluationError.
Rational evaluate(const AstNode& node, const VariableMap& variables = {});

} // namespace texpr
