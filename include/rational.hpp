#pragma once

#include <string>

#include <gmpxx.h>

#include "ast.hpp"

namespace texpr {

// Точное рациональное число произвольной длины
using Rational = mpq_class;

// Значение десятичной записи литерала: "2.50" -> 5/2.
// Выбрасывает std::invalid_argument, если запись не вида \d+(\.\d+)?
Rational parseDecimal(const std::string& text);

// Запись числа для отчётов: "5", "-7/2"
std::string formatRational(const Rational& value);

// Дерево, обозначающее число:
// целое или конечная десятичная дробь -> литерал ("2.5"),
// иначе -> Divide(числитель, знаменатель), отрицательное -> Negate(...)
AstNodePtr rationalToNode(const Rational& value);

} // namespace texpr
