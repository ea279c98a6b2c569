#pragma once

#include <optional>
#include <string>
#include <utility>

#include "evaluator.hpp"
#include "parser.hpp"

// Разбор присваивания вида "x=3", "x_1=-2.5" из аргумента --let.
// Выбрасывает std::runtime_error для некорректной записи.
std::pair<std::string, texpr::Rational> parseVariableAssignment(const std::string& assignment);

// Режим разбора одного выражения.
// Без аргумента выражение читается из стандартного ввода.
// Печатает дерево, каноническую и упрощённую записи и точное значение,
// если оно определено при заданных переменных.
// Возвращает код завершения: 0 при успешном разборе, 1 при ошибке.
int runParseMode(const std::optional<std::string>& expression,
                 texpr::ParserOptions options = {},
                 const texpr::VariableMap& variables = {});
