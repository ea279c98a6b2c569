#pragma once

#include <string>

#include "ast.hpp"
#include "parser.hpp"

namespace texpr {

// Класс-фасад для разбора выражений LaTeX.
// Объединяет этапы токенизации и парсинга. Не хранит изменяемого состояния,
// поэтому один экземпляр можно использовать из нескольких потоков.
class ExpressionParser {
public:
    // Выбрасывает std::invalid_argument для недопустимых настроек (см. validateOptions)
    explicit ExpressionParser(ParserOptions options = {});

    // Строит дерево выражения, заданного строкой.
    // Пример: "2x^2 - 1" -> Subtract(Power(Multiply(2, x), 2), 1)
    // Выбрасывает ParseError в случае синтаксической ошибки.
    AstNodePtr parse(const std::string& expression) const;

private:
    ParserOptions options;
};

} // namespace texpr
