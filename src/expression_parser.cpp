#include "expression_parser.hpp"

#include "tokenizer.hpp"

namespace texpr {

ExpressionParser::ExpressionParser(ParserOptions options) : options(options) {
    validateOptions(this->options);
}

// Полный цикл обработки выражения:
// 1. Токенизация (Tokenizer)
// 2. Парсинг (Parser) -> построение AST
AstNodePtr ExpressionParser::parse(const std::string& expression) const {
    // Этап 1: Лексический анализ
    Tokenizer tokenizer(expression);
    auto tokens = tokenizer.tokenize();

    // Этап 2: Синтаксический анализ
    Parser parser(std::move(tokens), options);
    return parser.parse();
}

} // namespace texpr
