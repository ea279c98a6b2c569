#include "parser.hpp"

#include "operators.hpp"
#include "parse_error.hpp"

#include <stdexcept>
#include <string>

namespace texpr {

namespace {
// Гарантирует наличие завершающей лексемы End
std::vector<Token> terminated(std::vector<Token> tokens) {
    if (tokens.empty() || tokens.back().type != TokenType::End) {
        std::size_t end = tokens.empty() ? 0 : tokens.back().position + tokens.back().text.size();
        tokens.push_back({TokenType::End, "", end, std::nullopt});
    }
    return tokens;
}
}

void validateOptions(const ParserOptions& options) {
    if (options.maxNestingDepth == 0 || options.maxNestingDepth > kMaxNestingDepthLimit) {
        throw std::invalid_argument("Глубина вложенности должна быть от 1 до " +
                                    std::to_string(kMaxNestingDepthLimit) + ", получено " +
                                    std::to_string(options.maxNestingDepth));
    }
}

Parser::Parser(std::vector<Token> tokens, ParserOptions options)
    : tokens(terminated(std::move(tokens))), options(options) {
    validateOptions(this->options);
}

Parser::NestingGuard::NestingGuard(Parser& parser) : parser(parser) {
    if (parser.depth >= parser.options.maxNestingDepth) {
        throw ParseError(ParseErrorKind::NestingTooDeep, parser.peek().position,
                         "Превышена глубина вложенности " +
                             std::to_string(parser.options.maxNestingDepth));
    }
    ++parser.depth;
}

Parser::NestingGuard::~NestingGuard() {
    --parser.depth;
}

// Запуск процесса парсинга
// Ожидает, что всё выражение будет полностью разобрано
AstNodePtr Parser::parse() {
    current = 0;
    depth = 0;
    markUnmatchedParens();

    auto exprNode = parseExpression(precedence::kAdditive);
    if (!isAtEnd()) {
        throw ParseError(ParseErrorKind::UnexpectedToken, peek().position,
                         std::string("Неожиданная лексема ") + tokenTypeName(peek().type) +
                             " после конца выражения");
    }
    return exprNode;
}

const Token& Parser::peek() const {
    return tokens[current];
}

const Token& Parser::previous() const {
    return tokens[current - 1];
}

bool Parser::check(TokenType type) const {
    return tokens[current].type == type;
}

bool Parser::match(TokenType type) {
    if (!isAtEnd() && check(type)) {
        ++current;
        return true;
    }
    return false;
}

bool Parser::isAtEnd() const {
    return peek().type == TokenType::End;
}

// Сопоставление скобок стеком. Лишние ')' здесь не отмечаются:
// они обнаруживаются при разборе как неожиданные лексемы
void Parser::markUnmatchedParens() {
    unmatchedOpen.assign(tokens.size(), false);
    std::vector<std::size_t> open;
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        if (tokens[i].type == TokenType::LParen) {
            open.push_back(i);
        } else if (tokens[i].type == TokenType::RParen && !open.empty()) {
            open.pop_back();
        }
    }
    for (std::size_t index : open) {
        unmatchedOpen[index] = true;
    }
}

// Грамматика: Expression -> Unary { InfixOp Expression }
// Правая часть разбирается с порогом p для правоассоциативного '^' и p+1 для остальных
AstNodePtr Parser::parseExpression(int minPrecedence) {
    NestingGuard guard(*this);

    auto node = parseUnary();
    while (true) {
        auto kind = classifyOperator(peek().type, Fixity::Infix);
        if (!kind) {
            break;
        }
        const auto& info = operatorInfo(*kind);
        if (info.precedence < minPrecedence) {
            break;
        }
        ++current;

        int nextPrecedence = info.associativity == Associativity::Right
            ? info.precedence
            : info.precedence + 1;
        auto right = parseExpression(nextPrecedence);
        node = std::make_unique<BinaryNode>(*kind, std::move(node), std::move(right));
    }
    return node;
}

// Грамматика: Unary -> "-" Expression(Negate) | Postfix
// Минус слабее '^' и '!', но сильнее умножения: -a^2 = -(a^2), -a*b = (-a)*b
AstNodePtr Parser::parseUnary() {
    auto kind = classifyOperator(peek().type, Fixity::Prefix);
    if (!kind) {
        return parsePostfix();
    }
    ++current;
    auto operand = parseExpression(operatorInfo(*kind).precedence);
    return std::make_unique<UnaryNode>(*kind, std::move(operand));
}

// Грамматика: Postfix -> Primary { "!" }
AstNodePtr Parser::parsePostfix() {
    auto node = parsePrimary();
    while (auto kind = classifyOperator(peek().type, Fixity::Postfix)) {
        ++current;
        node = std::make_unique<UnaryNode>(*kind, std::move(node));
    }
    return node;
}

// Грамматика: Primary -> (Number | Variable) { Variable | "(" Expression ")" }
//                      | "(" Expression ")"
// Цепочка умножения подряд поглощается жадно и сворачивается влево: 2xy = (2*x)*y
AstNodePtr Parser::parsePrimary() {
    if (match(TokenType::Number) || match(TokenType::Variable)) {
        auto node = makeLeaf(previous());
        while (check(TokenType::Variable) || check(TokenType::LParen)) {
            auto operand = parseJuxtaposed();
            node = std::make_unique<BinaryNode>(OperatorKind::Multiply, std::move(node),
                                                std::move(operand));
        }
        return node;
    }

    // Группировка скобками
    if (match(TokenType::LParen)) {
        return parseParenExpression();
    }

    if (check(TokenType::Bang)) {
        throw ParseError(ParseErrorKind::InvalidFactorialPosition, peek().position,
                         "Факториал '!' без операнда слева");
    }

    throw ParseError(ParseErrorKind::ExpectedAtom, peek().position,
                     std::string("Ожидался операнд, получено: ") + tokenTypeName(peek().type));
}

AstNodePtr Parser::parseJuxtaposed() {
    if (match(TokenType::Variable)) {
        return makeLeaf(previous());
    }
    ++current; // '('
    return parseParenExpression();
}

AstNodePtr Parser::parseParenExpression() {
    std::size_t openIndex = current - 1;
    const Token& open = tokens[openIndex];
    if (unmatchedOpen[openIndex]) {
        throw ParseError(ParseErrorKind::UnmatchedParen, open.position,
                         "Нет закрывающей скобки для '('");
    }

    auto node = parseExpression(precedence::kAdditive);
    if (!match(TokenType::RParen)) {
        throw ParseError(ParseErrorKind::UnmatchedParen, peek().position,
                         "Ожидалась ')' для скобки на позиции " + std::to_string(open.position) +
                             ", получено: " + tokenTypeName(peek().type));
    }
    return node;
}

AstNodePtr Parser::makeLeaf(const Token& token) {
    if (token.type == TokenType::Number) {
        return std::make_unique<LiteralNode>(token.text);
    }
    return std::make_unique<VariableNode>(token.text.front(), token.subscript);
}

} // namespace texpr
