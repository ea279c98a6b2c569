#include "operators.hpp"

#include <stdexcept>

namespace texpr {

namespace {
const OperatorInfo kNegateInfo{OperatorKind::Negate, Fixity::Prefix, 1,
                               precedence::kNegate, Associativity::Right, "Negate", "-"};
const OperatorInfo kFactorialInfo{OperatorKind::Factorial, Fixity::Postfix, 1,
                                  precedence::kFactorial, Associativity::Left, "Factorial", "!"};
const OperatorInfo kAddInfo{OperatorKind::Add, Fixity::Infix, 2,
                            precedence::kAdditive, Associativity::Left, "Add", "+"};
const OperatorInfo kSubtractInfo{OperatorKind::Subtract, Fixity::Infix, 2,
                                 precedence::kAdditive, Associativity::Left, "Subtract", "-"};
const OperatorInfo kMultiplyInfo{OperatorKind::Multiply, Fixity::Infix, 2,
                                 precedence::kMultiplicative, Associativity::Left, "Multiply", "\\cdot"};
const OperatorInfo kDivideInfo{OperatorKind::Divide, Fixity::Infix, 2,
                               precedence::kMultiplicative, Associativity::Left, "Divide", "/"};
const OperatorInfo kPowerInfo{OperatorKind::Power, Fixity::Infix, 2,
                              precedence::kPower, Associativity::Right, "Power", "^"};
}

const OperatorInfo& operatorInfo(OperatorKind kind) {
    switch (kind) {
    case OperatorKind::Negate:
        return kNegateInfo;
    case OperatorKind::Factorial:
        return kFactorialInfo;
    case OperatorKind::Add:
        return kAddInfo;
    case OperatorKind::Subtract:
        return kSubtractInfo;
    case OperatorKind::Multiply:
        return kMultiplyInfo;
    case OperatorKind::Divide:
        return kDivideInfo;
    case OperatorKind::Power:
        return kPowerInfo;
    }
    throw std::logic_error("Неизвестный вид оператора");
}

std::optional<OperatorKind> classifyOperator(TokenType type, Fixity fixity) {
    switch (fixity) {
    case Fixity::Prefix:
        if (type == TokenType::Minus) {
            return OperatorKind::Negate;
        }
        return std::nullopt;

    case Fixity::Postfix:
        if (type == TokenType::Bang) {
            return OperatorKind::Factorial;
        }
        return std::nullopt;

    case Fixity::Infix:
        switch (type) {
        case TokenType::Plus:
            return OperatorKind::Add;
        case TokenType::Minus:
            return OperatorKind::Subtract;
        case TokenType::Star:
        case TokenType::Cdot:
            return OperatorKind::Multiply;
        case TokenType::Slash:
            return OperatorKind::Divide;
        case TokenType::Caret:
            return OperatorKind::Power;
        default:
            return std::nullopt;
        }
    }
    return std::nullopt;
}

} // namespace texpr
