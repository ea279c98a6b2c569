#include "evaluator.hpp"

#include <algorithm>
#include <cstddef>

namespace texpr {

namespace {
// Целое значение в пределах limit по модулю, иначе EvaluationError
unsigned long boundedInteger(const Rational& value, unsigned long limit, const char* what) {
    if (value.get_den() != 1) {
        throw EvaluationError(std::string(what) + " должен быть целым, получено " +
                              formatRational(value));
    }
    mpz_class magnitude = abs(value.get_num());
    if (magnitude > limit) {
        throw EvaluationError(std::string(what) + " слишком велик: " + formatRational(value));
    }
    return magnitude.get_ui();
}

Rational power(const Rational& base, const Rational& exponent) {
    unsigned long n = boundedInteger(exponent, kMaxExponent, "Показатель степени");
    bool negative = sgn(exponent) < 0;
    if (negative && sgn(base) == 0) {
        throw EvaluationError("Деление на ноль");
    }

    std::size_t baseBits = std::max(mpz_sizeinbase(base.get_num_mpz_t(), 2),
                                    mpz_sizeinbase(base.get_den_mpz_t(), 2));
    if (baseBits > 1 && (baseBits - 1) * n > kMaxPowerBits) {
        throw EvaluationError("Результат возведения в степень слишком велик");
    }

    mpz_class numerator;
    mpz_class denominator;
    mpz_pow_ui(numerator.get_mpz_t(), base.get_num_mpz_t(), n);
    mpz_pow_ui(denominator.get_mpz_t(), base.get_den_mpz_t(), n);

    Rational result = negative ? Rational(denominator, numerator) : Rational(numerator, denominator);
    result.canonicalize();
    return result;
}

Rational factorial(const Rational& operand) {
    if (sgn(operand) < 0) {
        throw EvaluationError("Факториал отрицательного числа " + formatRational(operand));
    }
    unsigned long n = boundedInteger(operand, kMaxFactorialArgument, "Аргумент факториала");
    mpz_class result;
    mpz_fac_ui(result.get_mpz_t(), n);
    return Rational(result, mpz_class(1));
}
}

Rational applyUnary(OperatorKind op, const Rational& operand) {
    switch (op) {
    case OperatorKind::Negate:
        return -operand;
    case OperatorKind::Factorial:
        return factorial(operand);
    default:
        throw EvaluationError(std::string("Оператор не является унарным: ") + operatorInfo(op).name);
    }
}

Rational applyBinary(OperatorKind op, const Rational& left, const Rational& right) {
    switch (op) {
    case OperatorKind::Add:
        return left + right;
    case OperatorKind::Subtract:
        return left - right;
    case OperatorKind::Multiply:
        return left * right;
    case OperatorKind::Divide:
        if (sgn(right) == 0) {
            throw EvaluationError("Деление на ноль");
        }
        return left / right;
    case OperatorKind::Power:
        return power(left, right);
    default:
        throw EvaluationError(std::string("Оператор не является бинарным: ") + operatorInfo(op).name);
    }
}

Rational evaluate(const AstNode& node, const VariableMap& variables) {
    switch (node.kind()) {
    case NodeKind::Literal:
        return parseDecimal(static_cast<const LiteralNode&>(node).getText());
    case NodeKind::Variable: {
        std::string name = static_cast<const VariableNode&>(node).name();
        auto it = variables.find(name);
        if (it == variables.end()) {
            throw EvaluationError("Значение переменной " + name + " не задано");
        }
        return it->second;
    }
    case NodeKind::Unary: {
        const auto& unary = static_cast<const UnaryNode&>(node);
        return applyUnary(unary.getOperator(), evaluate(unary.getOperand(), variables));
    }
    case NodeKind::Binary: {
        const auto& binary = static_cast<const BinaryNode&>(node);
        return applyBinary(binary.getOperator(), evaluate(binary.getLeft(), variables),
                           evaluate(binary.getRight(), variables));
    }
    }
    throw EvaluationError("Неизвестный вид узла");
}

} // namespace texpr
