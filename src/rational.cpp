#include "rational.hpp"

#include <cctype>
#include <memory>
#include <stdexcept>

namespace texpr {

namespace {
bool isDigits(const std::string& text) {
    if (text.empty()) {
        return false;
    }
    for (char ch : text) {
        if (std::isdigit(static_cast<unsigned char>(ch)) == 0) {
            return false;
        }
    }
    return true;
}

mpz_class powerOfTen(unsigned long exponent) {
    mpz_class result;
    mpz_ui_pow_ui(result.get_mpz_t(), 10, exponent);
    return result;
}

// Кратность простого множителя в n (n > 0); n делится на него до конца
unsigned long stripFactor(mpz_class& n, unsigned long factor) {
    unsigned long count = 0;
    while (mpz_divisible_ui_p(n.get_mpz_t(), factor) != 0) {
        mpz_divexact_ui(n.get_mpz_t(), n.get_mpz_t(), factor);
        ++count;
    }
    return count;
}

// Десятичная запись неотрицательной дроби со знаменателем вида 2^a * 5^b
std::string toDecimal(const mpz_class& numerator, const mpz_class& denominator,
                      unsigned long scale) {
    mpz_class scaled = numerator * powerOfTen(scale) / denominator;
    std::string digits = scaled.get_str();
    if (digits.size() <= scale) {
        digits.insert(0, scale - digits.size() + 1, '0');
    }
    digits.insert(digits.size() - scale, 1, '.');
    return digits;
}
}

Rational parseDecimal(const std::string& text) {
    std::size_t dot = text.find('.');
    std::string integerPart = text.substr(0, dot);
    std::string fractionPart = dot == std::string::npos ? "" : text.substr(dot + 1);

    if (!isDigits(integerPart) || (dot != std::string::npos && !isDigits(fractionPart))) {
        throw std::invalid_argument("Некорректная десятичная запись: " + text);
    }

    Rational value(mpz_class(integerPart + fractionPart, 10), powerOfTen(fractionPart.size()));
    value.canonicalize();
    return value;
}

std::string formatRational(const Rational& value) {
    return value.get_str();
}

AstNodePtr rationalToNode(const Rational& value) {
    if (sgn(value) < 0) {
        Rational magnitude = -value;
        return std::make_unique<UnaryNode>(OperatorKind::Negate, rationalToNode(magnitude));
    }

    const mpz_class& numerator = value.get_num();
    const mpz_class& denominator = value.get_den();
    if (denominator == 1) {
        return std::make_unique<LiteralNode>(numerator.get_str());
    }

    mpz_class rest = denominator;
    unsigned long twos = stripFactor(rest, 2);
    unsigned long fives = stripFactor(rest, 5);
    if (rest == 1) {
        return std::make_unique<LiteralNode>(
            toDecimal(numerator, denominator, twos > fives ? twos : fives));
    }

    return std::make_unique<BinaryNode>(OperatorKind::Divide,
                                        std::make_unique<LiteralNode>(numerator.get_str()),
                                        std::make_unique<LiteralNode>(denominator.get_str()));
}

} // namespace texpr
