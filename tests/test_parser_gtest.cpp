#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "ast.hpp"
#include "expression_parser.hpp"
#include "parse_error.hpp"
#include "parser.hpp"
#include "tokenizer.hpp"

using namespace texpr;

namespace {

std::string describe(const std::string& source, ParserOptions options = {}) {
    ExpressionParser parser(options);
    return parser.parse(source)->describe();
}

void expectParseError(const std::string& source, ParseErrorKind kind, std::size_t position,
                      ParserOptions options = {}) {
    ExpressionParser parser(options);
    try {
        auto tree = parser.parse(source);
        FAIL() << "Ожидалась ошибка для \"" << source << "\", получено " << tree->describe();
    }
    catch (const ParseError& ex) {
        EXPECT_STREQ(toString(ex.kind()), toString(kind)) << source << ": " << ex.what();
        EXPECT_EQ(ex.position(), position) << source << ": " << ex.what();
    }
}

} // namespace

// --- Атомы ---

TEST(ParserAtomTest, DecimalLiterals) {
    for (const std::string literal : {"0", "7", "42", "3.14159", "0.5", "10.01"}) {
        ExpressionParser parser;
        auto tree = parser.parse(literal);
        ASSERT_EQ(tree->kind(), NodeKind::Literal) << literal;
        EXPECT_EQ(static_cast<const LiteralNode&>(*tree).getText(), literal);
    }
}

TEST(ParserAtomTest, Variables) {
    ExpressionParser parser;

    auto plain = parser.parse("x");
    ASSERT_EQ(plain->kind(), NodeKind::Variable);
    const auto& x = static_cast<const VariableNode&>(*plain);
    EXPECT_EQ(x.getLetter(), 'x');
    EXPECT_FALSE(x.getSubscript().has_value());

    auto indexed = parser.parse("x_1");
    ASSERT_EQ(indexed->kind(), NodeKind::Variable);
    const auto& x1 = static_cast<const VariableNode&>(*indexed);
    EXPECT_EQ(x1.getLetter(), 'x');
    EXPECT_EQ(x1.getSubscript(), std::optional<char>('1'));

    // x и x_1 это разные переменные
    EXPECT_FALSE(*plain == *indexed);
}

TEST(ParserAtomTest, SubscriptLongerThanOneCharacter) {
    expectParseError("v_ab", ParseErrorKind::UnexpectedToken, 3);
}

TEST(ParserAtomTest, ParenthesesAreNotKeptInTree) {
    EXPECT_EQ(describe("((x))"), "x");
    EXPECT_EQ(describe("(a+b)^2"), "Power(Add(a, b), 2)");
}

// --- Неявное умножение ---

TEST(ParserImplicitMultiplicationTest, FoldsLeft) {
    EXPECT_EQ(describe("2xy"), "Multiply(Multiply(2, x), y)");
    EXPECT_EQ(describe("2 x  y"), "Multiply(Multiply(2, x), y)");
    EXPECT_EQ(describe("abc"), "Multiply(Multiply(a, b), c)");
}

TEST(ParserImplicitMultiplicationTest, ParenthesizedOperands) {
    EXPECT_EQ(describe("2(x+1)"), "Multiply(2, Add(x, 1))");
    EXPECT_EQ(describe("x(y+1)"), "Multiply(x, Add(y, 1))");
    EXPECT_EQ(describe("2(x)(y)"), "Multiply(Multiply(2, x), y)");
    EXPECT_EQ(describe("x_1 y"), "Multiply(x_1, y)");
}

TEST(ParserImplicitMultiplicationTest, ChainIsOnePrimary) {
    // Цепочка подряд связывает сильнее '^' и '!'
    EXPECT_EQ(describe("2x^2"), "Power(Multiply(2, x), 2)");
    EXPECT_EQ(describe("2x!"), "Factorial(Multiply(2, x))");
    EXPECT_EQ(describe("2x + 1"), "Add(Multiply(2, x), 1)");
}

TEST(ParserImplicitMultiplicationTest, AllSpellingsGiveMultiply) {
    ExpressionParser parser;
    auto star = parser.parse("a*b");
    auto cdot = parser.parse("a \\cdot b");
    auto juxtaposed = parser.parse("ab");

    EXPECT_EQ(star->describe(), "Multiply(a, b)");
    EXPECT_TRUE(*star == *cdot);
    EXPECT_TRUE(*star == *juxtaposed);
    EXPECT_TRUE(*parser.parse("2x") == *parser.parse("2*x"));
}

TEST(ParserImplicitMultiplicationTest, NumbersNeverContinueChain) {
    expectParseError("2 2", ParseErrorKind::UnexpectedToken, 2);
    expectParseError("x 2", ParseErrorKind::UnexpectedToken, 2);
    expectParseError("2x 3", ParseErrorKind::UnexpectedToken, 3);
}

TEST(ParserImplicitMultiplicationTest, ChainDoesNotStartWithParen) {
    expectParseError("(x)y", ParseErrorKind::UnexpectedToken, 3);
    expectParseError("(a)(b)", ParseErrorKind::UnexpectedToken, 3);
    expectParseError("x!y", ParseErrorKind::UnexpectedToken, 2);
}

// --- Приоритеты и ассоциативность ---

TEST(ParserPrecedenceTest, Associativity) {
    EXPECT_EQ(describe("a-b-c"), "Subtract(Subtract(a, b), c)");
    EXPECT_EQ(describe("a^b^c"), "Power(a, Power(b, c))");
    EXPECT_EQ(describe("8/4/2"), "Divide(Divide(8, 4), 2)");
    EXPECT_EQ(describe("a - b + c"), "Add(Subtract(a, b), c)");
}

TEST(ParserPrecedenceTest, MultiplicativeTierIsShared) {
    EXPECT_EQ(describe("2*3/4"), "Divide(Multiply(2, 3), 4)");
    EXPECT_EQ(describe("2/3 \\cdot 4"), "Multiply(Divide(2, 3), 4)");
}

TEST(ParserPrecedenceTest, ConventionalOrder) {
    EXPECT_EQ(describe("1+2*3"), "Add(1, Multiply(2, 3))");
    EXPECT_EQ(describe("1*2+3"), "Add(Multiply(1, 2), 3)");
    EXPECT_EQ(describe("2*3^2"), "Multiply(2, Power(3, 2))");
    EXPECT_EQ(describe("1 + 2 ^ 3 ^ 2 * 4"), "Add(1, Multiply(Power(2, Power(3, 2)), 4))");
}

TEST(ParserPrecedenceTest, NegationIsLooserThanPower) {
    EXPECT_EQ(describe("-2^2"), "Negate(Power(2, 2))");
    EXPECT_EQ(describe("-a*b"), "Multiply(Negate(a), b)");
    EXPECT_EQ(describe("-a+b"), "Add(Negate(a), b)");
    EXPECT_EQ(describe("--x"), "Negate(Negate(x))");
}

TEST(ParserPrecedenceTest, NegationAfterOperator) {
    EXPECT_EQ(describe("2^-3"), "Power(2, Negate(3))");
    EXPECT_EQ(describe("2 - -3"), "Subtract(2, Negate(3))");
    EXPECT_EQ(describe("2*-x"), "Multiply(2, Negate(x))");
    EXPECT_EQ(describe("(-x)"), "Negate(x)");
}

TEST(ParserPrecedenceTest, FactorialBindsTightest) {
    EXPECT_EQ(describe("3!^2"), "Power(Factorial(3), 2)");
    EXPECT_EQ(describe("2^3!"), "Power(2, Factorial(3))");
    EXPECT_EQ(describe("-3!"), "Negate(Factorial(3))");
    EXPECT_EQ(describe("3!!"), "Factorial(Factorial(3))");
    EXPECT_EQ(describe("(n+1)!"), "Factorial(Add(n, 1))");
}

// --- Ошибки ---

TEST(ParserErrorTest, MalformedInputs) {
    expectParseError("(", ParseErrorKind::UnmatchedParen, 0);
    expectParseError("2+", ParseErrorKind::ExpectedAtom, 2);
    expectParseError("!2", ParseErrorKind::InvalidFactorialPosition, 0);
    expectParseError("2 2", ParseErrorKind::UnexpectedToken, 2);
}

TEST(ParserErrorTest, EmptyInput) {
    expectParseError("", ParseErrorKind::ExpectedAtom, 0);
    expectParseError("   ", ParseErrorKind::ExpectedAtom, 3);
    expectParseError("()", ParseErrorKind::ExpectedAtom, 1);
}

TEST(ParserErrorTest, MissingOperand) {
    expectParseError("2*/3", ParseErrorKind::ExpectedAtom, 2);
    expectParseError("-", ParseErrorKind::ExpectedAtom, 1);
    expectParseError("+2", ParseErrorKind::ExpectedAtom, 0);
    expectParseError("2^", ParseErrorKind::ExpectedAtom, 2);
}

TEST(ParserErrorTest, Parentheses) {
    expectParseError("(2+3", ParseErrorKind::UnmatchedParen, 0);
    expectParseError("((2)", ParseErrorKind::UnmatchedParen, 0);
    expectParseError("1 + (2 * (3)", ParseErrorKind::UnmatchedParen, 4);
    // Пара есть, но выражение внутри не может продолжиться
    expectParseError("(2 3)", ParseErrorKind::UnmatchedParen, 3);
    // Лишняя закрывающая скобка после полного выражения
    expectParseError("2)", ParseErrorKind::UnexpectedToken, 1);
    expectParseError("(2))", ParseErrorKind::UnexpectedToken, 3);
}

TEST(ParserErrorTest, FactorialWithoutOperand) {
    expectParseError("2+!3", ParseErrorKind::InvalidFactorialPosition, 2);
    expectParseError("(!x)", ParseErrorKind::InvalidFactorialPosition, 1);
    expectParseError("-!x", ParseErrorKind::InvalidFactorialPosition, 1);
}

TEST(ParserErrorTest, MessageMentionsPosition) {
    ExpressionParser parser;
    try {
        parser.parse("1 + ");
        FAIL() << "Ожидалась ошибка";
    }
    catch (const ParseError& ex) {
        EXPECT_NE(std::string(ex.what()).find("позиция 4"), std::string::npos) << ex.what();
    }
}

// --- Ограничение вложенности ---

TEST(ParserNestingTest, DeepParenthesesFailInsteadOfOverflowing) {
    const std::size_t depth = 100000;
    std::string source = std::string(depth, '(') + "x" + std::string(depth, ')');
    expectParseError(source, ParseErrorKind::NestingTooDeep, 256);
}

TEST(ParserNestingTest, NestingWithinLimitIsAccepted) {
    std::string source = std::string(200, '(') + "x" + std::string(200, ')');
    EXPECT_EQ(describe(source), "x");
}

TEST(ParserNestingTest, CustomLimit) {
    ParserOptions options;
    options.maxNestingDepth = 3;

    EXPECT_EQ(describe("((x))", options), "x");
    expectParseError("(((x)))", ParseErrorKind::NestingTooDeep, 3, options);
    expectParseError("---x", ParseErrorKind::NestingTooDeep, 3, options);
    expectParseError("2^2^2^2", ParseErrorKind::NestingTooDeep, 6, options);
}

TEST(ParserNestingTest, LongLeftAssociativeChainsDoNotNest) {
    ParserOptions options;
    options.maxNestingDepth = 3;

    std::string source = "1";
    for (int i = 0; i < 1000; ++i) {
        source += " + 1";
    }
    ExpressionParser parser(options);
    EXPECT_NO_THROW(parser.parse(source));
}

TEST(ParserNestingTest, LimitOutsideAllowedRangeIsRejected) {
    for (std::size_t depth : {std::size_t{0}, kMaxNestingDepthLimit + 1,
                              static_cast<std::size_t>(-1)}) {
        EXPECT_THROW(ExpressionParser parser(ParserOptions{depth}), std::invalid_argument) << depth;
        EXPECT_THROW(Parser parser(std::vector<Token>{}, ParserOptions{depth}), std::invalid_argument)
            << depth;
    }
    EXPECT_NO_THROW(ExpressionParser parser(ParserOptions{kMaxNestingDepthLimit}));
}

TEST(ParserNestingTest, MaximumLimitStillStopsDeepInput) {
    ParserOptions options{kMaxNestingDepthLimit};
    const std::size_t depth = 1000000;
    std::string source = std::string(depth, '(') + "x" + std::string(depth, ')');
    expectParseError(source, ParseErrorKind::NestingTooDeep, kMaxNestingDepthLimit, options);
}

// Каноническая запись может добавить скобки и тем самым уровень вложенности:
// 2^-3 печатается как 2^(-3)
TEST(ParserNestingTest, CanonicalFormMayNeedExtraLevel) {
    ParserOptions tight{3};
    ExpressionParser parser(tight);
    auto tree = parser.parse("2^-3");
    ASSERT_EQ(tree->toLatex(), "2^(-3)");
    expectParseError(tree->toLatex(), ParseErrorKind::NestingTooDeep, 4, tight);

    ExpressionParser roomy(ParserOptions{4});
    EXPECT_TRUE(*roomy.parse(tree->toLatex()) == *tree);
}

// --- Прямое использование Tokenizer + Parser ---

TEST(ParserDirectTest, ParsesTokenizerOutput) {
    Tokenizer tokenizer("x_1^2 - 1");
    Parser parser(tokenizer.tokenize());
    EXPECT_EQ(parser.parse()->describe(), "Subtract(Power(x_1, 2), 1)");
}

TEST(ParserDirectTest, EmptyTokenListIsMissingAtom) {
    Parser parser(std::vector<Token>{});
    try {
        parser.parse();
        FAIL() << "Ожидалась ошибка";
    }
    catch (const ParseError& ex) {
        EXPECT_EQ(ex.kind(), ParseErrorKind::ExpectedAtom);
        EXPECT_EQ(ex.position(), 0u);
    }
}

TEST(ParserDirectTest, ParserIsReusable) {
    Tokenizer tokenizer("a+b");
    Parser parser(tokenizer.tokenize());
    auto first = parser.parse();
    auto second = parser.parse();
    EXPECT_TRUE(*first == *second);
}
