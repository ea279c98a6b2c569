#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>

#include "ast.hpp"
#include "expression_generator.hpp"
#include "expression_parser.hpp"

using namespace texpr;

namespace {

AstNodePtr num(const std::string& text) {
    return std::make_unique<LiteralNode>(text);
}

AstNodePtr var(char letter) {
    return std::make_unique<VariableNode>(letter);
}

AstNodePtr unary(OperatorKind op, AstNodePtr child) {
    return std::make_unique<UnaryNode>(op, std::move(child));
}

AstNodePtr binary(OperatorKind op, AstNodePtr left, AstNodePtr right) {
    return std::make_unique<BinaryNode>(op, std::move(left), std::move(right));
}

// Разбор -> каноническая запись -> повторный разбор
void expectRoundTrip(const std::string& source) {
    ExpressionParser parser;
    auto original = parser.parse(source);
    std::string latex = original->toLatex();
    auto reparsed = parser.parse(latex);
    EXPECT_TRUE(*original == *reparsed)
        << source << " -> " << latex << ": " << original->describe() << " != " << reparsed->describe();
}

} // namespace

TEST(AstNodeTest, Describe) {
    auto tree = binary(OperatorKind::Add,
                       unary(OperatorKind::Negate, var('x')),
                       unary(OperatorKind::Factorial, num("3")));
    EXPECT_EQ(tree->describe(), "Add(Negate(x), Factorial(3))");
    EXPECT_EQ(VariableNode('x', '1').describe(), "x_1");
}

TEST(AstNodeTest, Kinds) {
    EXPECT_EQ(LiteralNode("1").kind(), NodeKind::Literal);
    EXPECT_EQ(VariableNode('a').kind(), NodeKind::Variable);
    EXPECT_EQ(unary(OperatorKind::Negate, var('a'))->kind(), NodeKind::Unary);
    EXPECT_EQ(binary(OperatorKind::Power, var('a'), num("2"))->kind(), NodeKind::Binary);
}

TEST(AstNodeTest, Accessors) {
    auto tree = binary(OperatorKind::Divide, var('a'), unary(OperatorKind::Negate, num("2")));
    const auto& node = static_cast<const BinaryNode&>(*tree);
    EXPECT_EQ(node.getOperator(), OperatorKind::Divide);
    EXPECT_EQ(node.getLeft().describe(), "a");
    ASSERT_EQ(node.getRight().kind(), NodeKind::Unary);
    const auto& negate = static_cast<const UnaryNode&>(node.getRight());
    EXPECT_EQ(negate.getOperator(), OperatorKind::Negate);
    EXPECT_EQ(negate.getOperand().describe(), "2");
}

TEST(AstNodeTest, ConstructorsRejectWrongArity) {
    EXPECT_THROW(UnaryNode(OperatorKind::Add, var('a')), std::invalid_argument);
    EXPECT_THROW(BinaryNode(OperatorKind::Negate, var('a'), var('b')), std::invalid_argument);
    EXPECT_THROW(UnaryNode(OperatorKind::Negate, nullptr), std::invalid_argument);
    EXPECT_THROW(BinaryNode(OperatorKind::Add, var('a'), nullptr), std::invalid_argument);
}

TEST(AstNodeTest, StructuralEquality) {
    auto left = binary(OperatorKind::Multiply, num("2"), var('x'));
    auto same = binary(OperatorKind::Multiply, num("2"), var('x'));
    auto swapped = binary(OperatorKind::Multiply, var('x'), num("2"));
    auto otherOp = binary(OperatorKind::Add, num("2"), var('x'));

    EXPECT_TRUE(*left == *same);
    EXPECT_FALSE(*left == *swapped);
    EXPECT_FALSE(*left == *otherOp);
    EXPECT_TRUE(*left != *otherOp);

    // Литералы сравниваются по записи, а не по значению
    EXPECT_FALSE(LiteralNode("2") == LiteralNode("2.0"));
    EXPECT_FALSE(VariableNode('x') == VariableNode('x', '1'));
    EXPECT_FALSE(LiteralNode("1") == VariableNode('x'));
}

TEST(AstLatexTest, AtomsAndMultiplication) {
    EXPECT_EQ(LiteralNode("3.5").toLatex(), "3.5");
    EXPECT_EQ(VariableNode('y', 'k').toLatex(), "y_k");
    EXPECT_EQ(binary(OperatorKind::Multiply, num("2"), var('x'))->toLatex(), "2 \\cdot x");
}

TEST(AstLatexTest, ParenthesesFollowAssociativity) {
    EXPECT_EQ(binary(OperatorKind::Subtract,
                     binary(OperatorKind::Subtract, var('a'), var('b')), var('c'))->toLatex(),
              "a - b - c");
    EXPECT_EQ(binary(OperatorKind::Subtract,
                     var('a'), binary(OperatorKind::Subtract, var('b'), var('c')))->toLatex(),
              "a - (b - c)");
    EXPECT_EQ(binary(OperatorKind::Power,
                     var('a'), binary(OperatorKind::Power, var('b'), var('c')))->toLatex(),
              "a^b^c");
    EXPECT_EQ(binary(OperatorKind::Power,
                     binary(OperatorKind::Power, var('a'), var('b')), var('c'))->toLatex(),
              "(a^b)^c");
}

TEST(AstLatexTest, ParenthesesFollowPrecedence) {
    EXPECT_EQ(binary(OperatorKind::Multiply,
                     binary(OperatorKind::Add, var('a'), var('b')), var('c'))->toLatex(),
              "(a + b) \\cdot c");
    EXPECT_EQ(binary(OperatorKind::Add,
                     binary(OperatorKind::Multiply, var('a'), var('b')), var('c'))->toLatex(),
              "a \\cdot b + c");
}

TEST(AstLatexTest, UnaryOperators) {
    EXPECT_EQ(unary(OperatorKind::Negate,
                    binary(OperatorKind::Power, num("2"), num("2")))->toLatex(), "-2^2");
    EXPECT_EQ(binary(OperatorKind::Power,
                     unary(OperatorKind::Negate, num("2")), num("2"))->toLatex(), "(-2)^2");
    EXPECT_EQ(unary(OperatorKind::Negate,
                    binary(OperatorKind::Add, var('a'), var('b')))->toLatex(), "-(a + b)");
    EXPECT_EQ(binary(OperatorKind::Subtract,
                     var('a'), unary(OperatorKind::Negate, var('b')))->toLatex(), "a - -b");
    EXPECT_EQ(binary(OperatorKind::Power,
                     var('a'), unary(OperatorKind::Negate, var('b')))->toLatex(), "a^(-b)");
    EXPECT_EQ(unary(OperatorKind::Factorial,
                    binary(OperatorKind::Add, var('n'), num("1")))->toLatex(), "(n + 1)!");
    EXPECT_EQ(unary(OperatorKind::Factorial,
                    unary(OperatorKind::Factorial, num("3")))->toLatex(), "3!!");
    EXPECT_EQ(unary(OperatorKind::Factorial,
                    unary(OperatorKind::Negate, var('x')))->toLatex(), "(-x)!");
}

TEST(AstRoundTripTest, HandPickedExpressions) {
    for (const char* source : {
             "2xy", "2(x+1)", "a-b-c", "a-(b-c)", "a^b^c", "(a^b)^c", "-2^2", "(-2)^2",
             "3!^2", "2^3!", "-3!", "(n+1)!", "x!!", "2x!", "2x^2", "a \\cdot b / c",
             "a/(b*c)", "--x", "2^-3", "a - -b", "x_1 y_2 (z + 1)", "-2(a+b)(c-d)",
             "1.5 + 2.25 * (x_0 - 3)"}) {
        expectRoundTrip(source);
    }
}

TEST(AstRoundTripTest, GeneratedExpressions) {
    ExpressionGenerator generator(42u, 0.0);
    for (int i = 0; i < 500; ++i) {
        std::string source = generator.generate(2 + i % 5);
        SCOPED_TRACE(source);
        expectRoundTrip(source);
    }
}

TEST(AstRoundTripTest, CanonicalFormIsStable) {
    ExpressionParser parser;
    auto tree = parser.parse("2x(y + 1)^2 - 3!");
    std::string once = tree->toLatex();
    std::string twice = parser.parse(once)->toLatex();
    EXPECT_EQ(once, twice);
}
