#include "simplifier.hpp"

#include <memory>
#include <optional>
#include <stdexcept>

#include "evaluator.hpp"

namespace texpr {

namespace {
struct Folded {
    AstNodePtr node;
    std::optional<Rational> value; // Есть, если поддерево свернулось в число
};

Folded constant(Rational value) {
    AstNodePtr node = rationalToNode(value);
    return {std::move(node), std::move(value)};
}

Folded fold(const AstNode& node) {
    switch (node.kind()) {
    case NodeKind::Literal: {
        const auto& literal = static_cast<const LiteralNode&>(node);
        // Лист сохраняет исходную запись, значение нужно только родителю
        return {std::make_unique<LiteralNode>(literal.getText()), parseDecimal(literal.getText())};
    }
    case NodeKind::Variable: {
        const auto& variable = static_cast<const VariableNode&>(node);
        return {std::make_unique<VariableNode>(variable.getLetter(), variable.getSubscript()),
                std::nullopt};
    }
    case NodeKind::Unary: {
        const auto& unary = static_cast<const UnaryNode&>(node);
        Folded operand = fold(unary.getOperand());
        if (operand.value) {
            try {
                return constant(applyUnary(unary.getOperator(), *operand.value));
            }
            catch (const EvaluationError&) {
                // Операция не определена: узел остаётся в дереве
            }
        }
        return {std::make_unique<UnaryNode>(unary.getOperator(), std::move(operand.node)),
                std::nullopt};
    }
    case NodeKind::Binary: {
        const auto& binary = static_cast<const BinaryNode&>(node);
        Folded left = fold(binary.getLeft());
        Folded right = fold(binary.getRight());
        if (left.value && right.value) {
            try {
                return constant(applyBinary(binary.getOperator(), *left.value, *right.value));
            }
            catch (const EvaluationError&) {
                // Операция не определена: узел остаётся в дереве
            }
        }
        return {std::make_unique<BinaryNode>(binary.getOperator(), std::move(left.node),
                                             std::move(right.node)),
                std::nullopt};
    }
    }
    throw std::logic_error("Неизвестный вид узла");
}
}

AstNodePtr simplified(const AstNode& node) {
    return fold(node).node;
}

} // namespace texpr
