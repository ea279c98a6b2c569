#include "ast.hpp"

#include <stdexcept>

namespace texpr {

namespace {
// Оборачивает запись потомка в скобки, если это нужно для сохранения структуры
std::string wrap(const AstNode& node, bool parenthesize) {
    if (parenthesize) {
        return "(" + node.toLatex() + ")";
    }
    return node.toLatex();
}
}

bool operator==(const AstNode& left, const AstNode& right) {
    return left.equals(right);
}

bool operator!=(const AstNode& left, const AstNode& right) {
    return !left.equals(right);
}

bool LiteralNode::equals(const AstNode& other) const {
    if (other.kind() != NodeKind::Literal) {
        return false;
    }
    return text == static_cast<const LiteralNode&>(other).text;
}

std::string VariableNode::name() const {
    std::string result(1, letter);
    if (subscript) {
        result += '_';
        result += *subscript;
    }
    return result;
}

bool VariableNode::equals(const AstNode& other) const {
    if (other.kind() != NodeKind::Variable) {
        return false;
    }
    const auto& variable = static_cast<const VariableNode&>(other);
    return letter == variable.letter && subscript == variable.subscript;
}

UnaryNode::UnaryNode(OperatorKind op, AstNodePtr child) : op(op), child(std::move(child)) {
    if (operatorInfo(op).arity != 1) {
        throw std::invalid_argument("Оператор не является унарным");
    }
    if (!this->child) {
        throw std::invalid_argument("Пустой операнд унарной операции");
    }
}

int UnaryNode::precedence() const {
    return operatorInfo(op).precedence;
}

// -a^2 печатается без скобок, -(a+b) со скобками.
// Операнд факториала обязан быть первичным выражением.
std::string UnaryNode::toLatex() const {
    const auto& info = operatorInfo(op);
    if (info.fixity == Fixity::Prefix) {
        return info.latex + wrap(*child, child->precedence() < info.precedence);
    }
    return wrap(*child, child->precedence() < info.precedence) + info.latex;
}

std::string UnaryNode::describe() const {
    return std::string(operatorInfo(op).name) + "(" + child->describe() + ")";
}

bool UnaryNode::equals(const AstNode& other) const {
    if (other.kind() != NodeKind::Unary) {
        return false;
    }
    const auto& unary = static_cast<const UnaryNode&>(other);
    return op == unary.op && child->equals(*unary.child);
}

BinaryNode::BinaryNode(OperatorKind op, AstNodePtr left, AstNodePtr right)
    : op(op), left(std::move(left)), right(std::move(right)) {
    if (operatorInfo(op).arity != 2) {
        throw std::invalid_argument("Оператор не является бинарным");
    }
    if (!this->left || !this->right) {
        throw std::invalid_argument("Пустой операнд бинарной операции");
    }
}

int BinaryNode::precedence() const {
    return operatorInfo(op).precedence;
}

// Скобки ставятся у потомка с более слабым приоритетом, а при равном приоритете
// у того потомка, который противоречит ассоциативности: a - (b - c), (a^b)^c
std::string BinaryNode::toLatex() const {
    const auto& info = operatorInfo(op);
    bool leftAssociative = info.associativity == Associativity::Left;

    bool leftParens = leftAssociative ? left->precedence() < info.precedence
                                      : left->precedence() <= info.precedence;
    bool rightParens = leftAssociative ? right->precedence() <= info.precedence
                                       : right->precedence() < info.precedence;

    std::string separator = op == OperatorKind::Power
        ? std::string(info.latex)
        : " " + std::string(info.latex) + " ";
    return wrap(*left, leftParens) + separator + wrap(*right, rightParens);
}

std::string BinaryNode::describe() const {
    return std::string(operatorInfo(op).name) + "(" + left->describe() + ", " +
           right->describe() + ")";
}

bool BinaryNode::equals(const AstNode& other) const {
    if (other.kind() != NodeKind::Binary) {
        return false;
    }
    const auto& binary = static_cast<const BinaryNode&>(other);
    return op == binary.op && left->equals(*binary.left) && right->equals(*binary.right);
}

} // namespace texpr
