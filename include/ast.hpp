#pragma once

#include <memory>
#include <optional>
#include <string>

#include "operators.hpp"

namespace texpr {

// Закрытый набор видов узлов: обработчики дерева перебирают его через switch
enum class NodeKind {
    Literal,
    Variable,
    Unary,
    Binary
};

// Базовый класс для узла абстрактного синтаксического дерева (AST).
// Узел владеет своими потомками единолично и не меняется после создания.
class AstNode {
public:
    virtual ~AstNode() = default;

    virtual NodeKind kind() const = 0;

    // Приоритет узла как выражения (см. precedence::k*), нужен для расстановки скобок
    virtual int precedence() const = 0;

    // Каноническая запись в LaTeX: явные операторы, минимум скобок.
    // Повторный разбор результата даёт структурно равное дерево. Добавленные скобки
    // (2^-3 -> 2^(-3)) углубляют вложенность, поэтому повторному разбору может
    // понадобиться больший ParserOptions::maxNestingDepth, чем исходному.
    virtual std::string toLatex() const = 0;

    // Структурная запись вида Multiply(Multiply(2, x), y)
    virtual std::string describe() const = 0;

    // Структурное сравнение поддеревьев
    virtual bool equals(const AstNode& other) const = 0;
};

using AstNodePtr = std::unique_ptr<AstNode>;

bool operator==(const AstNode& left, const AstNode& right);
bool operator!=(const AstNode& left, const AstNode& right);

// Числовой литерал (лист дерева). Хранит десятичную запись без преобразования в число.
class LiteralNode final : public AstNode {
public:
    explicit LiteralNode(std::string text) : text(std::move(text)) {}

    const std::string& getText() const { return text; }

    NodeKind kind() const override { return NodeKind::Literal; }
    int precedence() const override { return precedence::kAtom; }
    std::string toLatex() const override { return text; }
    std::string describe() const override { return text; }
    bool equals(const AstNode& other) const override;

private:
    std::string text;
};

// Ссылка на переменную: буква и необязательный односимвольный индекс.
// x и x_1 это разные переменные.
class VariableNode final : public AstNode {
public:
    explicit VariableNode(char letter, std::optional<char> subscript = std::nullopt)
        : letter(letter), subscript(subscript) {}

    char getLetter() const { return letter; }
    std::optional<char> getSubscript() const { return subscript; }

    // Имя в записи LaTeX: "x" или "x_1"
    std::string name() const;

    NodeKind kind() const override { return NodeKind::Variable; }
    int precedence() const override { return precedence::kAtom; }
    std::string toLatex() const override { return name(); }
    std::string describe() const override { return name(); }
    bool equals(const AstNode& other) const override;

private:
    char letter;
    std::optional<char> subscript;
};

// Узел унарной операции (Negate или Factorial)
class UnaryNode final : public AstNode {
public:
    // Выбрасывает std::invalid_argument для бинарного оператора или пустого операнда
    UnaryNode(OperatorKind op, AstNodePtr child);

    OperatorKind getOperator() const { return op; }
    const AstNode& getOperand() const { return *child; }

    NodeKind kind() const override { return NodeKind::Unary; }
    int precedence() const override;
    std::string toLatex() const override;
    std::string describe() const override;
    bool equals(const AstNode& other) const override;

private:
    OperatorKind op;
    AstNodePtr child;
};

// Узел бинарной операции (+, -, *, /, ^)
class BinaryNode final : public AstNode {
public:
    // Выбрасывает std::invalid_argument для унарного оператора или пустого операнда
    BinaryNode(OperatorKind op, AstNodePtr left, AstNodePtr right);

    OperatorKind getOperator() const { return op; }
    const AstNode& getLeft() const { return *left; }
    const AstNode& getRight() const { return *right; }

    NodeKind kind() const override { return NodeKind::Binary; }
    int precedence() const override;
    std::string toLatex() const override;
    std::string describe() const override;
    bool equals(const AstNode& other) const override;

private:
    OperatorKind op;        // Вид операции
    AstNodePtr left;        // Левый операнд
    AstNodePtr right;       // Правый операнд
};

} // namespace texpr
