#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>
#include <utility>

namespace exprcc {

class NumberNode;
class UnaryNode;
class BinaryNode;

// Обход дерева. Для каждого вида узла свой чистый виртуальный метод,
// поэтому новый вид узла не скомпилируется, пока его не обработают все обходчики.
class AstVisitor {
public:
    virtual ~AstVisitor() = default;

    virtual void visit(const NumberNode& node) = 0;
    virtual void visit(const UnaryNode& node) = 0;
    virtual void visit(const BinaryNode& node) = 0;
};

// Базовый класс для узла абстрактного синтаксического дерева (AST).
class AstNode {
public:
    virtual ~AstNode() = default;

    // Рекурсивно вычисляет значение поддерева с той же семантикой,
    // что и сгенерированный машинный код
    virtual std::int64_t evaluate() const = 0;

    virtual void accept(AstVisitor& visitor) const = 0;

    // Высота поддерева: у листа 1. Обходы рекурсивны, поэтому парсер её ограничивает.
    virtual std::size_t depth() const = 0;
};

// Узел, представляющий числовую константу (лист дерева)
class NumberNode final : public AstNode {
public:
    explicit NumberNode(std::int64_t value) : value(value) {}

    std::int64_t evaluate() const override { return value; }
    void accept(AstVisitor& visitor) const override { visitor.visit(*this); }
    std::size_t depth() const override { return 1; }

    std::int64_t getValue() const { return value; }

private:
    std::int64_t value;
};

enum class UnaryOperator {
    Plus,
    Negate
};

// Узел унарной операции (унарный минус или плюс)
class UnaryNode final : public AstNode {
public:
    UnaryNode(UnaryOperator op, std::unique_ptr<AstNode> operand)
        : op(op), operand(std::move(operand)), height(this->operand->depth() + 1) {}

    std::int64_t evaluate() const override;
    void accept(AstVisitor& visitor) const override { visitor.visit(*this); }
    std::size_t depth() const override { return height; }

    UnaryOperator getOperator() const { return op; }
    const AstNode& getOperand() const { return *operand; }

private:
    UnaryOperator op;
    std::unique_ptr<AstNode> operand;
    std::size_t height;
};

enum class BinaryOperator {
    Add,
    Subtract,
    Multiply,
    Divide,
    Equal,
    NotEqual,
    Less,
    LessEqual,
    Greater,
    GreaterEqual
};

// Символ оператора в исходном тексте ("+", "<=" и т.д.)
std::string_view binaryOperatorSymbol(BinaryOperator op);

// Узел бинарной операции. Оба операнда построены до создания узла.
class BinaryNode final : public AstNode {
public:
    BinaryNode(BinaryOperator op, std::unique_ptr<AstNode> left, std::unique_ptr<AstNode> right)
        : op(op), left(std::move(left)), right(std::move(right)),
          height(std::max(this->left->depth(), this->right->depth()) + 1) {}

    std::int64_t evaluate() const override;
    void accept(AstVisitor& visitor) const override { visitor.visit(*this); }
    std::size_t depth() const override { return height; }

    BinaryOperator getOperator() const { return op; }
    const AstNode& getLeft() const { return *left; }
    const AstNode& getRight() const { return *right; }

private:
    BinaryOperator op;
    std::unique_ptr<AstNode> left;  // Левый операнд
    std::unique_ptr<AstNode> right; // Правый операнд
    std::size_t height;
};

} // namespace exprcc
