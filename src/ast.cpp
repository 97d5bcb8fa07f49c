#include "ast.hpp"

#include <stdexcept>

#include "errors.hpp"

namespace exprcc {

namespace {
// Арифметика по модулю 2^64, как у инструкций add/sub/imul.
// Вычисляется в беззнаковом типе, чтобы избежать UB при переполнении.
std::int64_t wrap(std::uint64_t value) {
    return static_cast<std::int64_t>(value);
}
}

std::string_view binaryOperatorSymbol(BinaryOperator op) {
    switch (op) {
    case BinaryOperator::Add:
        return "+";
    case BinaryOperator::Subtract:
        return "-";
    case BinaryOperator::Multiply:
        return "*";
    case BinaryOperator::Divide:
        return "/";
    case BinaryOperator::Equal:
        return "==";
    case BinaryOperator::NotEqual:
        return "!=";
    case BinaryOperator::Less:
        return "<";
    case BinaryOperator::LessEqual:
        return "<=";
    case BinaryOperator::Greater:
        return ">";
    case BinaryOperator::GreaterEqual:
        return ">=";
    }
    return "?";
}

// Вычисление унарной операции
std::int64_t UnaryNode::evaluate() const {
    std::int64_t value = operand->evaluate();
    switch (op) {
    case UnaryOperator::Plus:
        return value; // Унарный плюс ничего не меняет
    case UnaryOperator::Negate:
        return wrap(0 - static_cast<std::uint64_t>(value)); // neg rax
    }
    throw std::runtime_error("Неизвестная унарная операция");
}

// Вычисление бинарной операции
std::int64_t BinaryNode::evaluate() const {
    std::int64_t leftValue = left->evaluate();
    std::int64_t rightValue = right->evaluate();
    auto l = static_cast<std::uint64_t>(leftValue);
    auto r = static_cast<std::uint64_t>(rightValue);

    switch (op) {
    case BinaryOperator::Add:
        return wrap(l + r);
    case BinaryOperator::Subtract:
        return wrap(l - r);
    case BinaryOperator::Multiply:
        return wrap(l * r);
    case BinaryOperator::Divide:
        if (rightValue == 0) {
            throw ArithmeticError(ArithmeticErrorKind::DivisionByZero, "Деление на ноль");
        }
        // INT64_MIN / -1 переполняется; сгенерированный код в этом случае делает neg
        if (rightValue == -1) {
            return wrap(0 - l);
        }
        return leftValue / rightValue; // Усечение к нулю, как у idiv
    case BinaryOperator::Equal:
        return leftValue == rightValue ? 1 : 0;
    case BinaryOperator::NotEqual:
        return leftValue != rightValue ? 1 : 0;
    case BinaryOperator::Less:
        return leftValue < rightValue ? 1 : 0;
    case BinaryOperator::LessEqual:
        return leftValue <= rightValue ? 1 : 0;
    case BinaryOperator::Greater:
        return leftValue > rightValue ? 1 : 0;
    case BinaryOperator::GreaterEqual:
        return leftValue >= rightValue ? 1 : 0;
    }
    throw std::runtime_error("Неизвестная бинарная операция");
}

} // namespace exprcc
