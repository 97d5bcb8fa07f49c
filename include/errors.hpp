#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace exprcc {

// Базовая ошибка компиляции: сообщение и позиция в исходной строке
class CompileError : public std::runtime_error {
public:
    CompileError(const std::string& message, std::size_t position)
        : std::runtime_error(message), position_(position) {}

    std::size_t position() const noexcept { return position_; }

private:
    std::size_t position_;
};

enum class LexErrorKind {
    UnexpectedCharacter,
    NumberOutOfRange
};

// Ошибка лексического анализа
class LexError final : public CompileError {
public:
    LexError(LexErrorKind kind, const std::string& message, std::size_t position)
        : CompileError(message, position), kind_(kind) {}

    LexErrorKind kind() const noexcept { return kind_; }

private:
    LexErrorKind kind_;
};

enum class ParseErrorKind {
    ExpectedFactor, // На месте операнда стоит что-то другое
    UnclosedParen,  // Нет закрывающей скобки
    TrailingInput,  // После полного выражения остались токены
    NestingTooDeep  // Слишком глубокая вложенность скобок, унарных операций или цепочек
};

// Ошибка синтаксического анализа
class ParseError final : public CompileError {
public:
    ParseError(ParseErrorKind kind, const std::string& message, std::size_t position)
        : CompileError(message, position), kind_(kind) {}

    ParseErrorKind kind() const noexcept { return kind_; }

private:
    ParseErrorKind kind_;
};

enum class ArithmeticErrorKind {
    DivisionByZero
};

// Ошибка вычисления. Компилятор её не выбрасывает:
// сгенерированная программа сообщает о том же самом во время выполнения.
class ArithmeticError final : public std::runtime_error {
public:
    ArithmeticError(ArithmeticErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ArithmeticErrorKind kind() const noexcept { return kind_; }

private:
    ArithmeticErrorKind kind_;
};

// Форматирует ошибку в виде:
//
//   5+$
//     ^ Недопустимый символ '$'
//
// Если source содержит несколько строк, выводится только строка с ошибкой.
std::string formatDiagnostic(const std::string& source, const CompileError& error);

} // namespace exprcc
