#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "ast.hpp"

namespace exprcc {

// Листинг на ассемблере x86-64 (синтаксис Intel для GNU as), по строке на элемент
using AssemblyListing = std::vector<std::string>;

// Код завершения сгенерированной программы при делении на ноль (128 + SIGFPE)
constexpr int kDivisionByZeroExitStatus = 136;

// Сообщение, которое сгенерированная программа пишет в stderr при делении на ноль
constexpr std::string_view kDivisionByZeroMessage = "ArithmeticError: division by zero";

// Генератор кода для стековой машины.
// Обходит дерево в обратном порядке: литерал кладётся на стек,
// бинарная операция снимает два значения и кладёт результат.
// В конце значение со стека возвращается из main и становится кодом завершения.
class CodeGenerator final : private AstVisitor {
public:
    CodeGenerator() = default;

    // Строит полный листинг: пролог, тело, эпилог и обработчик деления на ноль.
    // Повторный вызов с тем же деревом даёт тот же листинг.
    AssemblyListing generate(const AstNode& root);

private:
    AssemblyListing listing;
    std::size_t labelCounter = 0;
    bool usesDivision = false;

    void visit(const NumberNode& node) override;
    void visit(const UnaryNode& node) override;
    void visit(const BinaryNode& node) override;

    void emit(std::string line);
    void emitDivision();
    void emitComparison(std::string_view setInstruction);
    void emitDivisionByZeroHandler();

    std::string newLabel(std::string_view prefix);
};

// Записывает листинг в поток, по одной инструкции на строку
void writeListing(std::ostream& out, const AssemblyListing& listing);

} // namespace exprcc
