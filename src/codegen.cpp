#include "codegen.hpp"

#include <cstdint>
#include <limits>

namespace exprcc {

namespace {
constexpr std::string_view kDivisionByZeroLabel = ".L.div_by_zero";
constexpr std::string_view kDivisionByZeroMessageLabel = ".L.div_by_zero_msg";

// Номера системных вызовов Linux x86-64
constexpr int kSysWrite = 1;
constexpr int kSysExitGroup = 231;
constexpr int kStderr = 2;
}

AssemblyListing CodeGenerator::generate(const AstNode& root) {
    listing.clear();
    labelCounter = 0;
    usesDivision = false;

    emit(".intel_syntax noprefix");
    emit(".globl main");
    emit("main:");

    root.accept(*this);

    // На вершине стека осталось значение всего выражения
    emit("  pop rax");
    emit("  ret");

    if (usesDivision) {
        emitDivisionByZeroHandler();
    }

    emit(".section .note.GNU-stack,\"\",@progbits");
    return std::move(listing);
}

void CodeGenerator::visit(const NumberNode& node) {
    std::int64_t value = node.getValue();
    // push принимает только 32-битный непосредственный операнд со знаковым расширением
    if (value > std::numeric_limits<std::int32_t>::max()) {
        emit("  mov rax, " + std::to_string(value));
        emit("  push rax");
    } else {
        emit("  push " + std::to_string(value));
    }
}

void CodeGenerator::visit(const UnaryNode& node) {
    node.getOperand().accept(*this);

    switch (node.getOperator()) {
    case UnaryOperator::Plus:
        break;
    case UnaryOperator::Negate:
        emit("  pop rax");
        emit("  neg rax");
        emit("  push rax");
        break;
    }
}

void CodeGenerator::visit(const BinaryNode& node) {
    node.getLeft().accept(*this);
    node.getRight().accept(*this);

    emit("  pop rdi");
    emit("  pop rax");

    switch (node.getOperator()) {
    case BinaryOperator::Add:
        emit("  add rax, rdi");
        break;
    case BinaryOperator::Subtract:
        emit("  sub rax, rdi");
        break;
    case BinaryOperator::Multiply:
        emit("  imul rax, rdi");
        break;
    case BinaryOperator::Divide:
        emitDivision();
        break;
    case BinaryOperator::Equal:
        emitComparison("sete");
        break;
    case BinaryOperator::NotEqual:
        emitComparison("setne");
        break;
    case BinaryOperator::Less:
        emitComparison("setl");
        break;
    case BinaryOperator::LessEqual:
        emitComparison("setle");
        break;
    case BinaryOperator::Greater:
        emitComparison("setg");
        break;
    case BinaryOperator::GreaterEqual:
        emitComparison("setge");
        break;
    }

    emit("  push rax");
}

void CodeGenerator::emit(std::string line) {
    listing.push_back(std::move(line));
}

// rax / rdi с усечением к нулю. Ноль уходит в обработчик ошибки,
// делитель -1 обрабатывается через neg, иначе idiv упадёт на INT64_MIN / -1.
void CodeGenerator::emitDivision() {
    usesDivision = true;
    std::string idivLabel = newLabel("idiv");
    std::string endLabel = newLabel("div_end");

    emit("  test rdi, rdi");
    emit("  je " + std::string(kDivisionByZeroLabel));
    emit("  cmp rdi, -1");
    emit("  jne " + idivLabel);
    emit("  neg rax");
    emit("  jmp " + endLabel);
    emit(idivLabel + ":");
    emit("  cqo");
    emit("  idiv rdi");
    emit(endLabel + ":");
}

void CodeGenerator::emitComparison(std::string_view setInstruction) {
    emit("  cmp rax, rdi");
    emit("  " + std::string(setInstruction) + " al");
    emit("  movzx rax, al");
}

// Пишет сообщение в stderr и завершает процесс, не возвращаясь в main
void CodeGenerator::emitDivisionByZeroHandler() {
    emit(std::string(kDivisionByZeroLabel) + ":");
    emit("  mov rax, " + std::to_string(kSysWrite));
    emit("  mov rdi, " + std::to_string(kStderr));
    emit("  lea rsi, [rip + " + std::string(kDivisionByZeroMessageLabel) + "]");
    emit("  mov rdx, " + std::to_string(kDivisionByZeroMessage.size() + 1));
    emit("  syscall");
    emit("  mov rax, " + std::to_string(kSysExitGroup));
    emit("  mov rdi, " + std::to_string(kDivisionByZeroExitStatus));
    emit("  syscall");
    emit(".section .rodata");
    emit(std::string(kDivisionByZeroMessageLabel) + ":");
    emit("  .ascii \"" + std::string(kDivisionByZeroMessage) + "\\n\"");
}

std::string CodeGenerator::newLabel(std::string_view prefix) {
    return ".L." + std::string(prefix) + "." + std::to_string(labelCounter++);
}

void writeListing(std::ostream& out, const AssemblyListing& listing) {
    for (const auto& line : listing) {
        out << line << '\n';
    }
}

} // namespace exprcc
