#pragma once

#include <string>

#include "codegen.hpp"

namespace exprcc {

// Класс-фасад компилятора: строка -> токены -> AST -> листинг.
// Каждый вызов создаёт собственные токены, дерево и генератор.
class ExpressionCompiler {
public:
    ExpressionCompiler() = default;

    // Выбрасывает LexError или ParseError; в этом случае листинг не создаётся
    AssemblyListing compile(const std::string& source) const;
};

} // namespace exprcc
