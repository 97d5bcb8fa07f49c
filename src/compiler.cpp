#include "compiler.hpp"

#include "parser.hpp"

namespace exprcc {

AssemblyListing ExpressionCompiler::compile(const std::string& source) const {
    auto ast = parseSource(source);

    CodeGenerator generator;
    return generator.generate(*ast);
}

} // namespace exprcc
