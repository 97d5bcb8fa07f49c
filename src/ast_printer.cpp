#include "ast_printer.hpp"

#include <sstream>

namespace exprcc {

namespace {
class AstPrinter final : public AstVisitor {
public:
    explicit AstPrinter(std::ostringstream& out) : out(out) {}

    void visit(const NumberNode& node) override {
        line() << "Number " << node.getValue() << '\n';
    }

    void visit(const UnaryNode& node) override {
        line() << "Unary " << (node.getOperator() == UnaryOperator::Negate ? "-" : "+") << '\n';
        ++depth;
        node.getOperand().accept(*this);
        --depth;
    }

    void visit(const BinaryNode& node) override {
        line() << "Binary " << binaryOperatorSymbol(node.getOperator()) << '\n';
        ++depth;
        node.getLeft().accept(*this);
        node.getRight().accept(*this);
        --depth;
    }

private:
    std::ostringstream& out;
    int depth = 0;

    std::ostringstream& line() {
        out << std::string(static_cast<std::size_t>(depth) * 2, ' ');
        return out;
    }
};
}

std::string dumpTree(const AstNode& root) {
    std::ostringstream out;
    AstPrinter printer(out);
    root.accept(printer);
    return out.str();
}

} // namespace exprcc
