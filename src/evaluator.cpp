#include "evaluator.hpp"

#include "parser.hpp"

namespace exprcc {

// Полный цикл обработки выражения:
// 1. Токенизация и парсинг -> построение AST
// 2. Вычисление (evaluate) -> получение числового результата
std::int64_t ExpressionEvaluator::evaluate(const std::string& expression) const {
    auto ast = parseSource(expression);
    return ast->evaluate();
}

int exitStatusOf(std::int64_t value) {
    return static_cast<int>(static_cast<std::uint64_t>(value) & 0xFFu);
}

} // namespace exprcc
