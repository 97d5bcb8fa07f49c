#include "expression_generator.hpp"

namespace exprcc {

namespace {
constexpr char kOperations[] = {'+', '-', '*', '/'};
}

ExpressionGenerator::ExpressionGenerator(GeneratorSettings settings)
    : settings(settings), gen(settings.seed) {}

std::string ExpressionGenerator::generate(int depth) {
    // Базовый случай: при нулевой глубине всегда возвращаем число
    if (depth <= 0) {
        return generateNumber();
    }

    // 0-15 бинарная операция (80%), 16-17 унарный минус (10%), 18-19 просто число (10%)
    int typeRoll = typeRollDist(gen);

    if (typeRoll < 16) {
        char op = kOperations[opDist(gen)];
        std::string left = generate(depth - 1);
        // Делитель всегда ненулевой литерал, чтобы не получить деление на ноль
        std::string right = op == '/' ? std::to_string(divisorDist(gen)) : generate(depth - 1);

        std::string result;
        result.reserve(left.size() + right.size() + 5);
        result.append("(");
        result.append(left);
        result.append(" ");
        result.append(1, op);
        result.append(" ");
        result.append(right);
        result.append(")");
        return introduceError(std::move(result));
    }
    if (typeRoll < 18) {
        return introduceError("-(" + generate(depth - 1) + ")");
    }
    return generateNumber();
}

std::string ExpressionGenerator::generateNumber() {
    return std::to_string(numberDist(gen));
}

std::string ExpressionGenerator::introduceError(std::string expr) {
    if (settings.errorProbability <= 0.0 || errorDist(gen) >= settings.errorProbability) {
        return expr;
    }

    switch (errorTypeDist(gen)) {
    case 0: // Незакрытая скобка: убираем последнюю закрывающую
        {
            auto pos = expr.rfind(')');
            if (pos != std::string::npos) {
                expr.erase(pos, 1);
            }
            return expr;
        }
    case 1: // Лишний символ в середине выражения
        if (expr.size() > 2) {
            expr.insert(expr.size() / 2, 1, static_cast<char>(charDist(gen)));
        }
        return expr;
    default: // Открывающая скобка без закрывающей в начале выражения
        return "(" + expr;
    }
}

} // namespace exprcc
