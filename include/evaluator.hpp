#pragma once

#include <cstdint>
#include <string>

namespace exprcc {

// Класс-фасад для вычисления выражений без генерации кода.
// Объединяет этапы токенизации, парсинга и вычисления AST.
// Используется как эталон: результат совпадает с тем, что вернёт
// скомпилированная программа.
class ExpressionEvaluator {
public:
    ExpressionEvaluator() = default;

    // Вычисляет значение выражения, заданного строкой.
    // Пример: "2 + 2 * 2" -> 6
    // Выбрасывает LexError, ParseError или ArithmeticError.
    std::int64_t evaluate(const std::string& expression) const;
};

// Код завершения процесса, который вернёт программа со значением value:
// младшие 8 бит (значение по модулю 256), -1 -> 255, 256 -> 0
int exitStatusOf(std::int64_t value);

} // namespace exprcc
