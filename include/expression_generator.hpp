// Генератор целочисленных выражений для тестирования компилятора.
// Поддерживает скобки, унарный минус и операции + - * /.
// С заданной вероятностью вносит ошибки (незакрытые скобки, лишние символы).
//

#pragma once

#include <cstdint>
#include <random>
#include <string>

namespace exprcc {

struct GeneratorSettings {
    std::uint32_t seed = std::random_device{}();
    double errorProbability = 0.05; // Вероятность внесения ошибки в подвыражение
};

class ExpressionGenerator {
public:
    explicit ExpressionGenerator(GeneratorSettings settings = {});

    // Строит выражение глубиной не больше depth.
    // При errorProbability == 0 результат всегда компилируется,
    // а делители всегда ненулевые литералы.
    std::string generate(int depth);

private:
    GeneratorSettings settings;
    std::mt19937 gen;
    std::uniform_int_distribution<int> numberDist{0, 99};
    std::uniform_int_distribution<int> divisorDist{1, 99};
    std::uniform_int_distribution<int> opDist{0, 3};
    std::uniform_int_distribution<int> typeRollDist{0, 19};
    std::uniform_int_distribution<int> errorTypeDist{0, 2};
    std::uniform_int_distribution<int> charDist{33, 126}; // Печатные символы без пробела
    std::uniform_real_distribution<double> errorDist{0.0, 1.0};

    std::string generateNumber();

    // Вносит ошибку в выражение с вероятностью settings.errorProbability
    std::string introduceError(std::string expr);
};

} // namespace exprcc
