#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace exprcc {

enum class Mode {
    Compile,  // Листинг в stdout или в файл -o
    Tokens,   // --tokens: вывод токенов
    Ast,      // --ast: вывод дерева
    Eval,     // --eval: значение и код завершения
    Batch,    // batch: пакетная компиляция файла
    Generate, // generate: генерация файла выражений
    Help
};

// Размер сгенерированного выражения растёт экспоненциально с глубиной
constexpr std::size_t kMaxGeneratorDepth = 16;

// Параметры командной строки
struct Options {
    Mode mode = Mode::Compile;

    // Режимы компиляции одного выражения
    std::string expression;
    std::optional<std::filesystem::path> outputPath; // -o

    // batch
    std::filesystem::path inputPath;
    std::optional<std::filesystem::path> reportPath; // -o
    std::optional<std::filesystem::path> listingsDir; // -d
    std::size_t threadCount = 1;                      // -j

    // generate
    std::size_t expressionCount = 0;
    std::filesystem::path generatedPath;
    std::optional<std::uint32_t> seed; // --seed
    std::size_t maxDepth = 6;          // --depth
    double errorProbability = 0.05;    // --errors
};

// Ошибка в аргументах командной строки
class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Безопасный парсинг положительного числа из строки
std::size_t parseNumber(const std::string& value);

// Разбор аргументов (без имени программы).
// Выбрасывает UsageError при неизвестных параметрах или неверном числе аргументов.
Options parseOptions(const std::vector<std::string>& args);

// Текст справки
std::string usageText(std::string_view programName);

} // namespace exprcc
