#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "ast_printer.hpp"
#include "batch_compiler.hpp"
#include "compiler.hpp"
#include "console.hpp"
#include "errors.hpp"
#include "evaluator.hpp"
#include "expression_generator.hpp"
#include "file_utils.hpp"
#include "options.hpp"
#include "parser.hpp"
#include "progress_bar.hpp"
#include "tokenizer.hpp"

namespace {

// Коды завершения компилятора
constexpr int kExitSuccess = 0;
constexpr int kExitUsage = 1;
constexpr int kExitLexError = 2;
constexpr int kExitParseError = 3;
constexpr int kExitArithmeticError = 4;

// Диагностика выводится отдельными строками, чтобы стрелка стояла под нужным символом
void reportCompileError(const std::string& kind, const std::string& source,
                        const exprcc::CompileError& error) {
    std::cerr << Color::RED << Color::BOLD << "✗ " << kind << ":" << Color::RESET << "\n"
              << exprcc::formatDiagnostic(source, error) << "\n";
}

// Листинг сначала строится целиком, и только потом записывается,
// чтобы при ошибке не оставить частичный вывод
int runCompile(const exprcc::Options& options) {
    exprcc::ExpressionCompiler compiler;
    exprcc::AssemblyListing listing = compiler.compile(options.expression);

    if (options.outputPath.has_value()) {
        std::ofstream output(*options.outputPath, std::ios::trunc);
        if (!output.is_open()) {
            throw std::runtime_error("Не удалось создать файл: " + options.outputPath->string());
        }
        exprcc::writeListing(output, listing);
        if (!output) {
            throw std::runtime_error("Ошибка записи в файл: " + options.outputPath->string());
        }
    } else {
        exprcc::writeListing(std::cout, listing);
    }
    return kExitSuccess;
}

int runTokens(const exprcc::Options& options) {
    exprcc::Tokenizer tokenizer(options.expression);
    for (const auto& token : tokenizer.tokenize()) {
        std::cout << token.position << ' ' << exprcc::tokenTypeName(token.type);
        if (!token.text.empty()) {
            std::cout << ' ' << token.text;
        }
        std::cout << '\n';
    }
    return kExitSuccess;
}

int runAst(const exprcc::Options& options) {
    auto ast = exprcc::parseSource(options.expression);
    std::cout << exprcc::dumpTree(*ast);
    return kExitSuccess;
}

int runEval(const exprcc::Options& options) {
    exprcc::ExpressionEvaluator evaluator;
    std::int64_t value = evaluator.evaluate(options.expression);
    std::cout << "value: " << value << '\n'
              << "exit status: " << exprcc::exitStatusOf(value) << '\n';
    return kExitSuccess;
}

int runBatch(const exprcc::Options& options) {
    printHeader(std::cout);

    exprcc::BatchSettings settings;
    settings.inputPath = options.inputPath;
    settings.reportPath = options.reportPath.value_or(
        options.inputPath.parent_path() /
        (options.inputPath.stem().string() + "_" + getCurrentTimeString() + ".csv"));
    settings.listingsDir = options.listingsDir;
    settings.threadCount = options.threadCount;

    std::cout << Color::BOLD << "Конфигурация:\n" << Color::RESET;
    std::cout << "  Входной файл:  " << Color::YELLOW << settings.inputPath << Color::RESET << "\n";
    std::cout << "  Отчёт:         " << Color::YELLOW << settings.reportPath << Color::RESET << "\n";
    if (settings.listingsDir.has_value()) {
        std::cout << "  Листинги:      " << Color::YELLOW << *settings.listingsDir << Color::RESET << "\n";
    }
    std::cout << "  Потоков:       " << Color::CYAN << settings.threadCount << Color::RESET << "\n\n";

    std::size_t totalLines = countLinesInFile(settings.inputPath);

    std::cout << Color::BOLD << "Компиляция выражений:\n" << Color::RESET;
    auto start = std::chrono::steady_clock::now();

    std::atomic<std::size_t> completed{0};
    std::thread progressThread(displayProgress, std::ref(std::cout), std::cref(completed), totalLines);

    exprcc::BatchSummary summary;
    try {
        exprcc::BatchCompiler batch(std::move(settings));
        summary = batch.run(completed);
    } catch (const std::exception&) {
        // Прогресс-бар ждёт totalLines, иначе join() не вернётся
        completed.store(totalLines);
        progressThread.join();
        throw;
    }
    completed.store(totalLines);
    progressThread.join();

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    std::cout << "\n" << Color::BOLD << "Статистика:\n" << Color::RESET;
    std::cout << "  Всего выражений:  " << Color::CYAN << summary.total << Color::RESET << "\n";
    std::cout << "  Скомпилировано:   " << Color::GREEN << summary.compiled << Color::RESET << "\n";
    if (summary.failed > 0) {
        std::cout << "  Ошибок:           " << Color::RED << summary.failed << Color::RESET << "\n";
    }
    std::cout << "  Время обработки:  " << Color::MAGENTA << duration.count() << " мс" << Color::RESET
              << "\n\n";
    return kExitSuccess;
}

int runGenerate(const exprcc::Options& options) {
    printHeader(std::cout);

    exprcc::GeneratorSettings settings;
    if (options.seed.has_value()) {
        settings.seed = *options.seed;
    }
    settings.errorProbability = options.errorProbability;

    std::ofstream output(options.generatedPath, std::ios::trunc);
    if (!output.is_open()) {
        throw std::runtime_error("Не удалось создать файл: " + options.generatedPath.string());
    }

    std::cout << Color::BOLD << "Генерация выражений..." << Color::RESET << std::flush;
    exprcc::ExpressionGenerator generator(settings);
    auto depthRange = options.maxDepth;
    for (std::size_t i = 0; i < options.expressionCount; ++i) {
        // Глубина меняется от 1 до maxDepth, чтобы в файле были и короткие, и длинные выражения
        int depth = static_cast<int>(1 + i % depthRange);
        output << generator.generate(depth) << "\n";
    }
    if (!output) {
        throw std::runtime_error("Ошибка записи в файл: " + options.generatedPath.string());
    }

    std::cout << " " << Color::GREEN << "✓" << Color::RESET << " (" << options.expressionCount
              << " выражений, seed " << settings.seed << ")\n";
    std::cout << Color::GREEN << "Файл успешно создан: " << options.generatedPath << Color::RESET
              << "\n\n";
    return kExitSuccess;
}

int dispatch(const exprcc::Options& options, const std::string& programName) {
    switch (options.mode) {
    case exprcc::Mode::Compile:
        return runCompile(options);
    case exprcc::Mode::Tokens:
        return runTokens(options);
    case exprcc::Mode::Ast:
        return runAst(options);
    case exprcc::Mode::Eval:
        return runEval(options);
    case exprcc::Mode::Batch:
        return runBatch(options);
    case exprcc::Mode::Generate:
        return runGenerate(options);
    case exprcc::Mode::Help:
        std::cout << exprcc::usageText(programName);
        return kExitSuccess;
    }
    return kExitUsage;
}

} // namespace

// Точка входа в программу
int main(int argc, char** argv) {
    std::string programName = argc > 0 ? std::filesystem::path(argv[0]).filename().string() : "exprcc";
    std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

    exprcc::Options options;
    try {
        options = exprcc::parseOptions(args);
    }
    catch (const exprcc::UsageError& ex) {
        printError(std::cerr, ex.what());
        std::cerr << exprcc::usageText(programName);
        return kExitUsage;
    }

    try {
        return dispatch(options, programName);
    }
    catch (const exprcc::LexError& ex) {
        reportCompileError("Лексическая ошибка", options.expression, ex);
        return kExitLexError;
    }
    catch (const exprcc::ParseError& ex) {
        reportCompileError("Синтаксическая ошибка", options.expression, ex);
        return kExitParseError;
    }
    catch (const exprcc::ArithmeticError& ex) {
        printError(std::cerr, ex.what());
        return kExitArithmeticError;
    }
    catch (const std::exception& ex) {
        printError(std::cerr, ex.what());
        return kExitUsage;
    }
}
