#include "batch_compiler.hpp"

#include <fstream>
#include <future>
#include <stdexcept>

#include "codegen.hpp"
#include "errors.hpp"
#include "evaluator.hpp"
#include "file_utils.hpp"
#include "parser.hpp"

namespace exprcc {

namespace {
std::string describe(const CompileError& error) {
    return std::string(error.what()) + " (позиция " + std::to_string(error.position()) + ")";
}

void writeListingFile(const std::filesystem::path& path, const AssemblyListing& listing) {
    std::ofstream output(path, std::ios::trunc);
    if (!output.is_open()) {
        throw std::runtime_error("Не удалось создать файл: " + path.string());
    }
    writeListing(output, listing);
    if (!output) {
        throw std::runtime_error("Ошибка записи в файл: " + path.string());
    }
}
}

CompilationRecord compileLine(std::size_t lineNumber, const std::string& text,
                              const std::optional<std::filesystem::path>& listingsDir) {
    CompilationRecord record;
    record.lineNumber = lineNumber;
    record.expression = text;

    try {
        auto ast = parseSource(text);
        CodeGenerator generator;
        AssemblyListing listing = generator.generate(*ast);
        record.status = "success";

        // Эталонное значение: с ним должна завершиться скомпилированная программа
        try {
            std::int64_t value = ast->evaluate();
            record.value = value;
            record.exitStatus = exitStatusOf(value);
        } catch (const ArithmeticError& ex) {
            record.exitStatus = kDivisionByZeroExitStatus;
            record.message = ex.what();
        }

        if (listingsDir.has_value()) {
            auto path = *listingsDir / ("line_" + std::to_string(lineNumber) + ".s");
            // Ошибка записи одного листинга не должна прерывать весь пакет
            try {
                writeListingFile(path, listing);
                record.listingPath = path.string();
            } catch (const std::runtime_error& ex) {
                record.status = "io-error";
                record.message = ex.what();
            }
        }
    } catch (const LexError& ex) {
        record.status = "lex-error";
        record.message = describe(ex);
    } catch (const ParseError& ex) {
        record.status = "parse-error";
        record.message = describe(ex);
    }
    return record;
}

BatchCompiler::BatchCompiler(BatchSettings settings) : settings(std::move(settings)) {}

BatchSummary BatchCompiler::run(std::atomic<std::size_t>& completed) {
    std::ifstream input(settings.inputPath);
    if (!input.is_open()) {
        throw std::runtime_error("Не удалось открыть входной файл: " + settings.inputPath.string());
    }
    if (settings.listingsDir.has_value()) {
        ensureDirectory(*settings.listingsDir);
    }

    CsvWriter writer(settings.reportPath);
    ThreadPool pool(settings.threadCount);
    BatchSummary summary;

    std::vector<std::future<CompilationRecord>> futures;
    futures.reserve(settings.batchSize);

    // futures лежат в порядке строк, поэтому отчёт пишется в том же порядке
    auto flushFutures = [&]() {
        if (futures.empty()) return;

        std::vector<CompilationRecord> batch;
        batch.reserve(futures.size());
        for (auto& future : futures) {
            batch.push_back(future.get());
            if (batch.back().status == "success") {
                ++summary.compiled;
            } else {
                ++summary.failed;
            }
        }
        writer.write(batch);
        futures.clear();
    };

    const auto& listingsDir = settings.listingsDir;
    auto submit = [&](std::size_t lineNumber, std::string text) {
        futures.emplace_back(pool.enqueue(
            [lineNumber, text = std::move(text), &listingsDir, &completed]() {
                CompilationRecord record = compileLine(lineNumber, text, listingsDir);
                completed.fetch_add(1);
                return record;
            }));
        if (futures.size() >= settings.batchSize) {
            flushFutures();
        }
    };

    std::string line;
    std::size_t lineNumber = 0;
    while (std::getline(input, line)) {
        ++lineNumber;
        // Строки с \r\n из Windows-файлов
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        submit(lineNumber, std::move(line));
        line.clear();
    }

    flushFutures();
    summary.total = lineNumber;
    return summary;
}

} // namespace exprcc
