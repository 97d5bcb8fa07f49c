#pragma once

#include "csv_writer.hpp"
#include "thread_pool.hpp"

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace exprcc {

struct BatchSettings {
    std::filesystem::path inputPath;                   // Файл с выражениями, по одному на строку
    std::filesystem::path reportPath;                  // Куда писать CSV-отчёт
    std::optional<std::filesystem::path> listingsDir;  // Каталог для листингов line_<N>.s
    std::size_t threadCount = 1;
    std::size_t batchSize = 1000;   // Сколько futures собирается перед записью
};

struct BatchSummary {
    std::size_t total = 0;
    std::size_t compiled = 0;
    std::size_t failed = 0;
};

// Компилирует одну строку файла. Ошибки компиляции и записи листинга
// попадают в запись, а не выбрасываются наружу.
CompilationRecord compileLine(std::size_t lineNumber, const std::string& text,
                              const std::optional<std::filesystem::path>& listingsDir);

// Пакетная компиляция файла выражений на пуле потоков.
// Файл читается построчно, результаты пишутся в отчёт в порядке строк.
class BatchCompiler {
public:
    explicit BatchCompiler(BatchSettings settings);

    // completed увеличивается после каждой обработанной строки (для прогресс-бара)
    BatchSummary run(std::atomic<std::size_t>& completed);

private:
    BatchSettings settings;
};

} // namespace exprcc
