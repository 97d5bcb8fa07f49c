#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace exprcc {

// Результат компиляции одной строки входного файла
struct CompilationRecord {
    std::size_t lineNumber = 0;         // Номер строки в исходном файле
    std::string expression;             // Исходный текст выражения
    std::string status;                 // success, lex-error, parse-error, io-error
    std::optional<std::int64_t> value;  // Значение выражения (если вычислимо)
    std::optional<int> exitStatus;      // Ожидаемый код завершения программы
    std::string listingPath;            // Куда записан листинг (если записан)
    std::string message;                // Сообщение об ошибке (если есть)
};

// Класс для записи отчёта пакетной компиляции в формате CSV.
// Двойные кавычки внутри полей заменяются одинарными.
class CsvWriter {
public:
    // Конструктор создаёт файл (перезаписывая его) и пишет заголовок
    explicit CsvWriter(std::filesystem::path targetPath);

    // Дописывает одну запись в конец файла
    void writeRecord(const CompilationRecord& record) const;

    // Дописывает пакет записей
    void write(const std::vector<CompilationRecord>& records) const;

    const std::filesystem::path& getPath() const { return path; }

private:
    std::filesystem::path path;

    void writeHeader() const;
};

} // namespace exprcc
