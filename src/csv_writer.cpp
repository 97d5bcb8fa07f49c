#include "csv_writer.hpp"

#include <fstream>
#include <stdexcept>

namespace exprcc {

namespace {
// Поле в кавычках; кавычки внутри заменяются на одинарные
std::string quoted(std::string text) {
    for (char& ch : text) {
        if (ch == '"') {
            ch = '\'';
        }
    }
    return '"' + text + '"';
}

void writeLine(std::ofstream& stream, const CompilationRecord& record) {
    stream << record.lineNumber << ',' << quoted(record.expression) << ',' << record.status << ',';
    if (record.value.has_value()) {
        stream << *record.value;
    }
    stream << ',';
    if (record.exitStatus.has_value()) {
        stream << *record.exitStatus;
    }
    stream << ',' << quoted(record.listingPath) << ',' << quoted(record.message) << '\n';
}

std::ofstream openForAppend(const std::filesystem::path& path) {
    std::ofstream stream(path, std::ios::app);
    if (!stream.is_open()) {
        throw std::runtime_error("Не удалось открыть файл для записи CSV: " + path.string());
    }
    return stream;
}
}

CsvWriter::CsvWriter(std::filesystem::path targetPath) : path(std::move(targetPath)) {
    writeHeader();
}

void CsvWriter::writeHeader() const {
    std::ofstream stream(path, std::ios::trunc);
    if (!stream.is_open()) {
        throw std::runtime_error("Не удалось открыть файл для записи CSV: " + path.string());
    }
    stream << "line,expression,status,value,exit_status,listing,message\n";
}

void CsvWriter::writeRecord(const CompilationRecord& record) const {
    auto stream = openForAppend(path);
    writeLine(stream, record);
}

void CsvWriter::write(const std::vector<CompilationRecord>& records) const {
    auto stream = openForAppend(path);
    for (const auto& record : records) {
        writeLine(stream, record);
    }
}

} // namespace exprcc
