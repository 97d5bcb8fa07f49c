#include "errors.hpp"

#include <algorithm>

namespace exprcc {

std::string formatDiagnostic(const std::string& source, const CompileError& error) {
    std::size_t position = std::min(error.position(), source.size());

    // Находим границы строки, в которой находится ошибка
    std::size_t lineStart = source.rfind('\n', position == 0 ? 0 : position - 1);
    lineStart = (lineStart == std::string::npos || lineStart >= position) ? 0 : lineStart + 1;
    std::size_t lineEnd = source.find('\n', position);
    if (lineEnd == std::string::npos) {
        lineEnd = source.size();
    }

    std::string result = source.substr(lineStart, lineEnd - lineStart);
    result += '\n';
    result.append(position - lineStart, ' ');
    result += "^ ";
    result += error.what();
    return result;
}

} // namespace exprcc
