#include "console.hpp"

#include <string>

void printHeader(std::ostream& out) {
    out << Color::BOLD << Color::CYAN;
    out << "\n╔═══════════════════════════════════════════════════════════╗\n";
    out << "║    exprcc: компилятор арифметических выражений в x86-64   ║\n";
    out << "╚═══════════════════════════════════════════════════════════╝\n";
    out << Color::RESET << "\n";
}

void printError(std::ostream& out, const std::string& message) {
    out << Color::RED << Color::BOLD << "✗ Ошибка: " << Color::RESET << Color::RED << message
        << Color::RESET << "\n";
}
