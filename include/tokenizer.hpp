#pragma once

#include <string>
#include <vector>

#include "token.hpp"

namespace exprcc {

// Класс лексического анализатора (лексера)
// Преобразует входную строку с выражением в последовательность токенов.
// Игнорирует пробельные символы.
class Tokenizer {
public:
    // Конструктор принимает исходную строку выражения
    explicit Tokenizer(std::string sourceText);

    // Основной метод запуска токенизации
    // Возвращает вектор токенов, заканчивающийся ровно одним токеном End
    // Выбрасывает LexError при обнаружении неизвестных символов
    std::vector<Token> tokenize();

private:
    const std::string source; // Исходная строка
    std::size_t index = 0;    // Текущая позиция чтения

    bool isAtEnd() const;

    // Возвращает текущий символ без продвижения вперед
    char peek() const;

    // Возвращает символ после текущего ('\0' за концом строки)
    char peekNext() const;

    // Возвращает текущий символ и сдвигает указатель вперед
    char advance();

    // Пропускает пробелы, табуляции и переводы строк
    void skipWhitespace();

    // Считывает неотрицательное целое число
    Token makeNumber();

    // Создаёт токен оператора длиной length и сдвигает указатель
    Token makeOperator(TokenType type, std::size_t length);
};

} // namespace exprcc
