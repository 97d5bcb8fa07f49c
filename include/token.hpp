#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace exprcc {

// Типы токенов, которые выдаёт лексер
enum class TokenType {
    Number,       // Целочисленный литерал
    Plus,         // +
    Minus,        // -
    Star,         // *
    Slash,        // /
    LParen,       // (
    RParen,       // )
    Equal,        // ==
    NotEqual,     // !=
    Less,         // <
    LessEqual,    // <=
    Greater,      // >
    GreaterEqual, // >=
    End           // Маркер конца входа
};

// Токен: тип, значение (для чисел), исходный текст и позиция в строке
struct Token {
    TokenType type;
    std::int64_t numericValue = 0;
    std::string text;
    std::size_t position = 0;
};

// Имя типа токена для отладочного вывода (--tokens)
std::string_view tokenTypeName(TokenType type);

} // namespace exprcc
