#include "tokenizer.hpp"

#include <cctype>
#include <limits>

#include "errors.hpp"

namespace exprcc {

std::string_view tokenTypeName(TokenType type) {
    switch (type) {
    case TokenType::Number:
        return "Number";
    case TokenType::Plus:
        return "Plus";
    case TokenType::Minus:
        return "Minus";
    case TokenType::Star:
        return "Star";
    case TokenType::Slash:
        return "Slash";
    case TokenType::LParen:
        return "LParen";
    case TokenType::RParen:
        return "RParen";
    case TokenType::Equal:
        return "Equal";
    case TokenType::NotEqual:
        return "NotEqual";
    case TokenType::Less:
        return "Less";
    case TokenType::LessEqual:
        return "LessEqual";
    case TokenType::Greater:
        return "Greater";
    case TokenType::GreaterEqual:
        return "GreaterEqual";
    case TokenType::End:
        return "End";
    }
    return "Unknown";
}

Tokenizer::Tokenizer(std::string sourceText) : source(std::move(sourceText)) {}

// Основной цикл разбора: проходит по строке и выделяет токены
std::vector<Token> Tokenizer::tokenize() {
    std::vector<Token> tokens;
    while (!isAtEnd()) {
        skipWhitespace();
        if (isAtEnd()) {
            break;
        }

        char ch = peek();
        switch (ch) {
        // Односимвольные токены
        case '+':
            tokens.push_back(makeOperator(TokenType::Plus, 1));
            break;
        case '-':
            tokens.push_back(makeOperator(TokenType::Minus, 1));
            break;
        case '*':
            tokens.push_back(makeOperator(TokenType::Star, 1));
            break;
        case '/':
            tokens.push_back(makeOperator(TokenType::Slash, 1));
            break;
        case '(':
            tokens.push_back(makeOperator(TokenType::LParen, 1));
            break;
        case ')':
            tokens.push_back(makeOperator(TokenType::RParen, 1));
            break;
        // Операторы сравнения: сначала двухсимвольные варианты
        case '<':
            if (peekNext() == '=') {
                tokens.push_back(makeOperator(TokenType::LessEqual, 2));
            } else {
                tokens.push_back(makeOperator(TokenType::Less, 1));
            }
            break;
        case '>':
            if (peekNext() == '=') {
                tokens.push_back(makeOperator(TokenType::GreaterEqual, 2));
            } else {
                tokens.push_back(makeOperator(TokenType::Greater, 1));
            }
            break;
        case '=':
            if (peekNext() != '=') {
                throw LexError(LexErrorKind::UnexpectedCharacter,
                               "Одиночный '=' недопустим, ожидалось '=='", index);
            }
            tokens.push_back(makeOperator(TokenType::Equal, 2));
            break;
        case '!':
            if (peekNext() != '=') {
                throw LexError(LexErrorKind::UnexpectedCharacter,
                               "Одиночный '!' недопустим, ожидалось '!='", index);
            }
            tokens.push_back(makeOperator(TokenType::NotEqual, 2));
            break;
        default:
            if (std::isdigit(static_cast<unsigned char>(ch))) {
                tokens.push_back(makeNumber());
            } else {
                throw LexError(LexErrorKind::UnexpectedCharacter,
                               std::string("Недопустимый символ '") + ch + "'", index);
            }
            break;
        }
    }

    tokens.push_back({TokenType::End, 0, "", index});
    return tokens;
}

bool Tokenizer::isAtEnd() const {
    return index >= source.size();
}

char Tokenizer::peek() const {
    return source[index];
}

char Tokenizer::peekNext() const {
    return index + 1 < source.size() ? source[index + 1] : '\0';
}

char Tokenizer::advance() {
    return source[index++];
}

// Пропуск всех незначащих символов
void Tokenizer::skipWhitespace() {
    while (!isAtEnd() && std::isspace(static_cast<unsigned char>(peek()))) {
        advance();
    }
}

// Разбор числового литерала. Знак здесь не обрабатывается:
// унарный минус разбирается парсером.
Token Tokenizer::makeNumber() {
    constexpr std::int64_t kMax = std::numeric_limits<std::int64_t>::max();

    std::size_t start = index;
    std::int64_t value = 0;
    bool overflow = false;
    while (!isAtEnd() && std::isdigit(static_cast<unsigned char>(peek()))) {
        int digit = advance() - '0';
        if (value > (kMax - digit) / 10) {
            overflow = true;
        } else {
            value = value * 10 + digit;
        }
    }

    std::string text = source.substr(start, index - start);
    if (overflow) {
        throw LexError(LexErrorKind::NumberOutOfRange,
                       "Число " + text + " не помещается в 64-битное целое", start);
    }
    return {TokenType::Number, value, text, start};
}

Token Tokenizer::makeOperator(TokenType type, std::size_t length) {
    Token token{type, 0, source.substr(index, length), index};
    index += length;
    return token;
}

} // namespace exprcc
