#pragma once

#include <memory>
#include <string>
#include <vector>

#include "ast.hpp"
#include "errors.hpp"
#include "token.hpp"

namespace exprcc {

// Предел вложенности скобок и унарных операций: парсер спускается рекурсивно
constexpr std::size_t kMaxNestingDepth = 1000;

// Предел высоты дерева. Длинная цепочка 1+1+...+1 даёт глубокое левое дерево,
// а генератор кода, вычислитель и деструкторы обходят его рекурсивно.
constexpr std::size_t kMaxTreeDepth = 10000;

// Класс синтаксического анализатора (парсера)
// Строит Абстрактное Синтаксическое Дерево (AST) из списка токенов.
// Реализует алгоритм рекурсивного спуска. Позиция чтения хранится в самом
// экземпляре, поэтому разные парсеры независимы друг от друга.
class Parser {
public:
    // Конструктор принимает список токенов от лексера
    explicit Parser(std::vector<Token> tokens);

    // Основной метод запуска парсинга
    // Возвращает указатель на корневой узел AST
    // Выбрасывает ParseError при синтаксических ошибках
    std::unique_ptr<AstNode> parse();

private:
    const std::vector<Token> tokens; // Список токенов
    std::size_t current = 0;         // Индекс текущего токена
    std::size_t nesting = 0;         // Текущая глубина скобок и унарных операций

    // Возвращает текущий токен без продвижения
    const Token& peek() const;

    // Проверяет, соответствует ли текущий токен ожидаемому типу.
    // Если да — сдвигает указатель и возвращает true.
    bool match(TokenType type);

    // Ожидает токен определенного типа.
    // Если тип совпадает — возвращает токен и сдвигает указатель.
    // Если нет — выбрасывает ParseError вида kind с текстом errorMessage.
    const Token& consume(TokenType type, ParseErrorKind kind, const std::string& errorMessage);

    bool isAtEnd() const;

    // Последний поглощённый токен
    const Token& previous() const;

    // Вход во вложенную конструкцию, открытую токеном token.
    // При превышении kMaxNestingDepth выбрасывает ParseError(NestingTooDeep).
    void enterNested(const Token& token);
    void leaveNested();

    // Строит бинарный узел и проверяет высоту дерева
    std::unique_ptr<AstNode> makeBinary(BinaryOperator op, std::unique_ptr<AstNode> left,
                                        std::unique_ptr<AstNode> right, const Token& opToken);

    // --- Методы рекурсивного спуска (от низкого приоритета к высокому) ---

    // Разбор сравнения на равенство (==, !=)
    std::unique_ptr<AstNode> parseEquality();

    // Разбор отношения (<, <=, >, >=)
    std::unique_ptr<AstNode> parseRelational();

    // Разбор выражения (сложение/вычитание)
    std::unique_ptr<AstNode> parseExpression();

    // Разбор слагаемого (умножение/деление)
    std::unique_ptr<AstNode> parseTerm();

    // Разбор унарного оператора
    std::unique_ptr<AstNode> parseUnary();

    // Разбор множителя (число или выражение в скобках)
    std::unique_ptr<AstNode> parseFactor();
};

// Лексический и синтаксический анализ строки целиком
std::unique_ptr<AstNode> parseSource(const std::string& source);

} // namespace exprcc
