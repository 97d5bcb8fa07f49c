#include "parser.hpp"

#include "tokenizer.hpp"

namespace exprcc {

namespace {
std::string describe(const Token& token) {
    if (token.type == TokenType::End) {
        return "конец выражения";
    }
    return "'" + token.text + "'";
}
}

Parser::Parser(std::vector<Token> tokens) : tokens(std::move(tokens)) {}

// Запуск процесса парсинга
// Ожидает, что всё выражение будет полностью разобрано
std::unique_ptr<AstNode> Parser::parse() {
    current = 0;
    nesting = 0;
    auto exprNode = parseEquality();
    if (!isAtEnd()) {
        throw ParseError(ParseErrorKind::TrailingInput,
                         "Лишний токен " + describe(peek()) + " после конца выражения",
                         peek().position);
    }
    return exprNode;
}

const Token& Parser::peek() const {
    return tokens[current];
}

bool Parser::match(TokenType type) {
    if (!isAtEnd() && tokens[current].type == type) {
        ++current;
        return true;
    }
    return false;
}

const Token& Parser::consume(TokenType type, ParseErrorKind kind, const std::string& errorMessage) {
    if (match(type)) {
        return tokens[current - 1];
    }
    throw ParseError(kind, errorMessage + ", получено " + describe(peek()), peek().position);
}

bool Parser::isAtEnd() const {
    return peek().type == TokenType::End;
}

const Token& Parser::previous() const {
    return tokens[current - 1];
}

void Parser::enterNested(const Token& token) {
    if (++nesting > kMaxNestingDepth) {
        throw ParseError(ParseErrorKind::NestingTooDeep,
                         "Вложенность больше " + std::to_string(kMaxNestingDepth) + " уровней",
                         token.position);
    }
}

void Parser::leaveNested() {
    --nesting;
}

std::unique_ptr<AstNode> Parser::makeBinary(BinaryOperator op, std::unique_ptr<AstNode> left,
                                            std::unique_ptr<AstNode> right, const Token& opToken) {
    auto node = std::make_unique<BinaryNode>(op, std::move(left), std::move(right));
    if (node->depth() > kMaxTreeDepth) {
        throw ParseError(ParseErrorKind::NestingTooDeep,
                         "Выражение глубже " + std::to_string(kMaxTreeDepth) + " уровней",
                         opToken.position);
    }
    return node;
}

// Грамматика: Equality -> Relational { ("==" | "!=") Relational }
std::unique_ptr<AstNode> Parser::parseEquality() {
    auto node = parseRelational();
    while (true) {
        if (match(TokenType::Equal)) {
            const Token& opToken = previous();
            auto right = parseRelational();
            node = makeBinary(BinaryOperator::Equal, std::move(node), std::move(right), opToken);
        } else if (match(TokenType::NotEqual)) {
            const Token& opToken = previous();
            auto right = parseRelational();
            node = makeBinary(BinaryOperator::NotEqual, std::move(node), std::move(right), opToken);
        } else {
            break;
        }
    }
    return node;
}

// Грамматика: Relational -> Expression { ("<" | "<=" | ">" | ">=") Expression }
std::unique_ptr<AstNode> Parser::parseRelational() {
    auto node = parseExpression();
    while (true) {
        BinaryOperator op;
        if (match(TokenType::Less)) {
            op = BinaryOperator::Less;
        } else if (match(TokenType::LessEqual)) {
            op = BinaryOperator::LessEqual;
        } else if (match(TokenType::Greater)) {
            op = BinaryOperator::Greater;
        } else if (match(TokenType::GreaterEqual)) {
            op = BinaryOperator::GreaterEqual;
        } else {
            break;
        }
        const Token& opToken = previous();
        auto right = parseExpression();
        node = makeBinary(op, std::move(node), std::move(right), opToken);
    }
    return node;
}

// Грамматика: Expression -> Term { ("+" | "-") Term }
// Цепочка строится влево: 20-9+10 == (20-9)+10
std::unique_ptr<AstNode> Parser::parseExpression() {
    auto node = parseTerm();
    while (true) {
        if (match(TokenType::Plus)) {
            const Token& opToken = previous();
            auto right = parseTerm();
            node = makeBinary(BinaryOperator::Add, std::move(node), std::move(right), opToken);
        } else if (match(TokenType::Minus)) {
            const Token& opToken = previous();
            auto right = parseTerm();
            node = makeBinary(BinaryOperator::Subtract, std::move(node), std::move(right), opToken);
        } else {
            break;
        }
    }
    return node;
}

// Грамматика: Term -> Unary { ("*" | "/") Unary }
std::unique_ptr<AstNode> Parser::parseTerm() {
    auto node = parseUnary();
    while (true) {
        if (match(TokenType::Star)) {
            const Token& opToken = previous();
            auto right = parseUnary();
            node = makeBinary(BinaryOperator::Multiply, std::move(node), std::move(right), opToken);
        } else if (match(TokenType::Slash)) {
            const Token& opToken = previous();
            auto right = parseUnary();
            node = makeBinary(BinaryOperator::Divide, std::move(node), std::move(right), opToken);
        } else {
            break;
        }
    }
    return node;
}

// Грамматика: Unary -> ("+" | "-") Unary | Factor
std::unique_ptr<AstNode> Parser::parseUnary() {
    UnaryOperator op;
    if (match(TokenType::Plus)) {
        op = UnaryOperator::Plus;
    } else if (match(TokenType::Minus)) {
        op = UnaryOperator::Negate;
    } else {
        return parseFactor();
    }

    // Унарные операции вкладываются рекурсивно, как и скобки
    enterNested(previous());
    auto operand = parseUnary();
    leaveNested();
    return std::make_unique<UnaryNode>(op, std::move(operand));
}

// Грамматика: Factor -> Number | "(" Equality ")"
std::unique_ptr<AstNode> Parser::parseFactor() {
    if (match(TokenType::Number)) {
        const auto& token = tokens[current - 1];
        return std::make_unique<NumberNode>(token.numericValue);
    }

    // Группировка скобками
    if (match(TokenType::LParen)) {
        enterNested(previous());
        auto node = parseEquality();
        consume(TokenType::RParen, ParseErrorKind::UnclosedParen, "Ожидалась закрывающая скобка");
        leaveNested();
        return node;
    }

    throw ParseError(ParseErrorKind::ExpectedFactor,
                     "Ожидалось число или '(', получено " + describe(peek()),
                     peek().position);
}

std::unique_ptr<AstNode> parseSource(const std::string& source) {
    Tokenizer tokenizer(source);
    Parser parser(tokenizer.tokenize());
    return parser.parse();
}

} // namespace exprcc
