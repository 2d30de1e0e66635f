#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "utils/status.h"

namespace quanta {
namespace query {

enum class TokenType {
    // Statement keywords
    FIND, FROM, NAVIGATE, MATCH, ADD, UPDATE, SET, REMOVE, CREATE, RECORD,
    GROUP, BY, HAVING, ORDER, ASC, DESC, LIMIT, OFFSET, AS, TO,
    BEGIN, COMMIT, TRANSACTION, EXPLAIN, PRIMARY, KEY, INDEXED,
    ALTER, COLUMN, INDEX, ON,

    // Storage classification keywords
    SCALAR, DOCUMENT, RELATION, METRIC,

    // Logical / predicate keywords
    AND, OR, NOT, IN, CONTAINS,

    // Literals
    IDENTIFIER, STRING, INTEGER, FLOAT, DATETIME, TRUE, FALSE, NULL_LITERAL,

    // Operators
    EQ,         // = or ==
    NEQ,        // != or <>
    LT, LTE, GT, GTE,
    PLUS, MINUS, STAR, SLASH, PERCENT,
    ARROW,      // ->

    // Delimiters
    DOT, COMMA, COLON, SEMICOLON, LPAREN, RPAREN, LBRACE, RBRACE, LBRACKET, RBRACKET,

    END_OF_FILE
};

const char* tokenTypeName(TokenType type);

struct Token {
    TokenType type;
    std::string lexeme;   // string literals: unescaped content; keywords: as written
    size_t position;      // 0-based byte offset into the query text
    size_t line;
    size_t column;

    Token(TokenType t, std::string v, size_t pos, size_t l, size_t c)
        : type(t), lexeme(std::move(v)), position(pos), line(l), column(c) {}
};

struct LexResult {
    Status status;
    std::vector<Token> tokens;   // always terminated by END_OF_FILE on success
};

/// Tokenizes QQL text. Whitespace and comments (`-- ...`, `/* ... */`) are discarded.
/// Each call starts from scratch; there is no resumable state.
class Lexer {
public:
    explicit Lexer(std::string input)
        : input_(std::move(input)) {}

    LexResult tokenize();

private:
    std::string input_;
    size_t pos_ = 0;
    size_t line_ = 1;
    size_t column_ = 1;

    char peek(size_t offset = 0) const {
        size_t p = pos_ + offset;
        return (p < input_.size()) ? input_[p] : '\0';
    }
    char advance();
    void reset();

    void skipWhitespaceAndComments();
    Token nextToken();
    Token readString(size_t start, size_t line, size_t col);
    Token readNumberOrDate(size_t start, size_t line, size_t col);
    Token readIdentifierOrKeyword(size_t start, size_t line, size_t col);
    Token readOperatorOrDelimiter(size_t start, size_t line, size_t col);
    bool looksLikeDate() const;
};

} // namespace query
} // namespace quanta
