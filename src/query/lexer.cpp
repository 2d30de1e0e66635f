#include "query/lexer.h"
#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace quanta {
namespace query {

namespace {

bool isDigit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }
bool isIdentStart(char c) { return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_'; }
bool isIdentChar(char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_'; }

const std::unordered_map<std::string, TokenType>& keywords() {
    static const std::unordered_map<std::string, TokenType> table = {
        {"find", TokenType::FIND}, {"from", TokenType::FROM}, {"navigate", TokenType::NAVIGATE},
        {"match", TokenType::MATCH}, {"add", TokenType::ADD}, {"update", TokenType::UPDATE},
        {"set", TokenType::SET}, {"remove", TokenType::REMOVE}, {"create", TokenType::CREATE},
        {"record", TokenType::RECORD}, {"group", TokenType::GROUP}, {"by", TokenType::BY},
        {"having", TokenType::HAVING}, {"order", TokenType::ORDER}, {"asc", TokenType::ASC},
        {"desc", TokenType::DESC}, {"limit", TokenType::LIMIT}, {"offset", TokenType::OFFSET},
        {"as", TokenType::AS}, {"to", TokenType::TO}, {"begin", TokenType::BEGIN},
        {"commit", TokenType::COMMIT}, {"transaction", TokenType::TRANSACTION},
        {"explain", TokenType::EXPLAIN}, {"primary", TokenType::PRIMARY}, {"key", TokenType::KEY},
        {"indexed", TokenType::INDEXED}, {"alter", TokenType::ALTER}, {"column", TokenType::COLUMN},
        {"index", TokenType::INDEX}, {"on", TokenType::ON},
        {"scalar", TokenType::SCALAR}, {"document", TokenType::DOCUMENT},
        {"relation", TokenType::RELATION}, {"metric", TokenType::METRIC},
        {"and", TokenType::AND}, {"or", TokenType::OR}, {"not", TokenType::NOT},
        {"in", TokenType::IN}, {"contains", TokenType::CONTAINS},
        {"true", TokenType::TRUE}, {"false", TokenType::FALSE}, {"null", TokenType::NULL_LITERAL},
    };
    return table;
}

} // namespace

const char* tokenTypeName(TokenType type) {
    switch (type) {
        case TokenType::FIND: return "FIND";
        case TokenType::FROM: return "FROM";
        case TokenType::NAVIGATE: return "NAVIGATE";
        case TokenType::MATCH: return "MATCH";
        case TokenType::ADD: return "ADD";
        case TokenType::UPDATE: return "UPDATE";
        case TokenType::SET: return "SET";
        case TokenType::REMOVE: return "REMOVE";
        case TokenType::CREATE: return "CREATE";
        case TokenType::RECORD: return "RECORD";
        case TokenType::GROUP: return "GROUP";
        case TokenType::BY: return "BY";
        case TokenType::HAVING: return "HAVING";
        case TokenType::ORDER: return "ORDER";
        case TokenType::ASC: return "ASC";
        case TokenType::DESC: return "DESC";
        case TokenType::LIMIT: return "LIMIT";
        case TokenType::OFFSET: return "OFFSET";
        case TokenType::AS: return "AS";
        case TokenType::TO: return "TO";
        case TokenType::BEGIN: return "BEGIN";
        case TokenType::COMMIT: return "COMMIT";
        case TokenType::TRANSACTION: return "TRANSACTION";
        case TokenType::EXPLAIN: return "EXPLAIN";
        case TokenType::PRIMARY: return "PRIMARY";
        case TokenType::KEY: return "KEY";
        case TokenType::INDEXED: return "INDEXED";
        case TokenType::ALTER: return "ALTER";
        case TokenType::COLUMN: return "COLUMN";
        case TokenType::INDEX: return "INDEX";
        case TokenType::ON: return "ON";
        case TokenType::SCALAR: return "SCALAR";
        case TokenType::DOCUMENT: return "DOCUMENT";
        case TokenType::RELATION: return "RELATION";
        case TokenType::METRIC: return "METRIC";
        case TokenType::AND: return "AND";
        case TokenType::OR: return "OR";
        case TokenType::NOT: return "NOT";
        case TokenType::IN: return "IN";
        case TokenType::CONTAINS: return "CONTAINS";
        case TokenType::IDENTIFIER: return "identifier";
        case TokenType::STRING: return "string literal";
        case TokenType::INTEGER: return "integer literal";
        case TokenType::FLOAT: return "number literal";
        case TokenType::DATETIME: return "date-time literal";
        case TokenType::TRUE: return "TRUE";
        case TokenType::FALSE: return "FALSE";
        case TokenType::NULL_LITERAL: return "NULL";
        case TokenType::EQ: return "'='";
        case TokenType::NEQ: return "'!='";
        case TokenType::LT: return "'<'";
        case TokenType::LTE: return "'<='";
        case TokenType::GT: return "'>'";
        case TokenType::GTE: return "'>='";
        case TokenType::PLUS: return "'+'";
        case TokenType::MINUS: return "'-'";
        case TokenType::STAR: return "'*'";
        case TokenType::SLASH: return "'/'";
        case TokenType::PERCENT: return "'%'";
        case TokenType::ARROW: return "'->'";
        case TokenType::DOT: return "'.'";
        case TokenType::COMMA: return "','";
        case TokenType::COLON: return "':'";
        case TokenType::SEMICOLON: return "';'";
        case TokenType::LPAREN: return "'('";
        case TokenType::RPAREN: return "')'";
        case TokenType::LBRACE: return "'{'";
        case TokenType::RBRACE: return "'}'";
        case TokenType::LBRACKET: return "'['";
        case TokenType::RBRACKET: return "']'";
        case TokenType::END_OF_FILE: return "end of input";
    }
    return "token";
}

void Lexer::reset() {
    pos_ = 0;
    line_ = 1;
    column_ = 1;
}

char Lexer::advance() {
    if (pos_ >= input_.size()) return '\0';
    char ch = input_[pos_++];
    if (ch == '\n') {
        line_++;
        column_ = 1;
    } else {
        column_++;
    }
    return ch;
}

LexResult Lexer::tokenize() {
    reset();
    LexResult result;
    try {
        while (true) {
            skipWhitespaceAndComments();
            if (pos_ >= input_.size()) break;
            result.tokens.push_back(nextToken());
        }
        result.tokens.emplace_back(TokenType::END_OF_FILE, "", pos_, line_, column_);
    } catch (const StatusError& e) {
        result.status = e.status();
        result.tokens.clear();
    }
    return result;
}

void Lexer::skipWhitespaceAndComments() {
    while (pos_ < input_.size()) {
        char ch = peek();
        if (std::isspace(static_cast<unsigned char>(ch))) {
            advance();
        } else if (ch == '-' && peek(1) == '-') {
            while (pos_ < input_.size() && peek() != '\n') advance();
        } else if (ch == '/' && peek(1) == '*') {
            size_t start = pos_;
            advance(); advance();
            while (pos_ < input_.size() && !(peek() == '*' && peek(1) == '/')) advance();
            if (pos_ >= input_.size()) {
                throw StatusError(Status::LexicalError(start, '/', "unterminated block comment"));
            }
            advance(); advance();
        } else {
            break;
        }
    }
}

Token Lexer::nextToken() {
    size_t start = pos_;
    size_t line = line_;
    size_t col = column_;
    char ch = peek();

    if (ch == '"' || ch == '\'') return readString(start, line, col);
    if (isDigit(ch)) return readNumberOrDate(start, line, col);
    if (isIdentStart(ch)) return readIdentifierOrKeyword(start, line, col);
    return readOperatorOrDelimiter(start, line, col);
}

Token Lexer::readString(size_t start, size_t line, size_t col) {
    char quote = advance();
    std::string value;
    while (true) {
        if (pos_ >= input_.size()) {
            throw StatusError(Status::LexicalError(start, quote, "unterminated string literal"));
        }
        char ch = advance();
        if (ch == quote) break;
        if (ch == '\\') {
            if (pos_ >= input_.size()) {
                throw StatusError(Status::LexicalError(start, quote, "unterminated string literal"));
            }
            char next = advance();
            switch (next) {
                case 'n': value += '\n'; break;
                case 't': value += '\t'; break;
                case 'r': value += '\r'; break;
                default: value += next; break;
            }
        } else {
            value += ch;
        }
    }
    return Token(TokenType::STRING, std::move(value), start, line, col);
}

// yyyy-mm-dd at the current position
bool Lexer::looksLikeDate() const {
    for (size_t i = 0; i < 4; ++i) if (!isDigit(peek(i))) return false;
    return peek(4) == '-' && isDigit(peek(5)) && isDigit(peek(6)) &&
           peek(7) == '-' && isDigit(peek(8)) && isDigit(peek(9));
}

Token Lexer::readNumberOrDate(size_t start, size_t line, size_t col) {
    std::string value;

    if (looksLikeDate()) {
        for (int i = 0; i < 10; ++i) value += advance();
        // Optional time part: Thh:mm[:ss[.fff]][Z|+hh:mm|-hh:mm]
        if ((peek() == 'T' || peek() == 't') && isDigit(peek(1)) && isDigit(peek(2)) && peek(3) == ':') {
            value += static_cast<char>(std::toupper(static_cast<unsigned char>(advance())));
            while (isDigit(peek()) || peek() == ':') value += advance();
            if (peek() == '.' && isDigit(peek(1))) {
                value += advance();
                while (isDigit(peek())) value += advance();
            }
            if (peek() == 'Z' || peek() == 'z') {
                advance();
                value += 'Z';
            } else if ((peek() == '+' || peek() == '-') && isDigit(peek(1)) && isDigit(peek(2)) && peek(3) == ':') {
                for (int i = 0; i < 6; ++i) value += advance();
            }
        }
        return Token(TokenType::DATETIME, std::move(value), start, line, col);
    }

    bool is_float = false;
    while (isDigit(peek())) value += advance();
    if (peek() == '.' && isDigit(peek(1))) {
        is_float = true;
        value += advance();
        while (isDigit(peek())) value += advance();
    }
    if ((peek() == 'e' || peek() == 'E') &&
        (isDigit(peek(1)) || ((peek(1) == '+' || peek(1) == '-') && isDigit(peek(2))))) {
        is_float = true;
        value += advance();
        if (peek() == '+' || peek() == '-') value += advance();
        while (isDigit(peek())) value += advance();
    }
    if (isIdentStart(peek())) {
        throw StatusError(Status::LexicalError(pos_, peek()));
    }
    return Token(is_float ? TokenType::FLOAT : TokenType::INTEGER, std::move(value), start, line, col);
}

Token Lexer::readIdentifierOrKeyword(size_t start, size_t line, size_t col) {
    std::string value;
    while (isIdentChar(peek())) value += advance();

    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = keywords().find(lower);
    if (it != keywords().end()) {
        return Token(it->second, std::move(value), start, line, col);
    }
    return Token(TokenType::IDENTIFIER, std::move(value), start, line, col);
}

Token Lexer::readOperatorOrDelimiter(size_t start, size_t line, size_t col) {
    char ch = peek();
    char next = peek(1);

    auto two = [&](TokenType t, const char* text) {
        advance(); advance();
        return Token(t, text, start, line, col);
    };
    if (ch == '=' && next == '=') return two(TokenType::EQ, "==");
    if (ch == '!' && next == '=') return two(TokenType::NEQ, "!=");
    if (ch == '<' && next == '>') return two(TokenType::NEQ, "<>");
    if (ch == '<' && next == '=') return two(TokenType::LTE, "<=");
    if (ch == '>' && next == '=') return two(TokenType::GTE, ">=");
    if (ch == '-' && next == '>') return two(TokenType::ARROW, "->");
    if (ch == '&' && next == '&') return two(TokenType::AND, "&&");
    if (ch == '|' && next == '|') return two(TokenType::OR, "||");

    TokenType type;
    switch (ch) {
        case '=': type = TokenType::EQ; break;
        case '<': type = TokenType::LT; break;
        case '>': type = TokenType::GT; break;
        case '+': type = TokenType::PLUS; break;
        case '-': type = TokenType::MINUS; break;
        case '*': type = TokenType::STAR; break;
        case '/': type = TokenType::SLASH; break;
        case '%': type = TokenType::PERCENT; break;
        case '.': type = TokenType::DOT; break;
        case ',': type = TokenType::COMMA; break;
        case ':': type = TokenType::COLON; break;
        case ';': type = TokenType::SEMICOLON; break;
        case '(': type = TokenType::LPAREN; break;
        case ')': type = TokenType::RPAREN; break;
        case '{': type = TokenType::LBRACE; break;
        case '}': type = TokenType::RBRACE; break;
        case '[': type = TokenType::LBRACKET; break;
        case ']': type = TokenType::RBRACKET; break;
        default:
            throw StatusError(Status::LexicalError(start, ch));
    }
    advance();
    return Token(type, std::string(1, ch), start, line, col);
}

} // namespace query
} // namespace quanta
