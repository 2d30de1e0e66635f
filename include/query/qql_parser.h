#pragma once

#include <memory>
#include <string>
#include <vector>

#include "query/ast.h"
#include "query/lexer.h"
#include "utils/status.h"

namespace quanta {
namespace query {

struct ParseResult {
    bool success = false;
    StatementPtr statement;
    Status error;

    static ParseResult Success(StatementPtr stmt) {
        ParseResult result;
        result.success = true;
        result.statement = std::move(stmt);
        return result;
    }

    static ParseResult Failure(Status status) {
        ParseResult result;
        result.success = false;
        result.error = std::move(status);
        return result;
    }
};

// ============================================================================
// QQL Parser
// ============================================================================

/**
 * Recursive-descent parser for the query language.
 *
 * Produces an immutable Statement tree. Parsing has no side effects; the same
 * input always yields a structurally identical tree.
 *
 * Example:
 *   QQLParser parser;
 *   auto result = parser.parse("FIND tasks.title MATCH tasks.status = \"pending\"");
 *   if (!result.success) { ... result.error.position ... }
 */
class QQLParser {
public:
    QQLParser() = default;

    ParseResult parse(const std::string& query_string);

private:
    std::vector<Token> tokens_;
    size_t pos_ = 0;

    const Token& current() const { return tokens_[pos_]; }
    const Token& peekToken(size_t offset = 1) const;
    bool check(TokenType type) const { return current().type == type; }
    bool match(TokenType type);
    const Token& expect(TokenType type, const char* expected);
    std::string expectIdentifier(const char* expected);
    bool isIdentifierToken(const Token& tok) const;
    [[noreturn]] void fail(const std::string& expected) const;

    StatementPtr parseStatement(bool in_transaction);
    StatementPtr parseFind(size_t position);
    StatementPtr parseNavigate(size_t position);
    StatementPtr parseAdd(size_t position);
    StatementPtr parseUpdate(size_t position);
    StatementPtr parseRemove(size_t position);
    StatementPtr parseCreate(size_t position);
    StatementPtr parseAlter(size_t position);
    StatementPtr parseTransaction(size_t position);

    Projection parseProjection();
    NavigationPath parseNavigationPath();
    std::vector<OrderItem> parseOrderBy();
    void parseLimit(std::optional<int64_t>& limit, std::optional<int64_t>& offset);
    AttributeDecl parseAttributeDecl(bool require_colon = true);
    int64_t parseNonNegativeInteger(const char* expected);

    ExprPtr parseExpression();
    ExprPtr parseOr();
    ExprPtr parseAnd();
    ExprPtr parseNot();
    ExprPtr parseComparison();
    ExprPtr parseAdditive();
    ExprPtr parseMultiplicative();
    ExprPtr parseUnary();
    ExprPtr parsePrimary();
    ExprPtr parseObjectLiteral();
    ExprPtr parseLiteral();
};

} // namespace query
} // namespace quanta
