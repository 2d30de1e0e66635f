#include "query/qql_parser.h"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace quanta {
namespace query {

namespace {

std::string foundText(const Token& tok) {
    if (tok.type == TokenType::END_OF_FILE) return "";
    return tok.lexeme;
}

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

} // namespace

// ============================================================================
// Token helpers
// ============================================================================

const Token& QQLParser::peekToken(size_t offset) const {
    size_t idx = std::min(pos_ + offset, tokens_.size() - 1);
    return tokens_[idx];
}

bool QQLParser::match(TokenType type) {
    if (check(type)) {
        if (type != TokenType::END_OF_FILE) pos_++;
        return true;
    }
    return false;
}

void QQLParser::fail(const std::string& expected) const {
    throw StatusError(Status::SyntaxError(current().position, expected, foundText(current())));
}

const Token& QQLParser::expect(TokenType type, const char* expected) {
    if (!check(type)) fail(expected);
    return tokens_[pos_++];
}

// Keywords that never start a clause may double as names
bool QQLParser::isIdentifierToken(const Token& tok) const {
    switch (tok.type) {
        case TokenType::IDENTIFIER:
        case TokenType::KEY:
        case TokenType::RECORD:
        case TokenType::TRANSACTION:
        case TokenType::PRIMARY:
        case TokenType::INDEXED:
        case TokenType::COLUMN:
        case TokenType::INDEX:
        case TokenType::ON:
            return true;
        default:
            return false;
    }
}

std::string QQLParser::expectIdentifier(const char* expected) {
    if (!isIdentifierToken(current())) fail(expected);
    return tokens_[pos_++].lexeme;
}

int64_t QQLParser::parseNonNegativeInteger(const char* expected) {
    const Token& tok = expect(TokenType::INTEGER, expected);
    try {
        return std::stoll(tok.lexeme);
    } catch (const std::out_of_range&) {
        throw StatusError(Status::SyntaxError(tok.position, "integer in range", tok.lexeme));
    }
}

// ============================================================================
// Entry point
// ============================================================================

ParseResult QQLParser::parse(const std::string& query_string) {
    Lexer lexer(query_string);
    LexResult lexed = lexer.tokenize();
    if (!lexed.status.ok) {
        return ParseResult::Failure(lexed.status);
    }

    tokens_ = std::move(lexed.tokens);
    pos_ = 0;

    try {
        StatementPtr stmt = parseStatement(false);
        match(TokenType::SEMICOLON);
        if (!check(TokenType::END_OF_FILE)) fail("end of input");
        return ParseResult::Success(std::move(stmt));
    } catch (const StatusError& e) {
        return ParseResult::Failure(e.status());
    }
}

StatementPtr QQLParser::parseStatement(bool in_transaction) {
    const Token& tok = current();
    size_t position = tok.position;

    switch (tok.type) {
        case TokenType::FIND: pos_++; return parseFind(position);
        case TokenType::NAVIGATE: pos_++; return parseNavigate(position);
        case TokenType::ADD: pos_++; return parseAdd(position);
        case TokenType::UPDATE: pos_++; return parseUpdate(position);
        case TokenType::REMOVE: pos_++; return parseRemove(position);
        default: break;
    }

    if (in_transaction) {
        fail("FIND, NAVIGATE, ADD, UPDATE or REMOVE");
    }

    switch (tok.type) {
        case TokenType::CREATE: pos_++; return parseCreate(position);
        case TokenType::ALTER: pos_++; return parseAlter(position);
        case TokenType::BEGIN: pos_++; return parseTransaction(position);
        case TokenType::EXPLAIN: {
            pos_++;
            ExplainStatement explain;
            explain.inner = parseStatement(false);
            if (std::holds_alternative<ExplainStatement>(explain.inner->node)) {
                throw StatusError(Status::SyntaxError(explain.inner->position, "statement", "EXPLAIN"));
            }
            return std::make_shared<Statement>(Statement{std::move(explain), position});
        }
        default:
            fail("FIND, NAVIGATE, ADD, UPDATE, REMOVE, CREATE, ALTER, BEGIN or EXPLAIN");
    }
}

// ============================================================================
// Statements
// ============================================================================

StatementPtr QQLParser::parseFind(size_t position) {
    FindStatement find;

    find.projections.push_back(parseProjection());
    while (match(TokenType::COMMA)) {
        find.projections.push_back(parseProjection());
    }

    if (check(TokenType::FROM)) {
        pos_++;
        find.from_position = current().position;
        find.from = expectIdentifier("record name");
    }

    while (match(TokenType::NAVIGATE)) {
        find.navigations.push_back(parseNavigationPath());
    }

    if (match(TokenType::MATCH)) {
        find.match = parseExpression();
    }

    if (match(TokenType::GROUP)) {
        expect(TokenType::BY, "BY");
        find.group_by.push_back(parseExpression());
        while (match(TokenType::COMMA)) {
            find.group_by.push_back(parseExpression());
        }
    }

    if (match(TokenType::HAVING)) {
        find.having = parseExpression();
    }

    if (match(TokenType::ORDER)) {
        find.order_by = parseOrderBy();
    }

    parseLimit(find.limit, find.offset);

    return std::make_shared<Statement>(Statement{std::move(find), position});
}

StatementPtr QQLParser::parseNavigate(size_t position) {
    NavigateStatement nav;
    nav.path = parseNavigationPath();

    if (match(TokenType::MATCH)) {
        nav.match = parseExpression();
    }
    if (match(TokenType::ORDER)) {
        nav.order_by = parseOrderBy();
    }
    parseLimit(nav.limit, nav.offset);

    return std::make_shared<Statement>(Statement{std::move(nav), position});
}

StatementPtr QQLParser::parseAdd(size_t position) {
    AddStatement add;
    add.record_position = current().position;
    add.record = expectIdentifier("record name");
    if (!check(TokenType::LBRACE)) fail("'{'");
    add.values = parseObjectLiteral();
    return std::make_shared<Statement>(Statement{std::move(add), position});
}

StatementPtr QQLParser::parseUpdate(size_t position) {
    UpdateStatement update;
    update.record_position = current().position;
    update.record = expectIdentifier("record name");
    expect(TokenType::SET, "SET");

    do {
        Assignment assignment;
        assignment.position = current().position;
        assignment.attribute = expectIdentifier("attribute name");
        expect(TokenType::EQ, "'='");
        assignment.value = parseExpression();
        update.assignments.push_back(std::move(assignment));
    } while (match(TokenType::COMMA));

    if (match(TokenType::MATCH)) {
        update.match = parseExpression();
    }
    return std::make_shared<Statement>(Statement{std::move(update), position});
}

StatementPtr QQLParser::parseRemove(size_t position) {
    RemoveStatement remove;
    remove.record_position = current().position;
    remove.record = expectIdentifier("record name");
    if (match(TokenType::MATCH)) {
        remove.match = parseExpression();
    }
    return std::make_shared<Statement>(Statement{std::move(remove), position});
}

StatementPtr QQLParser::parseCreate(size_t position) {
    if (match(TokenType::RECORD)) {
        CreateRecordStatement create;
        create.record = expectIdentifier("record name");
        expect(TokenType::LPAREN, "'('");
        create.attributes.push_back(parseAttributeDecl());
        while (match(TokenType::COMMA)) {
            create.attributes.push_back(parseAttributeDecl());
        }
        expect(TokenType::RPAREN, "',' or ')'");
        return std::make_shared<Statement>(Statement{std::move(create), position});
    }

    if (match(TokenType::RELATION)) {
        CreateRelationStatement create;
        create.name = expectIdentifier("relation name");
        expect(TokenType::FROM, "FROM");
        create.from = expectIdentifier("record name");
        expect(TokenType::TO, "TO");
        create.to = expectIdentifier("record name");
        return std::make_shared<Statement>(Statement{std::move(create), position});
    }

    if (match(TokenType::INDEX)) {
        CreateIndexStatement create;
        expect(TokenType::ON, "ON");
        create.record = expectIdentifier("record name");
        expect(TokenType::LPAREN, "'('");
        do {
            create.positions.push_back(current().position);
            create.attributes.push_back(expectIdentifier("attribute name"));
        } while (match(TokenType::COMMA));
        expect(TokenType::RPAREN, "',' or ')'");
        return std::make_shared<Statement>(Statement{std::move(create), position});
    }

    fail("RECORD, RELATION or INDEX");
}

StatementPtr QQLParser::parseAlter(size_t position) {
    expect(TokenType::RECORD, "RECORD");
    AlterRecordStatement alter;
    alter.record = expectIdentifier("record name");
    do {
        expect(TokenType::ADD, "ADD");
        // COLUMN is optional; "ADD column: ..." names an attribute "column"
        if (check(TokenType::COLUMN) && peekToken(1).type != TokenType::COLON) pos_++;
        size_t decl_position = current().position;
        AttributeDecl decl = parseAttributeDecl(false);
        if (decl.primary_key) {
            throw StatusError(Status::SyntaxError(decl_position, "attribute without PRIMARY KEY", decl.name));
        }
        alter.additions.push_back(std::move(decl));
    } while (match(TokenType::COMMA));
    return std::make_shared<Statement>(Statement{std::move(alter), position});
}

StatementPtr QQLParser::parseTransaction(size_t position) {
    TransactionStatement txn;
    match(TokenType::TRANSACTION);
    match(TokenType::SEMICOLON);

    while (!check(TokenType::COMMIT)) {
        if (check(TokenType::END_OF_FILE)) fail("COMMIT");
        txn.statements.push_back(parseStatement(true));
        match(TokenType::SEMICOLON);
    }
    if (txn.statements.empty()) fail("FIND, NAVIGATE, ADD, UPDATE or REMOVE");

    expect(TokenType::COMMIT, "COMMIT");
    match(TokenType::TRANSACTION);
    return std::make_shared<Statement>(Statement{std::move(txn), position});
}

// ============================================================================
// Clauses
// ============================================================================

Projection QQLParser::parseProjection() {
    Projection proj;
    proj.position = current().position;

    if (match(TokenType::STAR)) {
        proj.wildcard = true;
        return proj;
    }

    if (isIdentifierToken(current()) && peekToken(1).type == TokenType::DOT &&
        peekToken(2).type == TokenType::STAR) {
        proj.wildcard = true;
        proj.wildcard_binding = current().lexeme;
        pos_ += 3;
        return proj;
    }

    proj.expr = parseExpression();
    if (match(TokenType::AS)) {
        proj.alias = expectIdentifier("alias");
    }
    return proj;
}

NavigationPath QQLParser::parseNavigationPath() {
    NavigationPath path;
    path.position = current().position;
    path.source = expectIdentifier("record name");

    if (!check(TokenType::ARROW)) fail("'->'");
    while (match(TokenType::ARROW)) {
        Hop hop;
        hop.position = current().position;
        hop.attribute = expectIdentifier("relation attribute");
        if (match(TokenType::COLON)) {
            hop.target = expectIdentifier("target record");
        }
        if (match(TokenType::AS)) {
            hop.alias = expectIdentifier("alias");
        }
        path.hops.push_back(std::move(hop));
    }
    return path;
}

std::vector<OrderItem> QQLParser::parseOrderBy() {
    expect(TokenType::BY, "BY");
    std::vector<OrderItem> items;
    do {
        OrderItem item;
        item.expr = parseExpression();
        if (match(TokenType::DESC)) {
            item.ascending = false;
        } else {
            match(TokenType::ASC);
        }
        items.push_back(std::move(item));
    } while (match(TokenType::COMMA));
    return items;
}

void QQLParser::parseLimit(std::optional<int64_t>& limit, std::optional<int64_t>& offset) {
    if (match(TokenType::LIMIT)) {
        limit = parseNonNegativeInteger("integer");
        if (match(TokenType::OFFSET)) {
            offset = parseNonNegativeInteger("integer");
        }
    }
}

AttributeDecl QQLParser::parseAttributeDecl(bool require_colon) {
    AttributeDecl decl;
    decl.position = current().position;
    decl.name = expectIdentifier("attribute name");
    if (require_colon) {
        expect(TokenType::COLON, "':'");
    } else {
        match(TokenType::COLON);
    }

    switch (current().type) {
        case TokenType::SCALAR: decl.type = StorageClass::Scalar; break;
        case TokenType::DOCUMENT: decl.type = StorageClass::Document; break;
        case TokenType::RELATION: decl.type = StorageClass::Relation; break;
        case TokenType::METRIC: decl.type = StorageClass::Metric; break;
        default: fail("SCALAR, DOCUMENT, RELATION or METRIC");
    }
    pos_++;

    if (match(TokenType::LT)) {
        // hint may be any word, including keywords such as KEY
        if (current().lexeme.empty() || !(std::isalpha(static_cast<unsigned char>(current().lexeme[0])) ||
                                          current().lexeme[0] == '_')) {
            fail("datatype, target record or unit");
        }
        decl.hint = tokens_[pos_++].lexeme;
        expect(TokenType::GT, "'>'");
    }

    if (match(TokenType::PRIMARY)) {
        expect(TokenType::KEY, "KEY");
        decl.primary_key = true;
    } else if (match(TokenType::INDEXED)) {
        decl.indexed = true;
    }
    return decl;
}

// ============================================================================
// Expressions
// ============================================================================

ExprPtr QQLParser::parseExpression() {
    return parseOr();
}

ExprPtr QQLParser::parseOr() {
    ExprPtr left = parseAnd();
    while (check(TokenType::OR)) {
        size_t position = current().position;
        pos_++;
        ExprPtr right = parseAnd();
        left = makeExpr(BinaryExpr{BinaryOp::Or, left, right}, position);
    }
    return left;
}

ExprPtr QQLParser::parseAnd() {
    ExprPtr left = parseNot();
    while (check(TokenType::AND)) {
        size_t position = current().position;
        pos_++;
        ExprPtr right = parseNot();
        left = makeExpr(BinaryExpr{BinaryOp::And, left, right}, position);
    }
    return left;
}

ExprPtr QQLParser::parseNot() {
    if (check(TokenType::NOT)) {
        size_t position = current().position;
        pos_++;
        ExprPtr operand = parseNot();
        return makeExpr(UnaryExpr{UnaryOp::Not, operand}, position);
    }
    return parseComparison();
}

ExprPtr QQLParser::parseComparison() {
    ExprPtr left = parseAdditive();

    BinaryOp op;
    switch (current().type) {
        case TokenType::EQ: op = BinaryOp::Eq; break;
        case TokenType::NEQ: op = BinaryOp::Neq; break;
        case TokenType::LT: op = BinaryOp::Lt; break;
        case TokenType::LTE: op = BinaryOp::Lte; break;
        case TokenType::GT: op = BinaryOp::Gt; break;
        case TokenType::GTE: op = BinaryOp::Gte; break;
        case TokenType::CONTAINS: op = BinaryOp::Contains; break;
        case TokenType::IN: op = BinaryOp::In; break;
        default: return left;
    }
    size_t position = current().position;
    pos_++;
    ExprPtr right = parseAdditive();
    return makeExpr(BinaryExpr{op, left, right}, position);
}

ExprPtr QQLParser::parseAdditive() {
    ExprPtr left = parseMultiplicative();
    while (check(TokenType::PLUS) || check(TokenType::MINUS)) {
        BinaryOp op = check(TokenType::PLUS) ? BinaryOp::Add : BinaryOp::Sub;
        size_t position = current().position;
        pos_++;
        ExprPtr right = parseMultiplicative();
        left = makeExpr(BinaryExpr{op, left, right}, position);
    }
    return left;
}

ExprPtr QQLParser::parseMultiplicative() {
    ExprPtr left = parseUnary();
    while (check(TokenType::STAR) || check(TokenType::SLASH) || check(TokenType::PERCENT)) {
        BinaryOp op = check(TokenType::STAR) ? BinaryOp::Mul
                    : check(TokenType::SLASH) ? BinaryOp::Div : BinaryOp::Mod;
        size_t position = current().position;
        pos_++;
        ExprPtr right = parseUnary();
        left = makeExpr(BinaryExpr{op, left, right}, position);
    }
    return left;
}

ExprPtr QQLParser::parseUnary() {
    if (check(TokenType::MINUS)) {
        size_t position = current().position;
        pos_++;
        // fold negative numeric literals
        if (check(TokenType::INTEGER) || check(TokenType::FLOAT)) {
            ExprPtr lit = parseLiteral();
            Literal neg = std::get<Literal>(lit->node);
            if (neg.kind == LiteralKind::Integer) {
                neg.value = -neg.value.get<int64_t>();
            } else {
                neg.value = -neg.value.get<double>();
            }
            return makeExpr(std::move(neg), position);
        }
        ExprPtr operand = parseUnary();
        return makeExpr(UnaryExpr{UnaryOp::Neg, operand}, position);
    }
    return parsePrimary();
}

ExprPtr QQLParser::parsePrimary() {
    const Token& tok = current();
    size_t position = tok.position;

    switch (tok.type) {
        case TokenType::STRING:
        case TokenType::INTEGER:
        case TokenType::FLOAT:
        case TokenType::DATETIME:
        case TokenType::TRUE:
        case TokenType::FALSE:
        case TokenType::NULL_LITERAL:
            return parseLiteral();

        case TokenType::LPAREN: {
            pos_++;
            ExprPtr inner = parseExpression();
            expect(TokenType::RPAREN, "')'");
            return inner;
        }

        case TokenType::LBRACKET: {
            pos_++;
            ListExpr list;
            if (!check(TokenType::RBRACKET)) {
                list.items.push_back(parseExpression());
                while (match(TokenType::COMMA)) {
                    list.items.push_back(parseExpression());
                }
            }
            expect(TokenType::RBRACKET, "',' or ']'");
            return makeExpr(std::move(list), position);
        }

        case TokenType::LBRACE:
            return parseObjectLiteral();

        default:
            break;
    }

    if (!isIdentifierToken(tok)) {
        fail("expression");
    }

    // function call
    if (peekToken(1).type == TokenType::LPAREN) {
        FunctionCall call;
        call.name = upper(tok.lexeme);
        pos_ += 2;
        if (match(TokenType::STAR)) {
            call.star = true;
        } else if (!check(TokenType::RPAREN)) {
            call.args.push_back(parseExpression());
            while (match(TokenType::COMMA)) {
                call.args.push_back(parseExpression());
            }
        }
        expect(TokenType::RPAREN, "')'");
        return makeExpr(std::move(call), position);
    }

    AttributeRef ref;
    ref.path.push_back(tokens_[pos_++].lexeme);
    while (match(TokenType::DOT)) {
        ref.path.push_back(expectIdentifier("attribute name"));
    }
    return makeExpr(std::move(ref), position);
}

ExprPtr QQLParser::parseObjectLiteral() {
    size_t position = current().position;
    expect(TokenType::LBRACE, "'{'");

    ObjectExpr obj;
    if (!check(TokenType::RBRACE)) {
        do {
            std::string key;
            if (check(TokenType::STRING)) {
                key = tokens_[pos_++].lexeme;
            } else {
                key = expectIdentifier("field name");
            }
            expect(TokenType::COLON, "':'");
            obj.fields.emplace_back(std::move(key), parseExpression());
        } while (match(TokenType::COMMA));
    }
    expect(TokenType::RBRACE, "',' or '}'");
    return makeExpr(std::move(obj), position);
}

ExprPtr QQLParser::parseLiteral() {
    const Token& tok = current();
    Literal lit;

    switch (tok.type) {
        case TokenType::STRING:
            lit.kind = LiteralKind::String;
            lit.value = tok.lexeme;
            break;
        case TokenType::INTEGER:
            lit.kind = LiteralKind::Integer;
            try {
                lit.value = static_cast<int64_t>(std::stoll(tok.lexeme));
            } catch (const std::out_of_range&) {
                throw StatusError(Status::SyntaxError(tok.position, "integer in range", tok.lexeme));
            }
            break;
        case TokenType::FLOAT:
            lit.kind = LiteralKind::Number;
            try {
                lit.value = std::stod(tok.lexeme);
            } catch (const std::out_of_range&) {
                throw StatusError(Status::SyntaxError(tok.position, "number in range", tok.lexeme));
            }
            break;
        case TokenType::DATETIME:
            lit.kind = LiteralKind::DateTime;
            lit.value = tok.lexeme;
            break;
        case TokenType::TRUE:
        case TokenType::FALSE:
            lit.kind = LiteralKind::Boolean;
            lit.value = tok.type == TokenType::TRUE;
            break;
        case TokenType::NULL_LITERAL:
            lit.kind = LiteralKind::Null;
            lit.value = nullptr;
            break;
        default:
            fail("literal");
    }
    pos_++;
    return makeExpr(std::move(lit), tok.position);
}

} // namespace query
} // namespace quanta
