#include <gtest/gtest.h>
#include "query/qql_parser.h"

using namespace quanta;
using namespace quanta::query;

class QQLParserTest : public ::testing::Test {
protected:
    QQLParser parser;

    StatementPtr parseOk(const std::string& text) {
        auto result = parser.parse(text);
        EXPECT_TRUE(result.success) << result.error.toString();
        return result.statement;
    }

    Status parseFail(const std::string& text) {
        auto result = parser.parse(text);
        EXPECT_FALSE(result.success) << "parsed unexpectedly: " << text;
        return result.error;
    }
};

// ===== FIND =====

TEST_F(QQLParserTest, FindWithAllClauses) {
    auto stmt = parseOk(
        "FIND tasks.title, users.username AS who FROM tasks "
        "NAVIGATE tasks -> assignee : users AS u "
        "MATCH tasks.status = 'pending' AND tasks.priority >= 2 "
        "GROUP BY users.username HAVING COUNT(tasks) > 5 "
        "ORDER BY users.username DESC, tasks.title LIMIT 10 OFFSET 20;");
    ASSERT_TRUE(stmt);
    const auto& find = std::get<FindStatement>(stmt->node);

    ASSERT_EQ(find.projections.size(), 2u);
    EXPECT_EQ(exprToString(find.projections[0].expr), "tasks.title");
    EXPECT_EQ(find.projections[1].alias, "who");
    EXPECT_EQ(find.from, "tasks");

    ASSERT_EQ(find.navigations.size(), 1u);
    EXPECT_EQ(find.navigations[0].source, "tasks");
    ASSERT_EQ(find.navigations[0].hops.size(), 1u);
    EXPECT_EQ(find.navigations[0].hops[0].attribute, "assignee");
    EXPECT_EQ(find.navigations[0].hops[0].target, "users");
    EXPECT_EQ(find.navigations[0].hops[0].alias, "u");

    EXPECT_EQ(exprToString(find.match), "(tasks.status = \"pending\") AND (tasks.priority >= 2)");
    ASSERT_EQ(find.group_by.size(), 1u);
    EXPECT_EQ(exprToString(find.having), "COUNT(tasks) > 5");

    ASSERT_EQ(find.order_by.size(), 2u);
    EXPECT_FALSE(find.order_by[0].ascending);
    EXPECT_TRUE(find.order_by[1].ascending);
    EXPECT_EQ(find.limit, 10);
    EXPECT_EQ(find.offset, 20);
}

TEST_F(QQLParserTest, Wildcards) {
    auto stmt = parseOk("FIND *, tasks.* FROM tasks");
    const auto& find = std::get<FindStatement>(stmt->node);
    ASSERT_EQ(find.projections.size(), 2u);
    EXPECT_TRUE(find.projections[0].wildcard);
    EXPECT_TRUE(find.projections[0].wildcard_binding.empty());
    EXPECT_TRUE(find.projections[1].wildcard);
    EXPECT_EQ(find.projections[1].wildcard_binding, "tasks");
}

TEST_F(QQLParserTest, MultiHopPath) {
    auto stmt = parseOk("FIND users.username NAVIGATE tasks -> project -> owner");
    const auto& find = std::get<FindStatement>(stmt->node);
    ASSERT_EQ(find.navigations.size(), 1u);
    ASSERT_EQ(find.navigations[0].hops.size(), 2u);
    EXPECT_EQ(find.navigations[0].hops[1].attribute, "owner");
    EXPECT_TRUE(find.from.empty());
}

TEST_F(QQLParserTest, OperatorPrecedence) {
    auto stmt = parseOk("FIND a.x MATCH NOT a.x = 1 OR a.y + 2 * 3 > 4 AND a.z IN [1, 2]");
    const auto& find = std::get<FindStatement>(stmt->node);
    EXPECT_EQ(exprToString(find.match),
              "NOT (a.x = 1) OR (((a.y + (2 * 3)) > 4) AND (a.z IN [1, 2]))");
}

TEST_F(QQLParserTest, AlternativeLogicalOperators) {
    auto stmt = parseOk("FIND a.x MATCH a.x == 1 && a.y <> 2 || a.z != 3");
    const auto& find = std::get<FindStatement>(stmt->node);
    EXPECT_EQ(exprToString(find.match), "((a.x = 1) AND (a.y != 2)) OR (a.z != 3)");
}

TEST_F(QQLParserTest, NegativeLiteralIsFolded) {
    auto stmt = parseOk("FIND a.x MATCH a.x > -5");
    const auto& find = std::get<FindStatement>(stmt->node);
    const auto& cmp = std::get<BinaryExpr>(find.match->node);
    const auto& lit = std::get<Literal>(cmp.right->node);
    EXPECT_EQ(lit.kind, LiteralKind::Integer);
    EXPECT_EQ(lit.value.get<int64_t>(), -5);
}

TEST_F(QQLParserTest, CountStar) {
    auto stmt = parseOk("FIND COUNT(*) AS n FROM tasks");
    const auto& find = std::get<FindStatement>(stmt->node);
    const auto& call = std::get<FunctionCall>(find.projections[0].expr->node);
    EXPECT_EQ(call.name, "COUNT");
    EXPECT_TRUE(call.star);
}

TEST_F(QQLParserTest, DateTimeLiteral) {
    auto stmt = parseOk("FIND t.title MATCH t.due < 2025-06-01T12:00:00Z");
    const auto& find = std::get<FindStatement>(stmt->node);
    const auto& cmp = std::get<BinaryExpr>(find.match->node);
    const auto& lit = std::get<Literal>(cmp.right->node);
    EXPECT_EQ(lit.kind, LiteralKind::DateTime);
}

// ===== Other statements =====

TEST_F(QQLParserTest, StandaloneNavigate) {
    auto stmt = parseOk("NAVIGATE tasks -> assignee MATCH tasks.status = 'open' LIMIT 5");
    const auto& nav = std::get<NavigateStatement>(stmt->node);
    EXPECT_EQ(nav.path.source, "tasks");
    EXPECT_EQ(nav.limit, 5);
    EXPECT_TRUE(nav.match);
}

TEST_F(QQLParserTest, AddWithNestedObject) {
    auto stmt = parseOk("ADD tasks { title: 'Write docs', metadata: {tags: ['a', 'b']}, \"priority\": 3 }");
    const auto& add = std::get<AddStatement>(stmt->node);
    EXPECT_EQ(add.record, "tasks");
    const auto& obj = std::get<ObjectExpr>(add.values->node);
    ASSERT_EQ(obj.fields.size(), 3u);
    EXPECT_EQ(obj.fields[2].first, "priority");
}

TEST_F(QQLParserTest, UpdateAndRemove) {
    auto update = parseOk("UPDATE tasks SET status = 'done', priority = 1 MATCH tasks.id = 't1'");
    const auto& u = std::get<UpdateStatement>(update->node);
    ASSERT_EQ(u.assignments.size(), 2u);
    EXPECT_EQ(u.assignments[1].attribute, "priority");
    EXPECT_TRUE(u.match);

    auto remove = parseOk("REMOVE tasks");
    const auto& r = std::get<RemoveStatement>(remove->node);
    EXPECT_EQ(r.record, "tasks");
    EXPECT_FALSE(r.match);
}

TEST_F(QQLParserTest, CreateRecord) {
    auto stmt = parseOk(
        "CREATE RECORD tasks (id: SCALAR<UUID> PRIMARY KEY, title: SCALAR<STRING> INDEXED, "
        "metadata: DOCUMENT, assignee: RELATION<users>, time_spent: METRIC<SECONDS>)");
    const auto& create = std::get<CreateRecordStatement>(stmt->node);
    EXPECT_EQ(create.record, "tasks");
    ASSERT_EQ(create.attributes.size(), 5u);
    EXPECT_TRUE(create.attributes[0].primary_key);
    EXPECT_EQ(create.attributes[0].hint, "UUID");
    EXPECT_TRUE(create.attributes[1].indexed);
    EXPECT_EQ(create.attributes[2].type, StorageClass::Document);
    EXPECT_EQ(create.attributes[3].type, StorageClass::Relation);
    EXPECT_EQ(create.attributes[3].hint, "users");
    EXPECT_EQ(create.attributes[4].type, StorageClass::Metric);
}

TEST_F(QQLParserTest, CreateRelation) {
    auto stmt = parseOk("CREATE RELATION reviewer FROM tasks TO users");
    const auto& create = std::get<CreateRelationStatement>(stmt->node);
    EXPECT_EQ(create.name, "reviewer");
    EXPECT_EQ(create.from, "tasks");
    EXPECT_EQ(create.to, "users");
}

TEST_F(QQLParserTest, AlterRecordAddsColumns) {
    auto stmt = parseOk("ALTER RECORD users ADD COLUMN email: SCALAR<STRING> INDEXED, ADD settings DOCUMENT, "
                        "ADD column: METRIC<COUNT>");
    const auto& alter = std::get<AlterRecordStatement>(stmt->node);
    EXPECT_EQ(alter.record, "users");
    ASSERT_EQ(alter.additions.size(), 3u);
    EXPECT_EQ(alter.additions[0].name, "email");
    EXPECT_EQ(alter.additions[0].hint, "STRING");
    EXPECT_TRUE(alter.additions[0].indexed);
    EXPECT_EQ(alter.additions[1].name, "settings");
    EXPECT_EQ(alter.additions[1].type, StorageClass::Document);
    EXPECT_EQ(alter.additions[2].name, "column");
    EXPECT_EQ(alter.additions[2].type, StorageClass::Metric);
    EXPECT_EQ(statementToJSON(*stmt)["kind"], "ALTER RECORD");
}

TEST_F(QQLParserTest, AlterRecordRejectsPrimaryKey) {
    auto st = parseFail("ALTER RECORD users ADD code: SCALAR PRIMARY KEY");
    EXPECT_EQ(st.kind, ErrorKind::Syntax);
    EXPECT_EQ(st.position, 23u);

    EXPECT_EQ(parseFail("ALTER users ADD x: SCALAR").kind, ErrorKind::Syntax);
    EXPECT_EQ(parseFail("ALTER RECORD users x: SCALAR").kind, ErrorKind::Syntax);
}

TEST_F(QQLParserTest, CreateIndex) {
    auto stmt = parseOk("CREATE INDEX ON tasks(title, priority)");
    const auto& create = std::get<CreateIndexStatement>(stmt->node);
    EXPECT_EQ(create.record, "tasks");
    EXPECT_EQ(create.attributes, (std::vector<std::string>{"title", "priority"}));
    EXPECT_EQ(statementToJSON(*stmt)["kind"], "CREATE INDEX");

    EXPECT_EQ(parseFail("CREATE INDEX ON tasks()").kind, ErrorKind::Syntax);
    EXPECT_EQ(parseFail("CREATE INDEX tasks(title)").kind, ErrorKind::Syntax);
}

TEST_F(QQLParserTest, TransactionBlock) {
    auto stmt = parseOk(
        "BEGIN TRANSACTION; ADD users {username: 'ann'}; UPDATE users SET username = 'bob' COMMIT");
    const auto& txn = std::get<TransactionStatement>(stmt->node);
    ASSERT_EQ(txn.statements.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<AddStatement>(txn.statements[0]->node));
    EXPECT_TRUE(std::holds_alternative<UpdateStatement>(txn.statements[1]->node));
}

TEST_F(QQLParserTest, Explain) {
    auto stmt = parseOk("EXPLAIN FIND tasks.title");
    const auto& explain = std::get<ExplainStatement>(stmt->node);
    EXPECT_TRUE(std::holds_alternative<FindStatement>(explain.inner->node));
}

TEST_F(QQLParserTest, ParsingIsDeterministic) {
    const std::string text = "FIND t.a, COUNT(t) MATCH t.b CONTAINS 'x' GROUP BY t.a";
    auto a = parseOk(text);
    auto b = parseOk(text);
    EXPECT_EQ(statementToJSON(*a), statementToJSON(*b));
}

// ===== Errors =====

TEST_F(QQLParserTest, MissingProjectionReportsPosition) {
    auto st = parseFail("FIND FROM tasks");
    EXPECT_EQ(st.kind, ErrorKind::Syntax);
    EXPECT_EQ(st.position, 5u);
}

TEST_F(QQLParserTest, TrailingGarbage) {
    auto st = parseFail("FIND tasks.title tasks");
    EXPECT_EQ(st.kind, ErrorKind::Syntax);
    EXPECT_EQ(st.position, 17u);
    EXPECT_NE(st.message.find("end of input"), std::string::npos);
}

TEST_F(QQLParserTest, UnexpectedEndOfInput) {
    auto st = parseFail("FIND tasks.title MATCH");
    EXPECT_EQ(st.kind, ErrorKind::Syntax);
    EXPECT_EQ(st.position, 22u);
    EXPECT_NE(st.message.find("but found end of input"), std::string::npos);
}

TEST_F(QQLParserTest, LexicalErrorsPassThrough) {
    auto st = parseFail("FIND tasks.title MATCH tasks.x = $");
    EXPECT_EQ(st.kind, ErrorKind::Lexical);
    EXPECT_EQ(st.position, 33u);
}

TEST_F(QQLParserTest, DdlIsRejectedInsideTransaction) {
    auto st = parseFail("BEGIN CREATE RECORD x (a: SCALAR) COMMIT");
    EXPECT_EQ(st.kind, ErrorKind::Syntax);
    EXPECT_EQ(st.position, 6u);
}

TEST_F(QQLParserTest, SchemaChangesAreRejectedInsideTransaction) {
    EXPECT_EQ(parseFail("BEGIN ALTER RECORD x ADD a: SCALAR COMMIT").position, 6u);
    EXPECT_EQ(parseFail("BEGIN CREATE INDEX ON x(a) COMMIT").position, 6u);
}

TEST_F(QQLParserTest, EmptyTransactionIsRejected) {
    auto st = parseFail("BEGIN COMMIT");
    EXPECT_EQ(st.kind, ErrorKind::Syntax);
}

TEST_F(QQLParserTest, UnknownStorageClass) {
    auto st = parseFail("CREATE RECORD x (a: VECTOR)");
    EXPECT_EQ(st.kind, ErrorKind::Syntax);
    EXPECT_EQ(st.position, 20u);
}

TEST_F(QQLParserTest, NavigateRequiresArrow) {
    auto st = parseFail("NAVIGATE tasks");
    EXPECT_EQ(st.kind, ErrorKind::Syntax);
    EXPECT_EQ(st.position, 14u);
}

TEST_F(QQLParserTest, NestedExplainIsRejected) {
    auto st = parseFail("EXPLAIN EXPLAIN FIND a.b");
    EXPECT_EQ(st.kind, ErrorKind::Syntax);
    EXPECT_EQ(st.position, 8u);
}
