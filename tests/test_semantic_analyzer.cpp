#include <gtest/gtest.h>
#include "query/qql_parser.h"
#include "query/semantic_analyzer.h"
#include "test_helpers.h"

using namespace quanta;
using namespace quanta::query;

class SemanticAnalyzerTest : public ::testing::Test {
protected:
    void SetUp() override {
        test::createTaskSchema(schema, "main");
    }

    std::pair<Status, AnalyzedStatementPtr> analyze(const std::string& text) {
        QQLParser parser;
        auto parsed = parser.parse(text);
        EXPECT_TRUE(parsed.success) << parsed.error.toString();
        if (!parsed.success) return {parsed.error, nullptr};
        return analyzer.analyze("main", *parsed.statement);
    }

    AnalyzedFind analyzeFind(const std::string& text) {
        auto [st, stmt] = analyze(text);
        EXPECT_TRUE(st.ok) << st.toString();
        if (!st.ok) return {};
        return std::get<AnalyzedFind>(stmt->node);
    }

    Status analyzeError(const std::string& text) {
        auto [st, stmt] = analyze(text);
        EXPECT_FALSE(st.ok) << "analyzed unexpectedly: " << text;
        return st;
    }

    test::Backends backends;
    SchemaRegistry registry;
    SchemaManager schema{registry, backends.registry};
    SemanticAnalyzer analyzer{registry};
};

TEST_F(SemanticAnalyzerTest, AnnotatesEveryAttributeWithItsEngine) {
    auto find = analyzeFind(
        "FIND tasks.title, tasks.metadata.tags, tasks.time_spent FROM tasks MATCH tasks.status = 'open'");
    ASSERT_EQ(find.columns.size(), 3u);

    std::vector<StorageClass> engines;
    for (const auto& col : find.columns) {
        const auto& ref = std::get<AttributeRef>(col.expr->node);
        ASSERT_TRUE(ref.resolved.has_value());
        engines.push_back(ref.resolved->storage);
    }
    EXPECT_EQ(engines, (std::vector<StorageClass>{StorageClass::Scalar, StorageClass::Document,
                                                  StorageClass::Metric}));

    const auto& doc = std::get<AttributeRef>(find.columns[1].expr->node);
    EXPECT_EQ(doc.resolved->sub_path, (std::vector<std::string>{"tags"}));
    EXPECT_EQ(find.columns[1].name, "metadata.tags");
    EXPECT_EQ(find.columns[1].binding, "tasks");
    EXPECT_FALSE(find.columns[1].definition.has_value());
    EXPECT_TRUE(find.columns[0].definition.has_value());

    const auto& cmp = std::get<BinaryExpr>(find.match->node);
    const auto& status = std::get<AttributeRef>(cmp.left->node);
    EXPECT_EQ(status.resolved->storage, StorageClass::Scalar);
    EXPECT_TRUE(status.resolved->indexed);
}

TEST_F(SemanticAnalyzerTest, PrimaryRecordRules) {
    EXPECT_EQ(analyzeFind("FIND tasks.title").primary, "tasks");
    EXPECT_EQ(analyzeFind("FIND users.username NAVIGATE tasks -> assignees").primary, "tasks");
    EXPECT_EQ(analyzeFind("FIND users.username FROM users").primary, "users");
}

TEST_F(SemanticAnalyzerTest, UnqualifiedAttributeUsesPrimaryRecord) {
    auto find = analyzeFind("FIND title FROM tasks MATCH status = 'open'");
    const auto& ref = std::get<AttributeRef>(find.columns[0].expr->node);
    EXPECT_EQ(ref.resolved->binding, "tasks");
    EXPECT_EQ(ref.resolved->attribute, "title");
}

TEST_F(SemanticAnalyzerTest, NavigationCreatesBindings) {
    auto find = analyzeFind("FIND tasks.title, users.username NAVIGATE tasks -> assignees:users");
    ASSERT_EQ(find.bindings.size(), 2u);
    EXPECT_EQ(find.bindings[1].name, "users");
    ASSERT_EQ(find.navigations.size(), 1u);
    EXPECT_EQ(find.navigations[0].source, "tasks");
    EXPECT_EQ(find.navigations[0].attribute, "assignees");
    EXPECT_EQ(find.navigations[0].target, "users");
}

TEST_F(SemanticAnalyzerTest, HopAliasNamesTheBinding) {
    auto find = analyzeFind("FIND owner.username NAVIGATE tasks -> assignees AS owner");
    ASSERT_NE(find.binding("owner"), nullptr);
    EXPECT_EQ(find.binding("owner")->schema->name(), "users");
}

TEST_F(SemanticAnalyzerTest, StandaloneNavigateIsLoweredToFind) {
    auto [st, stmt] = analyze("NAVIGATE tasks -> assignees MATCH tasks.status = 'open' LIMIT 3");
    ASSERT_TRUE(st.ok) << st.toString();
    const auto& find = std::get<AnalyzedFind>(stmt->node);
    EXPECT_EQ(find.primary, "tasks");
    EXPECT_EQ(find.limit, 3);
    // users.* without its relation attributes
    std::vector<std::string> names;
    for (const auto& col : find.columns) {
        EXPECT_EQ(col.binding, "users");
        names.push_back(col.name);
    }
    EXPECT_EQ(names, (std::vector<std::string>{"id", "username", "email", "profile", "login_times"}));
}

TEST_F(SemanticAnalyzerTest, WildcardSkipsRelations) {
    auto find = analyzeFind("FIND tasks.*");
    for (const auto& col : find.columns) EXPECT_NE(col.name, "assignees");
    EXPECT_EQ(find.columns.size(), 7u);
}

TEST_F(SemanticAnalyzerTest, AggregatesAreCollectedOnce) {
    auto find = analyzeFind(
        "FIND users.username, COUNT(tasks) AS n, AVG(tasks.time_spent) NAVIGATE tasks -> assignees "
        "GROUP BY users.username HAVING COUNT(tasks) > 5 ORDER BY n DESC");
    EXPECT_TRUE(find.aggregate);
    ASSERT_EQ(find.aggregates.size(), 2u);
    EXPECT_EQ(exprToString(find.aggregates[0]), "COUNT(tasks)");
    EXPECT_EQ(exprToString(find.aggregates[1]), "AVG(tasks.time_spent)");
    EXPECT_EQ(find.columns[1].name, "n");
    EXPECT_EQ(find.columns[2].name, "AVG(tasks.time_spent)");
    EXPECT_TRUE(find.columns[2].binding.empty());
}

TEST_F(SemanticAnalyzerTest, DateStringComparesWithDateAttribute) {
    auto find = analyzeFind("FIND tasks.title MATCH tasks.due_date < \"2025-06-01\"");
    EXPECT_TRUE(find.match);
}

TEST_F(SemanticAnalyzerTest, UpdateResolvesKeyQuery) {
    auto [st, stmt] = analyze("UPDATE tasks SET status = 'done', time_spent = 30 MATCH tasks.priority > 2");
    ASSERT_TRUE(st.ok) << st.toString();
    const auto& update = std::get<AnalyzedUpdate>(stmt->node);
    ASSERT_EQ(update.assignments.size(), 2u);
    EXPECT_EQ(update.assignments[1].definition.type, StorageClass::Metric);
    EXPECT_EQ(update.keys.primary, "tasks");
    ASSERT_EQ(update.keys.columns.size(), 1u);
    EXPECT_EQ(update.keys.columns[0].name, "id");
}

TEST_F(SemanticAnalyzerTest, AddChecksValues) {
    auto [st, stmt] = analyze("ADD tasks {title: 'x', priority: 2, assignees: ['u1', 'u2'], time_spent: 12.5}");
    ASSERT_TRUE(st.ok) << st.toString();
    const auto& add = std::get<AnalyzedAdd>(stmt->node);
    EXPECT_EQ(add.values.size(), 4u);
}

// ===== Errors =====

TEST_F(SemanticAnalyzerTest, UnknownRecord) {
    auto st = analyzeError("FIND projects.name FROM projects");
    EXPECT_EQ(st.kind, ErrorKind::Schema);
    EXPECT_EQ(st.record, "projects");
}

TEST_F(SemanticAnalyzerTest, UnknownAttribute) {
    auto st = analyzeError("FIND tasks.colour");
    EXPECT_EQ(st.kind, ErrorKind::Schema);
    EXPECT_EQ(st.record, "tasks");
    EXPECT_EQ(st.attribute, "colour");
}

TEST_F(SemanticAnalyzerTest, UnknownBucket) {
    QQLParser parser;
    auto parsed = parser.parse("FIND tasks.title");
    ASSERT_TRUE(parsed.success);
    auto [st, stmt] = analyzer.analyze("missing", *parsed.statement);
    EXPECT_EQ(st.kind, ErrorKind::Schema);
}

TEST_F(SemanticAnalyzerTest, RecordNotInQuery) {
    auto st = analyzeError("FIND tasks.title, users.username");
    EXPECT_EQ(st.kind, ErrorKind::Schema);
    EXPECT_EQ(st.record, "users");
}

TEST_F(SemanticAnalyzerTest, NavigateOverNonRelation) {
    auto st = analyzeError("FIND tasks.title NAVIGATE tasks -> title");
    EXPECT_EQ(st.kind, ErrorKind::Schema);
    EXPECT_EQ(st.attribute, "title");
}

TEST_F(SemanticAnalyzerTest, NestedPathOnScalar) {
    auto st = analyzeError("FIND tasks.title.first");
    EXPECT_EQ(st.kind, ErrorKind::Schema);
}

TEST_F(SemanticAnalyzerTest, TypeMismatchInComparison) {
    auto st = analyzeError("FIND tasks.title MATCH tasks.priority = 'high'");
    EXPECT_EQ(st.kind, ErrorKind::Type);
    EXPECT_EQ(st.position, 38u);
}

TEST_F(SemanticAnalyzerTest, ArithmeticOnString) {
    auto st = analyzeError("FIND tasks.title MATCH tasks.title * 2 > 1");
    EXPECT_EQ(st.kind, ErrorKind::Type);
}

TEST_F(SemanticAnalyzerTest, AggregateInMatch) {
    auto st = analyzeError("FIND tasks.title MATCH COUNT(tasks) > 1");
    EXPECT_EQ(st.kind, ErrorKind::Type);
}

TEST_F(SemanticAnalyzerTest, UngroupedProjection) {
    auto st = analyzeError("FIND tasks.title, COUNT(tasks) GROUP BY tasks.status");
    EXPECT_EQ(st.kind, ErrorKind::Type);
}

TEST_F(SemanticAnalyzerTest, SumOfString) {
    auto st = analyzeError("FIND SUM(tasks.title) FROM tasks");
    EXPECT_EQ(st.kind, ErrorKind::Type);
}

TEST_F(SemanticAnalyzerTest, RelationComparedWithEquals) {
    auto st = analyzeError("FIND tasks.title MATCH tasks.assignees = 'u1'");
    EXPECT_EQ(st.kind, ErrorKind::Type);
}

TEST_F(SemanticAnalyzerTest, BadWriteValues) {
    EXPECT_EQ(analyzeError("ADD tasks {priority: 'high'}").kind, ErrorKind::Type);
    EXPECT_EQ(analyzeError("ADD tasks {time_spent: 'long'}").kind, ErrorKind::Type);
    EXPECT_EQ(analyzeError("ADD tasks {nope: 1}").kind, ErrorKind::Schema);
    EXPECT_EQ(analyzeError("UPDATE tasks SET id = 'x'").kind, ErrorKind::Schema);
    EXPECT_EQ(analyzeError("UPDATE tasks SET title = tasks.status").kind, ErrorKind::Type);
}

TEST_F(SemanticAnalyzerTest, AnalysisHasNoBackendSideEffects) {
    backends.resetCounters();
    analyzeError("FIND tasks.title MATCH tasks.priority = 'high'");
    analyzeFind("FIND tasks.title MATCH tasks.priority = 2");
    for (const auto& a : backends.all()) {
        EXPECT_EQ(a->select_calls, 0);
        EXPECT_EQ(a->begin_calls, 0);
        EXPECT_TRUE(a->provisions().empty());
    }
}

TEST_F(SemanticAnalyzerTest, SchemaChangesResolveAgainstTheRecord) {
    auto [st, stmt] = analyze("ALTER RECORD tasks ADD estimate: SCALAR<INT>, ADD reviewer: RELATION<users>");
    ASSERT_TRUE(st.ok) << st.toString();
    const auto& alter = std::get<AnalyzedAlterRecord>(stmt->node);
    ASSERT_EQ(alter.additions.size(), 2u);
    EXPECT_EQ(alter.additions[0].second.datatype, std::optional<std::string>("INT"));
    EXPECT_EQ(alter.additions[1].second.target, std::optional<std::string>("users"));

    auto existing = analyzeError("ALTER RECORD tasks ADD title: SCALAR");
    EXPECT_EQ(existing.kind, ErrorKind::Schema);
    EXPECT_EQ(existing.attribute, "title");

    auto [ist, index] = analyze("CREATE INDEX ON tasks(title)");
    ASSERT_TRUE(ist.ok) << ist.toString();
    EXPECT_EQ(std::get<AnalyzedCreateIndex>(index->node).attributes, (std::vector<std::string>{"title"}));

    auto unknown = analyzeError("CREATE INDEX ON tasks(colour)");
    EXPECT_EQ(unknown.attribute, "colour");
    EXPECT_FALSE(registry.getRecord("main", "tasks")->find("title")->indexed);
}
