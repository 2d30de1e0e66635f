#include <gtest/gtest.h>
#include "query/document_translator.h"
#include "query/metric_translator.h"
#include "query/physical_planner.h"
#include "query/qql_parser.h"
#include "query/query_optimizer.h"
#include "query/relation_translator.h"
#include "query/scalar_translator.h"
#include "test_helpers.h"

using namespace quanta;
using namespace quanta::query;
using json = nlohmann::json;

class TranslatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        test::createTaskSchema(schema, "main");
    }

    PhysicalPlan planFind(const std::string& text) {
        QQLParser parser;
        auto parsed = parser.parse(text);
        EXPECT_TRUE(parsed.success) << parsed.error.toString();
        auto [st, stmt] = analyzer.analyze("main", *parsed.statement);
        EXPECT_TRUE(st.ok) << st.toString();
        stmt_ = stmt;
        const auto& find = std::get<AnalyzedFind>(stmt_->node);
        auto optimized = optimizer.optimize(logical.build(find), find);
        return physical.plan(*optimized.root, find);
    }

    const Fragment& only(const PhysicalPlan& plan) {
        EXPECT_EQ(plan.fragments.size(), 1u);
        return plan.fragments.front();
    }

    test::Backends backends;
    SchemaRegistry registry;
    SchemaManager schema{registry, backends.registry};
    SemanticAnalyzer analyzer{registry};
    config::EngineConfig cfg;
    LogicalPlanner logical{cfg.planner};
    TranslatorSet translators;
    QueryOptimizer optimizer{logical, translators};
    PhysicalPlanner physical{cfg.planner, translators};
    AnalyzedStatementPtr stmt_;
};

// ===== SQL =====

TEST_F(TranslatorTest, ScalarSelectWithPushedPredicates) {
    auto plan = planFind("FIND tasks.title, tasks.priority MATCH tasks.status = 'open' AND tasks.priority IN [1, 2]");
    const auto& q = only(plan).native;
    EXPECT_EQ(q.engine, StorageClass::Scalar);
    EXPECT_EQ(q.shape, ResultShape::Rows);
    EXPECT_EQ(q.text,
              "SELECT \"id\", \"title\", \"priority\" FROM \"main\".\"tasks\" "
              "WHERE (\"status\" = $1) AND \"priority\" = ANY($2)");
    EXPECT_EQ(q.params, (json::array({"open", json::array({1, 2})})));
    EXPECT_FALSE(q.key_param);
    EXPECT_EQ(q.columns, (std::vector<std::string>{"id", "title", "priority"}));
}

TEST_F(TranslatorTest, ScalarKeyLookupReservesKeyParameter) {
    auto plan = planFind("FIND tasks.title, users.username NAVIGATE tasks -> assignees");
    NativeQuery q = plan.fragments[2].native;
    EXPECT_EQ(q.text, "SELECT \"id\", \"username\" FROM \"main\".\"users\" WHERE \"id\" = ANY($1)");
    ASSERT_TRUE(q.key_param);
    EXPECT_EQ(*q.key_param, 0u);

    q.bindKeys({"u1", "u2"});
    EXPECT_EQ(q.params[0], json::array({"u1", "u2"}));
    ASSERT_TRUE(q.keys);
    EXPECT_EQ(q.keys->size(), 2u);
}

TEST_F(TranslatorTest, ScalarNullComparison) {
    auto plan = planFind("FIND tasks.title MATCH tasks.priority != null");
    EXPECT_NE(only(plan).native.text.find("\"priority\" IS NOT NULL"), std::string::npos);
}

TEST_F(TranslatorTest, QuoteIdentDoublesQuotes) {
    EXPECT_EQ(ScalarTranslator::quoteIdent("odd\"name"), "\"odd\"\"name\"");
}

// ===== Document =====

TEST_F(TranslatorTest, DocumentFilterUsesDottedPaths) {
    auto plan = planFind("FIND tasks.metadata MATCH tasks.metadata.kind = 'bug' AND 3 < tasks.metadata.size");
    const auto& q = only(plan).native;
    EXPECT_EQ(q.engine, StorageClass::Document);
    EXPECT_EQ(q.shape, ResultShape::Documents);

    json cmd = json::parse(q.text);
    EXPECT_EQ(cmd["find"], "tasks");
    EXPECT_EQ(cmd["$db"], "main");
    json expected_filter = {{"$and", json::array({
        {{"metadata.kind", {{"$eq", {{"$param", 0}}}}}},
        {{"metadata.size", {{"$gt", {{"$param", 1}}}}}},
    })}};
    EXPECT_EQ(cmd["filter"], expected_filter);
    EXPECT_EQ(cmd["projection"], (json{{"id", 1}, {"metadata", 1}}));
    EXPECT_EQ(q.params, (json::array({"bug", 3})));
}

TEST_F(TranslatorTest, DocumentContainsIsEvaluatedClientSide) {
    auto plan = planFind("FIND tasks.title MATCH tasks.metadata.tags CONTAINS 'x'");
    for (const auto& f : plan.fragments) EXPECT_TRUE(f.predicates.empty());
}

TEST_F(TranslatorTest, DocumentWrites) {
    WriteFragment f;
    f.engine = StorageClass::Document;
    f.operation = NativeOperation::Update;
    f.bucket = "main";
    f.record = "tasks";
    f.key_attribute = "id";
    f.values = {{"metadata", {{"a", 1}}}};
    f.keys = {"t1"};
    NativeQuery q = DocumentTranslator().translateWrite(f);

    json cmd = json::parse(q.text);
    EXPECT_EQ(cmd["update"], "tasks");
    EXPECT_EQ(cmd["updates"][0]["q"], (json{{"id", {{"$in", {{"$param", 1}}}}}}));
    EXPECT_EQ(cmd["updates"][0]["upsert"], true);
    EXPECT_EQ(q.key_param, std::optional<size_t>(1));
    EXPECT_EQ(q.params[0], f.values);
}

// ===== Cypher =====

TEST_F(TranslatorTest, RelationTraversal) {
    auto plan = planFind("FIND users.username NAVIGATE tasks -> assignees MATCH tasks.status = 'open'");
    const auto& q = plan.fragments[1].native;
    EXPECT_EQ(q.operation, NativeOperation::Traverse);
    EXPECT_EQ(q.shape, ResultShape::Paths);
    EXPECT_EQ(q.text,
              "MATCH (s:`tasks` {bucket: $p0})-[:`assignees`]->(t) WHERE s.key IN $p1 "
              "RETURN s.key AS source, t.key AS target");
    EXPECT_EQ(q.key_param, std::optional<size_t>(1));
    EXPECT_EQ(q.columns, (std::vector<std::string>{"source", "target"}));
}

TEST_F(TranslatorTest, RelationAttributeRead) {
    auto plan = planFind("FIND tasks.assignees FROM tasks");
    const auto& q = only(plan).native;
    EXPECT_EQ(q.text,
              "MATCH (s:`tasks` {bucket: $p0}) OPTIONAL MATCH (s)-[:`assignees`]->(t0) "
              "RETURN s.key AS `id`, collect(DISTINCT t0.key) AS `assignees`");
    EXPECT_EQ(q.shape, ResultShape::Rows);
}

TEST_F(TranslatorTest, RelationDeleteDetachesNodes) {
    WriteFragment f;
    f.engine = StorageClass::Relation;
    f.operation = NativeOperation::Delete;
    f.bucket = "main";
    f.record = "tasks";
    f.key_attribute = "id";
    f.keys = {"t1", "t2"};
    NativeQuery q = RelationTranslator().translateWrite(f);
    EXPECT_EQ(q.text, "MATCH (s:`tasks` {bucket: $p0}) WHERE s.key IN $p1 DETACH DELETE s");
    EXPECT_EQ(q.params, (json::array({"main", json::array({"t1", "t2"})})));
}

// ===== Flux =====

TEST_F(TranslatorTest, MetricSeriesLookup) {
    auto plan = planFind("FIND tasks.title, tasks.time_spent");
    ASSERT_EQ(plan.fragments.size(), 2u);
    const auto& q = plan.fragments[1].native;
    EXPECT_EQ(q.engine, StorageClass::Metric);
    EXPECT_EQ(q.shape, ResultShape::Points);
    EXPECT_EQ(q.text,
              "from(bucket: \"main\") |> range(start: 0) |> filter(fn: (r) => r._measurement == \"tasks\") "
              "|> filter(fn: (r) => r._field == \"time_spent\") "
              "|> filter(fn: (r) => contains(value: r.id, set: params.p0)) "
              "|> group(columns: [\"id\", \"_field\"]) |> sort(columns: [\"_time\"])");
}

TEST_F(TranslatorTest, MetricInsertUsesLineProtocol) {
    WriteFragment f;
    f.engine = StorageClass::Metric;
    f.operation = NativeOperation::Insert;
    f.bucket = "main";
    f.record = "tasks";
    f.key_attribute = "id";
    f.values = {{"id", "t 1"}, {"time_spent", json::array({5, 2.5})}};
    NativeQuery q = MetricTranslator().translateWrite(f);
    EXPECT_EQ(q.text, "tasks,id=t\\ 1 time_spent=5i\ntasks,id=t\\ 1 time_spent=2.5");
}

// ===== Shared =====

TEST_F(TranslatorTest, PushDownCapabilities) {
    auto plan = planFind("FIND tasks.title MATCH tasks.metadata.kind = 'bug' AND tasks.time_spent > 1");
    const auto& find = std::get<AnalyzedFind>(stmt_->node);
    auto conjuncts = splitConjuncts(find.match);
    ASSERT_EQ(conjuncts.size(), 2u);

    EXPECT_FALSE(translators.get(StorageClass::Scalar).canPushDown(conjuncts[0]));
    EXPECT_TRUE(translators.get(StorageClass::Document).canPushDown(conjuncts[0]));
    EXPECT_FALSE(translators.get(StorageClass::Metric).canPushDown(conjuncts[1]));
    EXPECT_FALSE(translators.get(StorageClass::Relation).canPushDown(conjuncts[1]));
    EXPECT_STREQ(translators.get(StorageClass::Relation).dialect(), "cypher");
    EXPECT_STREQ(translators.get(StorageClass::Metric).dialect(), "flux");
}

TEST_F(TranslatorTest, TranslationIsDeterministic) {
    const std::string text =
        "FIND tasks.title, tasks.metadata, tasks.time_spent, users.username NAVIGATE tasks -> assignees "
        "MATCH tasks.status = 'open' AND tasks.metadata.kind = 'bug'";
    auto a = planFind(text);
    auto b = planFind(text);
    ASSERT_EQ(a.fragments.size(), b.fragments.size());
    for (size_t i = 0; i < a.fragments.size(); ++i) {
        EXPECT_EQ(a.fragments[i].native.text, b.fragments[i].native.text);
        EXPECT_EQ(a.fragments[i].native.params, b.fragments[i].native.params);
        EXPECT_EQ(translators.get(a.fragments[i].engine).translate(a.fragments[i]).text,
                  a.fragments[i].native.text);
    }
}
