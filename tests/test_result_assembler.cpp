#include <gtest/gtest.h>
#include "query/physical_planner.h"
#include "query/qql_parser.h"
#include "query/query_optimizer.h"
#include "query/result_assembler.h"
#include "test_helpers.h"

using namespace quanta;
using namespace quanta::query;
using json = nlohmann::json;

class ResultAssemblerTest : public ::testing::Test {
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
        const auto& f = find();
        auto optimized = optimizer.optimize(logical.build(f), f);
        return physical.plan(*optimized.root, f);
    }

    const AnalyzedFind& find() const { return std::get<AnalyzedFind>(stmt_->node); }

    /// One entry of rows per fragment, in fragment order
    static ExecutionResult executed(const PhysicalPlan& plan, std::vector<std::vector<json>> rows) {
        EXPECT_EQ(rows.size(), plan.fragments.size());
        ExecutionResult result;
        for (size_t i = 0; i < rows.size(); ++i) {
            FragmentResult r;
            r.fragment = static_cast<int>(i);
            r.rows = std::move(rows[i]);
            r.executed = true;
            result.fragments.push_back(std::move(r));
        }
        return result;
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
    ResultAssembler assembler{cfg.execution.default_page_size};
    AnalyzedStatementPtr stmt_;
};

TEST_F(ResultAssemblerTest, MergesEngineRowsOnTheRecordKey) {
    auto plan = planFind("FIND tasks.title, tasks.metadata.kind");
    ASSERT_EQ(plan.fragments.size(), 2u);
    ASSERT_EQ(plan.fragments[1].engine, StorageClass::Document);

    auto execution = executed(plan, {
        {{{"id", "t1"}, {"title", "fix login"}}, {{"id", "t2"}, {"title", "write docs"}}},
        {{{"id", "t1"}, {"metadata", {{"kind", "bug"}}}}},
    });
    json out = assembler.assemble(plan, find(), execution, 1.5);

    json expected = json::array({
        {{"tasks", {{"title", "fix login"}, {"metadata.kind", "bug"}}}},
        {{"tasks", {{"title", "write docs"}, {"metadata.kind", nullptr}}}},
    });
    EXPECT_EQ(out["data"], expected);
    EXPECT_EQ(out["metadata"]["total_count"], 2);
    EXPECT_EQ(out["metadata"]["returned_count"], 2);
    EXPECT_EQ(out["metadata"]["page"], 1);
    EXPECT_EQ(out["metadata"]["page_size"], 100);
    EXPECT_EQ(out["metadata"]["execution_time_ms"], 1.5);
    EXPECT_FALSE(out["metadata"].contains("partial"));
}

TEST_F(ResultAssemblerTest, NavigationJoinsThroughTraversalPairs) {
    auto plan = planFind("FIND tasks.title, users.username NAVIGATE tasks -> assignees");
    ASSERT_EQ(plan.fragments.size(), 3u);

    auto execution = executed(plan, {
        {{{"id", "t1"}, {"title", "fix login"}}, {{"id", "t2"}, {"title", "write docs"}},
         {{"id", "t3"}, {"title", "unassigned"}}},
        {{{"source", "t1"}, {"target", "u1"}}, {{"source", "t1"}, {"target", "u2"}},
         {{"source", "t2"}, {"target", "u1"}}},
        {{{"id", "u1"}, {"username", "ann"}}, {{"id", "u2"}, {"username", "bob"}}},
    });
    json data = assembler.assemble(plan, find(), execution, 0.0)["data"];

    // t3 has no assignee and drops out
    ASSERT_EQ(data.size(), 3u);
    EXPECT_EQ(data[0], (json{{"tasks", {{"title", "fix login"}}}, {"users", {{"username", "ann"}}}}));
    EXPECT_EQ(data[1], (json{{"tasks", {{"title", "fix login"}}}, {"users", {{"username", "bob"}}}}));
    EXPECT_EQ(data[2], (json{{"tasks", {{"title", "write docs"}}}, {"users", {{"username", "ann"}}}}));
}

TEST_F(ResultAssemblerTest, GroupedAggregateWithHaving) {
    auto plan = planFind(
        "FIND users.username, COUNT(tasks) AS n NAVIGATE tasks -> assignees "
        "GROUP BY users.username HAVING COUNT(tasks) > 1");
    ASSERT_EQ(plan.fragments.size(), 3u);

    auto execution = executed(plan, {
        {{{"id", "t1"}}, {{"id", "t2"}}},
        {{{"source", "t1"}, {"target", "u1"}}, {{"source", "t1"}, {"target", "u2"}},
         {{"source", "t2"}, {"target", "u1"}}},
        {{{"id", "u1"}, {"username", "ann"}}, {{"id", "u2"}, {"username", "bob"}}},
    });
    json data = assembler.assemble(plan, find(), execution, 0.0)["data"];
    ASSERT_EQ(data.size(), 1u);
    EXPECT_EQ(data[0], (json{{"users", {{"username", "ann"}}}, {"n", 2}}));
}

TEST_F(ResultAssemblerTest, AggregateFunctions) {
    planFind(
        "FIND AVG(tasks.time_spent), SUM(tasks.priority), MIN(tasks.title), MAX(tasks.priority), "
        "COUNT(tasks.priority), COUNT(*) FROM tasks");
    json a = {{"tasks", {{"id", "t1"}, {"title", "b"}, {"priority", 1},
                         {"time_spent", json::array({{{"time", "2025-01-01T00:00:00Z"}, {"value", 10}},
                                                     {{"time", "2025-01-02T00:00:00Z"}, {"value", 20}}})}}}};
    json b = {{"tasks", {{"id", "t2"}, {"title", "a"}, {"priority", nullptr}, {"time_spent", 30}}}};
    json c = {{"tasks", {{"id", "t3"}, {"title", "c"}, {"priority", 4}}}};

    auto values = ResultAssembler::computeAggregates(find().aggregates, {&a, &b, &c});
    EXPECT_DOUBLE_EQ(values.at("AVG(tasks.time_spent)").get<double>(), 20.0);
    EXPECT_EQ(values.at("SUM(tasks.priority)"), 5);
    EXPECT_EQ(values.at("MIN(tasks.title)"), "a");
    EXPECT_EQ(values.at("MAX(tasks.priority)"), 4);
    EXPECT_EQ(values.at("COUNT(tasks.priority)"), 2);
    EXPECT_EQ(values.at("COUNT(*)"), 3);
}

TEST_F(ResultAssemblerTest, AggregatesOfEmptyInput) {
    planFind("FIND AVG(tasks.priority), COUNT(*) FROM tasks");
    auto values = ResultAssembler::computeAggregates(find().aggregates, {});
    EXPECT_TRUE(values.at("AVG(tasks.priority)").is_null());
    EXPECT_EQ(values.at("COUNT(*)"), 0);
}

TEST_F(ResultAssemblerTest, ClientSideFilterSortAndPaging) {
    auto plan = planFind(
        "FIND tasks.title, tasks.time_spent MATCH tasks.time_spent > 5 "
        "ORDER BY tasks.title DESC LIMIT 1 OFFSET 1");
    ASSERT_EQ(plan.fragments.size(), 2u);
    ASSERT_EQ(plan.fragments[1].engine, StorageClass::Metric);

    auto execution = executed(plan, {
        {{{"id", "t1"}, {"title", "a"}}, {{"id", "t2"}, {"title", "b"}}, {{"id", "t3"}, {"title", "c"}}},
        {{{"id", "t1"}, {"time_spent", 10}}, {{"id", "t2"}, {"time_spent", 3}},
         {{"id", "t3"}, {"time_spent", 7}}},
    });
    json out = assembler.assemble(plan, find(), execution, 0.0);

    // t1 and t3 pass the filter; sorted c, a; the second page holds a
    EXPECT_EQ(out["data"], (json::array({{{"tasks", {{"title", "a"}, {"time_spent", 10}}}}})));
    EXPECT_EQ(out["metadata"]["total_count"], 2);
    EXPECT_EQ(out["metadata"]["returned_count"], 1);
    EXPECT_EQ(out["metadata"]["page"], 2);
    EXPECT_EQ(out["metadata"]["page_size"], 1);
}

TEST_F(ResultAssemblerTest, MetricSeriesAreSortedByTime) {
    auto plan = planFind("FIND tasks.time_spent FROM tasks");
    ASSERT_EQ(plan.fragments.size(), 1u);

    auto execution = executed(plan, {
        {{{"id", "t1"}, {"time_spent", json::array({{{"time", "2025-01-02T00:00:00+01:00"}, {"value", 2}},
                                                     {{"time", "2025-01-01"}, {"value", 1}}})}}},
    });
    json data = assembler.assemble(plan, find(), execution, 0.0)["data"];
    ASSERT_EQ(data.size(), 1u);
    json expected = json::array({{{"time", "2025-01-01T00:00:00Z"}, {"value", 1}},
                                 {{"time", "2025-01-01T23:00:00Z"}, {"value", 2}}});
    EXPECT_EQ(data[0]["tasks"]["time_spent"], expected);
}

TEST_F(ResultAssemblerTest, PartialResultsAreFlagged) {
    auto plan = planFind("FIND tasks.title, tasks.metadata");
    auto execution = executed(plan, {{{{"id", "t1"}, {"title", "fix login"}}}, {}});
    execution.fragments[1].executed = false;
    execution.fragments[1].failed = true;
    execution.failed_engines = {"mongodb"};
    execution.engines["postgres"].units_scanned = 1;
    execution.engines["postgres"].queries = 1;

    json out = assembler.assemble(plan, find(), execution, 0.0);
    EXPECT_EQ(out["data"], (json::array({{{"tasks", {{"title", "fix login"}, {"metadata", nullptr}}}}})));
    EXPECT_EQ(out["metadata"]["partial"], true);
    EXPECT_EQ(out["metadata"]["failed_engines"], json::array({"mongodb"}));
    EXPECT_EQ(out["engines"]["postgres"]["units_scanned"], 1);
}
