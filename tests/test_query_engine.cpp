#include <gtest/gtest.h>
#include "query/query_engine.h"
#include "test_helpers.h"

#include <algorithm>

using namespace quanta;
using namespace quanta::query;
using json = nlohmann::json;

namespace {

config::EngineConfig testConfig() {
    auto cfg = config::EngineConfig::defaults();
    cfg.transaction.decision_log_path = "";
    cfg.execution.query_timeout = std::chrono::milliseconds(5000);
    return cfg;
}

bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

} // namespace

class QueryEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto [st, info] = engine.schema().createBucket("main");
        ASSERT_TRUE(st.ok) << st.toString();

        ok("CREATE RECORD users (id: SCALAR<STRING> PRIMARY KEY, username: SCALAR<STRING> INDEXED, "
           "profile: DOCUMENT, login_times: METRIC<COUNT>)");
        ok("CREATE RECORD tasks (id: SCALAR<STRING> PRIMARY KEY, title: SCALAR<STRING>, "
           "status: SCALAR<STRING> INDEXED, priority: SCALAR<INT>, metadata: DOCUMENT, "
           "assignees: RELATION<users>, time_spent: METRIC<SECONDS>)");
    }

    QueryResponse run(const std::string& query, std::optional<std::string> txn = std::nullopt) {
        QueryRequest req;
        req.bucket = "main";
        req.query = query;
        req.transaction_id = std::move(txn);
        return engine.execute(req);
    }

    json ok(const std::string& query) {
        auto response = run(query);
        EXPECT_TRUE(response.ok()) << query << "\n" << response.status.toString();
        return response.body;
    }

    void seedUsers() {
        ok("ADD users {id: 'u1', username: 'ann'}");
        ok("ADD users {id: 'u2', username: 'bob'}");
    }

    test::Backends backends;
    SchemaRegistry registry;
    QueryEngine engine{registry, backends.registry, testConfig()};
};

TEST_F(QueryEngineTest, CreateRecordProvisionsEveryEngine) {
    EXPECT_TRUE(contains(backends.scalar->provisions(), "tasks.title"));
    EXPECT_TRUE(contains(backends.scalar->provisions(), "tasks.status"));
    EXPECT_TRUE(contains(backends.document->provisions(), "tasks.metadata"));
    EXPECT_TRUE(contains(backends.relation->provisions(), "tasks.assignees"));
    EXPECT_TRUE(contains(backends.metric->provisions(), "tasks.time_spent"));
    EXPECT_FALSE(contains(backends.scalar->provisions(), "tasks.time_spent"));

    auto schema = engine.schema().getRecord("main", "tasks");
    ASSERT_NE(schema, nullptr);
    EXPECT_EQ(schema->keyAttribute(), "id");
}

TEST_F(QueryEngineTest, WritesAreRoutedByStorageClass) {
    seedUsers();
    backends.resetCounters();

    auto body = ok("ADD tasks {id: 't1', title: 'fix login', metadata: {kind: 'bug'}, "
                   "assignees: ['u1'], time_spent: 30}");
    EXPECT_EQ(body["metadata"]["key"], "t1");
    EXPECT_EQ(body["metadata"]["operation"], "insert");
    for (const auto& a : backends.all()) {
        EXPECT_EQ(a->insert_calls, 1) << a->name();
        EXPECT_EQ(a->commit_calls, 1) << a->name();
    }

    auto found = ok("FIND tasks.title, tasks.metadata.kind, tasks.time_spent MATCH tasks.id = 't1'");
    ASSERT_EQ(found["data"].size(), 1u);
    EXPECT_EQ(found["data"][0]["tasks"],
              (json{{"title", "fix login"}, {"metadata.kind", "bug"}, {"time_spent", 30}}));
}

TEST_F(QueryEngineTest, AddWithoutKeyGeneratesUuid) {
    auto body = ok("ADD users {username: 'carl'}");
    const auto& key = body["metadata"]["key"];
    ASSERT_TRUE(key.is_string());
    EXPECT_EQ(key.get<std::string>().size(), 36u);
    EXPECT_EQ(key.get<std::string>()[14], '4');

    auto found = ok("FIND users.id FROM users MATCH users.username = 'carl'");
    ASSERT_EQ(found["data"].size(), 1u);
    EXPECT_EQ(found["data"][0]["users"]["id"], key);
}

TEST_F(QueryEngineTest, MultiHopRead) {
    seedUsers();
    ok("ADD tasks {id: 't1', title: 'fix login', status: 'open', assignees: ['u2', 'u1']}");
    ok("ADD tasks {id: 't2', title: 'write docs', status: 'done', assignees: ['u2']}");
    ok("ADD tasks {id: 't3', title: 'triage', status: 'open'}");

    auto body = ok("FIND tasks.title, users.username NAVIGATE tasks -> assignees "
                   "MATCH tasks.status = 'open' ORDER BY users.username");
    json expected = json::array({
        {{"tasks", {{"title", "fix login"}}}, {"users", {{"username", "ann"}}}},
        {{"tasks", {{"title", "fix login"}}}, {"users", {{"username", "bob"}}}},
    });
    EXPECT_EQ(body["data"], expected);
    EXPECT_EQ(body["metadata"]["returned_count"], 2);
    EXPECT_TRUE(body["engines"].contains("postgres"));
    EXPECT_TRUE(body["engines"].contains("neo4j"));
    EXPECT_FALSE(body["engines"].contains("influxdb"));
}

TEST_F(QueryEngineTest, CrossEngineAggregation) {
    seedUsers();
    for (int i = 1; i <= 8; ++i) {
        const std::string id = "t" + std::to_string(i);
        const std::string owner = i <= 6 ? "u1" : "u2";
        ok("ADD tasks {id: '" + id + "', title: 'task " + id + "', assignees: ['" + owner + "'], time_spent: " +
           std::to_string(i * 10) + "}");
    }

    auto body = ok("FIND users.username, COUNT(tasks) AS n, AVG(tasks.time_spent) AS avg_time "
                   "NAVIGATE tasks -> assignees GROUP BY users.username HAVING COUNT(tasks) > 5");
    ASSERT_EQ(body["data"].size(), 1u);
    const auto& row = body["data"][0];
    EXPECT_EQ(row["users"]["username"], "ann");
    EXPECT_EQ(row["n"], 6);
    EXPECT_DOUBLE_EQ(row["avg_time"].get<double>(), 35.0);
}

TEST_F(QueryEngineTest, PrepareFailureAbortsTheWholeWrite) {
    backends.metric->fail_prepare = true;
    auto response = run("ADD tasks {id: 't1', title: 'fix login', time_spent: 30}");
    ASSERT_FALSE(response.ok());
    EXPECT_EQ(response.status.kind, ErrorKind::Transaction);
    EXPECT_EQ(response.status.engine, "influxdb");
    EXPECT_TRUE(response.toJSON().contains("error"));

    backends.metric->fail_prepare = false;
    auto found = ok("FIND tasks.title FROM tasks");
    EXPECT_TRUE(found["data"].empty());
    EXPECT_EQ(backends.scalar->memory().rowCount("main", "tasks"), 0u);
}

TEST_F(QueryEngineTest, UpdateAndRemove) {
    ok("ADD tasks {id: 't1', title: 'a', status: 'open', priority: 3}");
    ok("ADD tasks {id: 't2', title: 'b', status: 'open', priority: 1}");
    ok("ADD tasks {id: 't3', title: 'c', status: 'open', priority: 5, metadata: {kind: 'bug'}}");

    auto updated = ok("UPDATE tasks SET status = 'done' MATCH tasks.priority > 2");
    EXPECT_EQ(updated["metadata"]["affected"], 2);
    EXPECT_EQ(updated["metadata"]["operation"], "update");

    auto done = ok("FIND tasks.title MATCH tasks.status = 'done' ORDER BY tasks.title");
    EXPECT_EQ(done["data"], (json::array({{{"tasks", {{"title", "a"}}}}, {{"tasks", {{"title", "c"}}}}})));

    auto removed = ok("REMOVE tasks MATCH tasks.status = 'done'");
    EXPECT_EQ(removed["metadata"]["affected"], 2);
    EXPECT_EQ(backends.scalar->memory().rowCount("main", "tasks"), 1u);
    EXPECT_EQ(backends.document->memory().rowCount("main", "tasks"), 0u);

    auto none = ok("UPDATE tasks SET title = 'x' MATCH tasks.priority > 100");
    EXPECT_EQ(none["metadata"]["affected"], 0);
}

TEST_F(QueryEngineTest, TransactionBlockCommits) {
    seedUsers();
    ok("ADD tasks {id: 't1', title: 'a', priority: 1}");

    auto body = ok("BEGIN TRANSACTION; ADD users {id: 'u9', username: 'zoe'}; "
                   "UPDATE tasks SET priority = 4 MATCH tasks.id = 't1' COMMIT");
    EXPECT_EQ(body["data"].size(), 2u);
    EXPECT_EQ(body["metadata"]["statements"], 2);

    EXPECT_EQ(ok("FIND users.username FROM users MATCH users.id = 'u9'")["data"].size(), 1u);
    EXPECT_EQ(ok("FIND tasks.priority FROM tasks")["data"][0]["tasks"]["priority"], 4);
    EXPECT_EQ(engine.transactions().getStats().active, 0u);
}

TEST_F(QueryEngineTest, TransactionBlockSeesItsOwnWrites) {
    auto body = ok("BEGIN TRANSACTION; ADD users {id: 'u1', username: 'ann'}; "
                   "UPDATE users SET username = 'zed' MATCH users.id = 'u1' COMMIT");
    ASSERT_EQ(body["data"].size(), 2u);
    EXPECT_EQ(body["data"][1]["metadata"]["affected"], 1);

    auto found = ok("FIND users.username FROM users MATCH users.id = 'u1'");
    ASSERT_EQ(found["data"].size(), 1u);
    EXPECT_EQ(found["data"][0]["users"]["username"], "zed");

    auto [st, id] = engine.beginTransaction();
    ASSERT_TRUE(st.ok);
    ASSERT_TRUE(run("ADD users {id: 'u2', username: 'bob'}", id).ok());
    auto inside = run("FIND users.username FROM users ORDER BY users.username", id);
    ASSERT_TRUE(inside.ok()) << inside.status.toString();
    EXPECT_EQ(inside.body["data"].size(), 2u);

    auto removed = run("REMOVE users MATCH users.id = 'u2'", id);
    ASSERT_TRUE(removed.ok()) << removed.status.toString();
    EXPECT_EQ(removed.body["metadata"]["affected"], 1);
    ASSERT_TRUE(engine.commitTransaction(id).ok);
    EXPECT_EQ(ok("FIND users.username FROM users")["data"].size(), 1u);
}

TEST_F(QueryEngineTest, FailingStatementRollsBackTheBlock) {
    seedUsers();
    backends.document->fail_write = true;

    auto response = run("BEGIN TRANSACTION; ADD users {id: 'u9', username: 'zoe'}; "
                        "ADD tasks {id: 't9', metadata: {kind: 'bug'}} COMMIT");
    ASSERT_FALSE(response.ok());
    EXPECT_EQ(response.status.engine, "mongodb");

    EXPECT_TRUE(ok("FIND users.username FROM users MATCH users.id = 'u9'")["data"].empty());
    EXPECT_EQ(engine.transactions().getStats().committed, 0u);
}

TEST_F(QueryEngineTest, CallerManagedTransaction) {
    auto [st, id] = engine.beginTransaction();
    ASSERT_TRUE(st.ok);

    ASSERT_TRUE(run("ADD users {id: 'u5', username: 'eve'}", id).ok());
    EXPECT_TRUE(ok("FIND users.username FROM users")["data"].empty());

    auto nested = run("BEGIN TRANSACTION; ADD users {username: 'x'} COMMIT", id);
    EXPECT_EQ(nested.status.kind, ErrorKind::Transaction);

    ASSERT_TRUE(engine.commitTransaction(id).ok);
    EXPECT_EQ(ok("FIND users.username FROM users")["data"].size(), 1u);
}

TEST_F(QueryEngineTest, ExplainDoesNotExecute) {
    backends.resetCounters();
    auto body = ok("EXPLAIN FIND tasks.title, users.username NAVIGATE tasks -> assignees "
                   "MATCH tasks.status = 'open'");
    const auto& explain = body["explain"];
    EXPECT_EQ(explain["statement"], "FIND");
    EXPECT_EQ(explain["optimizer"].size(), 4u);
    EXPECT_EQ(explain["physical_plan"]["fragments"].size(), 3u);
    EXPECT_TRUE(explain["logical_plan"].is_object());
    for (const auto& a : backends.all()) EXPECT_EQ(a->select_calls, 0) << a->name();

    auto write = ok("EXPLAIN ADD tasks {id: 'tx', title: 'a', time_spent: 1}");
    EXPECT_EQ(write["explain"]["write_plan"]["fragments"].size(), 2u);
    for (const auto& a : backends.all()) EXPECT_EQ(a->insert_calls, 0) << a->name();
}

TEST_F(QueryEngineTest, PaginationWithoutLimit) {
    for (int i = 1; i <= 7; ++i) ok("ADD tasks {id: 't" + std::to_string(i) + "', title: 'task " + std::to_string(i) + "'}");

    QueryRequest req;
    req.bucket = "main";
    req.query = "FIND tasks.title ORDER BY tasks.title";
    req.page = 2;
    req.page_size = 3;
    auto response = engine.execute(req);
    ASSERT_TRUE(response.ok()) << response.status.toString();

    const auto& body = response.body;
    EXPECT_EQ(body["data"], (json::array({{{"tasks", {{"title", "task 4"}}}}, {{"tasks", {{"title", "task 5"}}}},
                                          {{"tasks", {{"title", "task 6"}}}}})));
    EXPECT_EQ(body["metadata"]["page"], 2);
    EXPECT_EQ(body["metadata"]["page_size"], 3);
    EXPECT_EQ(body["metadata"]["returned_count"], 3);
    EXPECT_EQ(body["metadata"]["total_count"], 7);

    // an explicit LIMIT wins over the request
    req.query = "FIND tasks.title ORDER BY tasks.title LIMIT 2";
    auto limited = engine.execute(req);
    ASSERT_TRUE(limited.ok());
    EXPECT_EQ(limited.body["data"].size(), 2u);
    EXPECT_EQ(limited.body["metadata"]["page"], 1);
}

TEST_F(QueryEngineTest, TotalCountIgnoresLimit) {
    seedUsers();
    ok("ADD users {id: 'u3', username: 'cat'}");

    auto first = ok("FIND users.username FROM users ORDER BY users.username LIMIT 1");
    EXPECT_EQ(first["data"], (json::array({{{"users", {{"username", "ann"}}}}})));
    EXPECT_EQ(first["metadata"]["total_count"], 3);
    EXPECT_EQ(first["metadata"]["returned_count"], 1);
    EXPECT_EQ(first["metadata"]["page"], 1);

    auto second = ok("FIND users.username FROM users ORDER BY users.username LIMIT 1 OFFSET 1");
    EXPECT_EQ(second["data"], (json::array({{{"users", {{"username", "bob"}}}}})));
    EXPECT_EQ(second["metadata"]["total_count"], 3);
    EXPECT_EQ(second["metadata"]["page"], 2);
}

TEST_F(QueryEngineTest, ErrorsCarryPositionAndContext) {
    auto lexical = run("FIND tasks.title MATCH tasks.title = 'open");
    EXPECT_EQ(lexical.status.kind, ErrorKind::Lexical);

    auto syntax = run("FIND tasks.title MATCH");
    EXPECT_EQ(syntax.status.kind, ErrorKind::Syntax);

    auto schema = run("FIND tasks.colour");
    EXPECT_EQ(schema.status.kind, ErrorKind::Schema);
    EXPECT_EQ(schema.status.attribute, "colour");

    auto type = run("FIND tasks.title MATCH tasks.priority = 'high'");
    EXPECT_EQ(type.status.kind, ErrorKind::Type);
    EXPECT_EQ(type.toJSON()["error"]["kind"], errorKindName(ErrorKind::Type));
}

TEST_F(QueryEngineTest, PartialResultsOnRequest) {
    ok("ADD tasks {id: 't1', title: 'a', metadata: {kind: 'bug'}}");
    backends.document->fail_select = true;

    EXPECT_EQ(run("FIND tasks.title, tasks.metadata").status.kind, ErrorKind::Engine);

    QueryRequest req = QueryRequest::fromJSON(
        {{"bucket", "main"}, {"query", "FIND tasks.title, tasks.metadata"}, {"allowPartial", true}});
    auto response = engine.execute(req);
    ASSERT_TRUE(response.ok()) << response.status.toString();
    EXPECT_EQ(response.body["metadata"]["failed_engines"], json::array({"mongodb"}));
    EXPECT_EQ(response.body["data"][0]["tasks"]["title"], "a");
    EXPECT_TRUE(response.body["data"][0]["tasks"]["metadata"].is_null());
}

TEST_F(QueryEngineTest, CreateRelationAddsAttribute) {
    auto body = ok("CREATE RELATION reviewer FROM tasks TO users");
    EXPECT_EQ(body["metadata"]["operation"], "create_relation");
    EXPECT_TRUE(contains(backends.relation->provisions(), "tasks.reviewer"));

    seedUsers();
    ok("ADD tasks {id: 't1', title: 'a', reviewer: ['u2']}");
    auto found = ok("FIND r.username NAVIGATE tasks -> reviewer AS r");
    ASSERT_EQ(found["data"].size(), 1u);
    EXPECT_EQ(found["data"][0]["r"]["username"], "bob");
}

TEST_F(QueryEngineTest, AlterRecordAddsColumns) {
    seedUsers();
    backends.resetCounters();

    auto body = ok("ALTER RECORD users ADD COLUMN email: SCALAR<STRING> INDEXED, ADD settings DOCUMENT");
    EXPECT_EQ(body["metadata"]["operation"], "alter_record");
    EXPECT_EQ(backends.scalar->provisions(), (std::vector<std::string>{"users.email"}));
    EXPECT_EQ(backends.document->provisions(), (std::vector<std::string>{"users.settings"}));
    EXPECT_TRUE(engine.schema().getRecord("main", "users")->find("email")->indexed);

    ok("UPDATE users SET email = 'ann@example.org' MATCH users.id = 'u1'");
    auto found = ok("FIND users.username FROM users MATCH users.email = 'ann@example.org'");
    ASSERT_EQ(found["data"].size(), 1u);
    EXPECT_EQ(found["data"][0]["users"]["username"], "ann");

    auto duplicate = run("ALTER RECORD users ADD username: SCALAR");
    EXPECT_EQ(duplicate.status.kind, ErrorKind::Schema);
    EXPECT_EQ(duplicate.status.attribute, "username");

    EXPECT_EQ(run("ALTER RECORD users ADD code: SCALAR PRIMARY KEY").status.kind, ErrorKind::Syntax);
    EXPECT_EQ(run("ALTER RECORD ghosts ADD x: SCALAR").status.kind, ErrorKind::Schema);
}

TEST_F(QueryEngineTest, CreateIndexSwitchesToIndexScan) {
    auto scan = [this]() {
        auto body = ok("EXPLAIN FIND tasks.id FROM tasks MATCH tasks.title = 'a'");
        return body["explain"]["physical_plan"]["fragments"][0]["algorithm"].get<std::string>();
    };
    EXPECT_EQ(scan(), "FullScan");
    backends.resetCounters();

    auto body = ok("CREATE INDEX ON tasks(title, priority)");
    EXPECT_EQ(body["metadata"]["operation"], "create_index");
    EXPECT_EQ(backends.scalar->provisions(), (std::vector<std::string>{"tasks.title", "tasks.priority"}));
    EXPECT_EQ(scan(), "IndexScan");

    auto unknown = run("CREATE INDEX ON tasks(colour)");
    EXPECT_EQ(unknown.status.kind, ErrorKind::Schema);
    EXPECT_EQ(unknown.status.attribute, "colour");
}
