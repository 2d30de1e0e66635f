// Federated query engine facade

#include "query/query_engine.h"
#include "query/qql_parser.h"
#include "utils/logger.h"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <random>
#include <sstream>

namespace quanta {
namespace query {

using json = nlohmann::json;

namespace {

double msSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
}

QueryResponse failure(Status status) {
    QueryResponse response;
    response.status = std::move(status);
    return response;
}

json enginesToJSON(const std::map<std::string, EngineStats>& engines) {
    json out = json::object();
    for (const auto& [name, stats] : engines) {
        out[name] = {{"units_scanned", stats.units_scanned}, {"execution_time_ms", stats.execution_time_ms}};
    }
    return out;
}

const char* operationName(NativeOperation op) {
    switch (op) {
        case NativeOperation::Insert: return "insert";
        case NativeOperation::Update: return "update";
        case NativeOperation::Delete: return "delete";
        default: return "select";
    }
}

} // namespace

std::string generateUuid() {
    static thread_local std::mt19937_64 gen((std::random_device())());
    std::uniform_int_distribution<uint64_t> dis;
    uint64_t hi = dis(gen);
    uint64_t lo = dis(gen);
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;   // version 4
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;   // RFC 4122 variant

    std::ostringstream oss;
    oss << std::hex << std::setfill('0')
        << std::setw(8) << (hi >> 32) << "-"
        << std::setw(4) << ((hi >> 16) & 0xFFFF) << "-"
        << std::setw(4) << (hi & 0xFFFF) << "-"
        << std::setw(4) << (lo >> 48) << "-"
        << std::setw(12) << (lo & 0xFFFFFFFFFFFFULL);
    return oss.str();
}

QueryRequest QueryRequest::fromJSON(const json& j) {
    QueryRequest req;
    req.bucket = j.at("bucket").get<std::string>();
    req.query = j.at("query").get<std::string>();
    if (j.contains("transactionId") && j["transactionId"].is_string()) {
        req.transaction_id = j["transactionId"].get<std::string>();
    }
    if (j.contains("allowPartial") && j["allowPartial"].is_boolean()) {
        req.allow_partial = j["allowPartial"].get<bool>();
    }
    if (j.contains("page") && j["page"].is_number_unsigned()) req.page = j["page"].get<size_t>();
    if (j.contains("pageSize") && j["pageSize"].is_number_unsigned()) req.page_size = j["pageSize"].get<size_t>();
    return req;
}

json QueryResponse::toJSON() const {
    if (status.ok) return body;
    return {{"error", status.toJSON()}};
}

QueryEngine::QueryEngine(SchemaRegistry& registry, const AdapterRegistry& adapters, config::EngineConfig cfg)
    : registry_(registry),
      adapters_(adapters),
      cfg_(std::move(cfg)),
      schema_(registry_, adapters_),
      analyzer_(registry_),
      translators_(),
      logical_planner_(cfg_.planner),
      optimizer_(logical_planner_, translators_),
      physical_planner_(cfg_.planner, translators_),
      transactions_(adapters_, cfg_.transaction),
      coordinator_(adapters_, transactions_, cfg_.execution, cfg_.transaction.implicit_for_multi_engine_writes),
      assembler_(cfg_.execution.default_page_size) {
    auto in_doubt = transactions_.recoverInDoubt();
    if (!in_doubt.empty()) {
        QUANTA_WARN("QueryEngine: {} transaction(s) need manual resolution", in_doubt.size());
    }
}

std::pair<Status, AnalyzedStatementPtr> QueryEngine::prepare(const std::string& bucket,
                                                             const std::string& query) const {
    QQLParser parser;
    auto parsed = parser.parse(query);
    if (!parsed.success) return {parsed.error, nullptr};
    return analyzer_.analyze(bucket, *parsed.statement);
}

QueryResponse QueryEngine::execute(const QueryRequest& request) {
    QUANTA_INFO("Query submitted (bucket={}): {}", request.bucket, request.query);
    auto [st, stmt] = prepare(request.bucket, request.query);
    if (!st.ok) {
        QUANTA_DEBUG("Query rejected: {}", st.toString());
        return failure(std::move(st));
    }

    RunOptions options;
    options.transaction_id = request.transaction_id;
    options.allow_partial = request.allow_partial.value_or(cfg_.execution.allow_partial_results);
    options.page = request.page;
    options.page_size = request.page_size;

    auto response = run(*stmt, options);
    if (!response.ok()) {
        QUANTA_WARN("Query failed: {}", response.status.toString());
    }
    return response;
}

std::pair<Status, std::string> QueryEngine::beginTransaction() {
    return transactions_.begin();
}

Status QueryEngine::commitTransaction(const std::string& id) {
    return transactions_.commit(id);
}

Status QueryEngine::rollbackTransaction(const std::string& id) {
    return transactions_.rollback(id);
}

QueryResponse QueryEngine::run(const AnalyzedStatement& stmt, const RunOptions& options) {
    return std::visit([&](const auto& node) -> QueryResponse {
        using T = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<T, AnalyzedFind>) return runFind(node, options);
        else if constexpr (std::is_same_v<T, AnalyzedAdd>) return runAdd(node, options);
        else if constexpr (std::is_same_v<T, AnalyzedUpdate>) return runUpdate(node, options);
        else if constexpr (std::is_same_v<T, AnalyzedRemove>) return runRemove(node, options);
        else if constexpr (std::is_same_v<T, AnalyzedTransaction>) return runTransaction(node, options);
        else if constexpr (std::is_same_v<T, AnalyzedCreateRecord>) return runCreateRecord(node);
        else if constexpr (std::is_same_v<T, AnalyzedCreateRelation>) return runCreateRelation(node);
        else if constexpr (std::is_same_v<T, AnalyzedAlterRecord>) return runAlterRecord(node);
        else if constexpr (std::is_same_v<T, AnalyzedCreateIndex>) return runCreateIndex(node);
        else return explain(*node.inner);
    }, stmt.node);
}

// ============================================================================
// Reads
// ============================================================================

QueryEngine::PlannedFind QueryEngine::planFind(const AnalyzedFind& find) const {
    PlannedFind planned;
    planned.logical = logical_planner_.build(find);
    planned.optimized = optimizer_.optimize(logical_planner_.build(find), find);
    planned.physical = physical_planner_.plan(*planned.optimized.root, find);
    return planned;
}

QueryResponse QueryEngine::runFind(const AnalyzedFind& analyzed, const RunOptions& options) {
    auto start = std::chrono::steady_clock::now();

    AnalyzedFind find = analyzed;
    if (!find.limit && (options.page || options.page_size)) {
        size_t page_size = options.page_size.value_or(cfg_.execution.default_page_size);
        if (page_size == 0) page_size = cfg_.execution.default_page_size;
        size_t page = std::max<size_t>(options.page.value_or(1), 1);
        find.limit = static_cast<int64_t>(page_size);
        find.offset = static_cast<int64_t>((page - 1) * page_size);
    }

    PlannedFind planned;
    try {
        planned = planFind(find);
    } catch (const StatusError& e) {
        return failure(e.status());
    }
    QUANTA_DEBUG("FIND planned: {} fragment(s) in {} wave(s)", planned.physical.fragments.size(),
                 planned.physical.wave_count);

    ExecutionCoordinator::Options exec;
    exec.transaction_id = options.transaction_id;
    exec.allow_partial = options.allow_partial;
    auto execution = coordinator_.execute(planned.physical, exec);
    if (!execution.status.ok) return failure(execution.status);

    QueryResponse response;
    try {
        response.body = assembler_.assemble(planned.physical, find, execution, msSince(start));
    } catch (const StatusError& e) {
        return failure(e.status());
    }
    return response;
}

std::pair<Status, std::vector<json>> QueryEngine::resolveKeys(const AnalyzedFind& keys, const RunOptions& options) {
    PlannedFind planned;
    try {
        planned = planFind(keys);
    } catch (const StatusError& e) {
        return {e.status(), {}};
    }

    ExecutionCoordinator::Options exec;
    exec.transaction_id = options.transaction_id;
    auto execution = coordinator_.execute(planned.physical, exec);
    if (!execution.status.ok) return {execution.status, {}};

    const Binding* primary = keys.binding(keys.primary);
    if (!primary) return {Status::SchemaError(keys.primary, "", "unknown binding '" + keys.primary + "'"), {}};
    const std::string& key_attr = primary->schema->keyAttribute();

    std::vector<json> out;
    try {
        for (const auto& row : assembler_.evaluate(planned.physical, keys, execution)) {
            auto b = row.tuple.find(keys.primary);
            if (b == row.tuple.end() || !b->is_object()) continue;
            auto k = b->find(key_attr);
            if (k != b->end() && !k->is_null()) out.push_back(*k);
        }
    } catch (const StatusError& e) {
        return {e.status(), {}};
    }
    return {Status::OK(), std::move(out)};
}

// ============================================================================
// Writes
// ============================================================================

std::pair<Status, json> QueryEngine::keyFor(const AnalyzedAdd& add) const {
    const std::string& key_attr = add.schema->keyAttribute();
    for (const auto& v : add.values) {
        if (v.attribute == key_attr) return {Status::OK(), v.value};
    }
    const AttributeDefinition* def = add.schema->find(key_attr);
    if (def && def->valueType() == ValueType::Integer) {
        return {Status::SchemaError(add.schema->name(), key_attr,
                    "integer key '" + key_attr + "' must be given explicitly"), json()};
    }
    return {Status::OK(), generateUuid()};
}

QueryResponse QueryEngine::writeResponse(const WritePlan& plan, const WriteResult& result, const json& extra) const {
    QueryResponse response;
    json metadata = {{"affected", result.affected}, {"operation", operationName(plan.operation)},
                     {"record", plan.record}};
    for (auto it = extra.begin(); it != extra.end(); ++it) metadata[it.key()] = it.value();
    response.body = {{"data", json::array()}, {"metadata", metadata}, {"engines", enginesToJSON(result.engines)}};
    return response;
}

QueryResponse QueryEngine::runAdd(const AnalyzedAdd& add, const RunOptions& options) {
    auto start = std::chrono::steady_clock::now();
    auto [st, key] = keyFor(add);
    if (!st.ok) return failure(std::move(st));

    WritePlan plan;
    try {
        plan = physical_planner_.planInsert(add, key);
    } catch (const StatusError& e) {
        return failure(e.status());
    }

    ExecutionCoordinator::Options exec;
    exec.transaction_id = options.transaction_id;
    auto result = coordinator_.executeWrite(plan, exec);
    if (!result.status.ok) return failure(result.status);
    QUANTA_DEBUG("ADD {} key={} on {} engine(s)", plan.record, key.dump(), plan.fragments.size());
    return writeResponse(plan, result, {{"key", key}, {"execution_time_ms", msSince(start)}});
}

QueryResponse QueryEngine::runUpdate(const AnalyzedUpdate& update, const RunOptions& options) {
    auto start = std::chrono::steady_clock::now();
    auto [st, keys] = resolveKeys(update.keys, options);
    if (!st.ok) return failure(std::move(st));

    WritePlan plan;
    try {
        plan = physical_planner_.planUpdate(update, keys);
    } catch (const StatusError& e) {
        return failure(e.status());
    }
    if (keys.empty()) {
        return writeResponse(plan, WriteResult{}, {{"execution_time_ms", msSince(start)}});
    }

    ExecutionCoordinator::Options exec;
    exec.transaction_id = options.transaction_id;
    auto result = coordinator_.executeWrite(plan, exec);
    if (!result.status.ok) return failure(result.status);
    result.affected = keys.size();
    return writeResponse(plan, result, {{"execution_time_ms", msSince(start)}});
}

QueryResponse QueryEngine::runRemove(const AnalyzedRemove& remove, const RunOptions& options) {
    auto start = std::chrono::steady_clock::now();
    auto [st, keys] = resolveKeys(remove.keys, options);
    if (!st.ok) return failure(std::move(st));

    WritePlan plan;
    try {
        plan = physical_planner_.planRemove(remove, keys);
    } catch (const StatusError& e) {
        return failure(e.status());
    }
    if (keys.empty()) {
        return writeResponse(plan, WriteResult{}, {{"execution_time_ms", msSince(start)}});
    }

    ExecutionCoordinator::Options exec;
    exec.transaction_id = options.transaction_id;
    auto result = coordinator_.executeWrite(plan, exec);
    if (!result.status.ok) return failure(result.status);
    result.affected = keys.size();
    return writeResponse(plan, result, {{"execution_time_ms", msSince(start)}});
}

QueryResponse QueryEngine::runTransaction(const AnalyzedTransaction& block, const RunOptions& options) {
    if (options.transaction_id) {
        return failure(Status::TransactionError("transaction blocks cannot be nested in transaction " +
                                                *options.transaction_id));
    }
    auto start = std::chrono::steady_clock::now();

    auto [st, id] = transactions_.begin();
    if (!st.ok) return failure(std::move(st));

    RunOptions inner = options;
    inner.transaction_id = id;
    json results = json::array();
    for (const auto& stmt : block.statements) {
        auto response = run(*stmt, inner);
        if (!response.ok()) {
            // a failed write has already rolled the transaction back
            if (transactions_.get(id)) {
                Status rb = transactions_.rollback(id);
                if (!rb.ok) QUANTA_ERROR("Rollback of {} failed: {}", id, rb.toString());
            }
            return response;
        }
        results.push_back(response.body);
    }

    Status committed = transactions_.commit(id);
    if (!committed.ok) return failure(std::move(committed));

    QueryResponse response;
    response.body = {{"data", results},
                     {"metadata", {{"transaction_id", id},
                                   {"statements", block.statements.size()},
                                   {"execution_time_ms", msSince(start)}}}};
    return response;
}

// ============================================================================
// DDL
// ============================================================================

QueryResponse QueryEngine::runCreateRecord(const AnalyzedCreateRecord& create) {
    auto [st, schema] = schema_.createRecord(create.bucket, create.spec);
    if (!st.ok) return failure(std::move(st));

    QueryResponse response;
    response.body = {{"data", json::array({schema->toJSON()})},
                     {"metadata", {{"operation", "create_record"}, {"record", schema->name()},
                                   {"attributes", schema->attributes().size()}}}};
    return response;
}

QueryResponse QueryEngine::runCreateRelation(const AnalyzedCreateRelation& create) {
    Status st = schema_.addAttribute(create.bucket, create.record, create.attribute, create.definition);
    if (!st.ok) return failure(std::move(st));

    QueryResponse response;
    response.body = {{"data", json::array()},
                     {"metadata", {{"operation", "create_relation"}, {"record", create.record},
                                   {"attribute", create.attribute},
                                   {"definition", create.definition.toJSON()}}}};
    return response;
}

QueryResponse QueryEngine::runAlterRecord(const AnalyzedAlterRecord& alter) {
    Status st = schema_.addAttributes(alter.bucket, alter.record, alter.additions);
    if (!st.ok) return failure(std::move(st));

    json added = json::object();
    for (const auto& [name, def] : alter.additions) added[name] = def.toJSON();
    QueryResponse response;
    response.body = {{"data", json::array({schema_.getRecord(alter.bucket, alter.record)->toJSON()})},
                     {"metadata", {{"operation", "alter_record"}, {"record", alter.record}, {"added", added}}}};
    return response;
}

QueryResponse QueryEngine::runCreateIndex(const AnalyzedCreateIndex& create) {
    Status st = schema_.createIndex(create.bucket, create.record, create.attributes);
    if (!st.ok) return failure(std::move(st));

    QueryResponse response;
    response.body = {{"data", json::array()},
                     {"metadata", {{"operation", "create_index"}, {"record", create.record},
                                   {"attributes", create.attributes}}}};
    return response;
}

// ============================================================================
// EXPLAIN
// ============================================================================

QueryResponse QueryEngine::explain(const AnalyzedStatement& stmt) const {
    json out;
    try {
        if (auto* find = std::get_if<AnalyzedFind>(&stmt.node)) {
            auto planned = planFind(*find);
            out = {{"statement", "FIND"},
                   {"logical_plan", logicalNodeToJSON(*planned.logical)},
                   {"optimizer", planned.optimized.passesToJSON()},
                   {"optimized_plan", logicalNodeToJSON(*planned.optimized.root)},
                   {"physical_plan", planned.physical.toJSON()}};
        } else if (auto* add = std::get_if<AnalyzedAdd>(&stmt.node)) {
            auto [st, key] = keyFor(*add);
            if (!st.ok) return failure(std::move(st));
            out = {{"statement", "ADD"}, {"write_plan", physical_planner_.planInsert(*add, key).toJSON()}};
        } else if (auto* update = std::get_if<AnalyzedUpdate>(&stmt.node)) {
            auto planned = planFind(update->keys);
            out = {{"statement", "UPDATE"},
                   {"key_query", planned.physical.toJSON()},
                   {"write_plan", physical_planner_.planUpdate(*update, {}).toJSON()}};
        } else if (auto* remove = std::get_if<AnalyzedRemove>(&stmt.node)) {
            auto planned = planFind(remove->keys);
            out = {{"statement", "REMOVE"},
                   {"key_query", planned.physical.toJSON()},
                   {"write_plan", physical_planner_.planRemove(*remove, {}).toJSON()}};
        } else if (auto* create = std::get_if<AnalyzedCreateRecord>(&stmt.node)) {
            json attributes = json::object();
            for (const auto& [name, def] : create->spec.attributes) attributes[name] = def.toJSON();
            out = {{"statement", "CREATE RECORD"}, {"record", create->spec.record}, {"attributes", attributes}};
        } else if (auto* rel = std::get_if<AnalyzedCreateRelation>(&stmt.node)) {
            out = {{"statement", "CREATE RELATION"}, {"record", rel->record}, {"attribute", rel->attribute},
                   {"definition", rel->definition.toJSON()}};
        } else if (auto* alter = std::get_if<AnalyzedAlterRecord>(&stmt.node)) {
            json added = json::object();
            for (const auto& [name, def] : alter->additions) added[name] = def.toJSON();
            out = {{"statement", "ALTER RECORD"}, {"record", alter->record}, {"add", added}};
        } else if (auto* index = std::get_if<AnalyzedCreateIndex>(&stmt.node)) {
            out = {{"statement", "CREATE INDEX"}, {"record", index->record}, {"attributes", index->attributes}};
        } else if (auto* block = std::get_if<AnalyzedTransaction>(&stmt.node)) {
            json inner = json::array();
            for (const auto& s : block->statements) {
                auto r = explain(*s);
                if (!r.ok()) return r;
                inner.push_back(r.body["explain"]);
            }
            out = {{"statement", "TRANSACTION"}, {"statements", inner}};
        } else {
            return failure(Status::SyntaxError(0, "statement", "EXPLAIN EXPLAIN"));
        }
    } catch (const StatusError& e) {
        return failure(e.status());
    }

    QueryResponse response;
    response.body = {{"explain", out}};
    return response;
}

} // namespace query
} // namespace quanta
