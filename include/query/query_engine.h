#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

#include "config/engine_config.h"
#include "engine/adapter_registry.h"
#include "query/engine_translator.h"
#include "query/execution_coordinator.h"
#include "query/logical_plan.h"
#include "query/physical_planner.h"
#include "query/query_optimizer.h"
#include "query/result_assembler.h"
#include "query/semantic_analyzer.h"
#include "schema/schema_manager.h"
#include "schema/schema_registry.h"
#include "transaction/transaction_manager.h"
#include "utils/status.h"

namespace quanta {
namespace query {

struct QueryRequest {
    std::string bucket;
    std::string query;
    std::optional<std::string> transaction_id;
    std::optional<bool> allow_partial;          // default: execution.allow_partial_results
    std::optional<size_t> page;                 // 1-based; applies when the query has no LIMIT
    std::optional<size_t> page_size;

    /// {"bucket", "query", "transactionId"?, "allowPartial"?, "page"?, "pageSize"?}
    static QueryRequest fromJSON(const nlohmann::json& j);
};

struct QueryResponse {
    Status status;
    nlohmann::json body = nlohmann::json::object();   // {data, metadata, engines} or {explain}

    bool ok() const { return status.ok; }

    /// body, or {"error": status} on failure
    nlohmann::json toJSON() const;
};

/**
 * Facade over the whole pipeline:
 *
 *   text -> Lexer -> QQLParser -> SemanticAnalyzer -> LogicalPlanner -> QueryOptimizer
 *        -> PhysicalPlanner (+ translators) -> ExecutionCoordinator -> ResultAssembler
 *
 * DDL goes to the SchemaManager, writes are planned per engine and run under a
 * transaction when they touch more than one engine (or the request names one).
 */
class QueryEngine {
public:
    QueryEngine(SchemaRegistry& registry, const AdapterRegistry& adapters, config::EngineConfig cfg);

    QueryResponse execute(const QueryRequest& request);

    // Caller-managed transactions, referenced by QueryRequest::transaction_id
    std::pair<Status, std::string> beginTransaction();
    Status commitTransaction(const std::string& id);
    Status rollbackTransaction(const std::string& id);

    /// Lex, parse and analyze without executing
    std::pair<Status, AnalyzedStatementPtr> prepare(const std::string& bucket, const std::string& query) const;

    SchemaManager& schema() { return schema_; }
    TransactionManager& transactions() { return transactions_; }
    const TranslatorSet& translators() const { return translators_; }
    const config::EngineConfig& config() const { return cfg_; }

private:
    struct RunOptions {
        std::optional<std::string> transaction_id;
        bool allow_partial = false;
        std::optional<size_t> page;
        std::optional<size_t> page_size;
    };

    struct PlannedFind {
        LogicalNodePtr logical;                     // before optimization
        QueryOptimizer::Plan optimized;
        PhysicalPlan physical;
    };

    SchemaRegistry& registry_;
    const AdapterRegistry& adapters_;
    config::EngineConfig cfg_;

    SchemaManager schema_;
    SemanticAnalyzer analyzer_;
    TranslatorSet translators_;
    LogicalPlanner logical_planner_;
    QueryOptimizer optimizer_;
    PhysicalPlanner physical_planner_;
    TransactionManager transactions_;
    ExecutionCoordinator coordinator_;
    ResultAssembler assembler_;

    QueryResponse run(const AnalyzedStatement& stmt, const RunOptions& options);
    QueryResponse runFind(const AnalyzedFind& find, const RunOptions& options);
    QueryResponse runAdd(const AnalyzedAdd& add, const RunOptions& options);
    QueryResponse runUpdate(const AnalyzedUpdate& update, const RunOptions& options);
    QueryResponse runRemove(const AnalyzedRemove& remove, const RunOptions& options);
    QueryResponse runTransaction(const AnalyzedTransaction& block, const RunOptions& options);
    QueryResponse runCreateRecord(const AnalyzedCreateRecord& create);
    QueryResponse runCreateRelation(const AnalyzedCreateRelation& create);
    QueryResponse runAlterRecord(const AnalyzedAlterRecord& alter);
    QueryResponse runCreateIndex(const AnalyzedCreateIndex& create);
    QueryResponse explain(const AnalyzedStatement& stmt) const;

    PlannedFind planFind(const AnalyzedFind& find) const;
    std::pair<Status, std::vector<nlohmann::json>> resolveKeys(const AnalyzedFind& keys, const RunOptions& options);
    std::pair<Status, nlohmann::json> keyFor(const AnalyzedAdd& add) const;
    QueryResponse writeResponse(const WritePlan& plan, const WriteResult& result, const nlohmann::json& extra) const;
};

/// Random (version 4) UUID in canonical text form
std::string generateUuid();

} // namespace query
} // namespace quanta
