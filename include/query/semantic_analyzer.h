#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

#include "query/ast.h"
#include "schema/record_schema.h"
#include "schema/schema_registry.h"
#include "utils/status.h"

namespace quanta {
namespace query {

/// One occurrence of a record in a query. The primary record and every NAVIGATE target
/// get their own binding.
struct Binding {
    std::string name;
    std::shared_ptr<const RecordSchema> schema;
    size_t position = 0;
};

/// Relation traversal from one binding to another
struct NavigationStep {
    std::string source;            // binding
    std::string attribute;         // RELATION attribute of the source record
    std::string target;            // binding
    std::string target_record;
    size_t position = 0;
};

/// One field of every response item
struct OutputColumn {
    ExprPtr expr;
    std::string binding;           // non-empty: nested under data[i][binding]
    std::string name;
    std::optional<AttributeDefinition> definition;   // plain attribute references only
};

struct AnalyzedFind {
    std::string bucket;
    std::string primary;
    std::vector<Binding> bindings;
    std::vector<NavigationStep> navigations;
    std::vector<OutputColumn> columns;
    ExprPtr match;
    std::vector<ExprPtr> group_by;
    ExprPtr having;
    std::vector<ExprPtr> aggregates;   // distinct aggregate calls, by canonical text
    std::vector<OrderItem> order_by;
    std::optional<int64_t> limit;
    std::optional<int64_t> offset;
    bool aggregate = false;

    const Binding* binding(const std::string& name) const;
};

struct WriteValue {
    std::string attribute;
    AttributeDefinition definition;
    nlohmann::json value;
};

struct AnalyzedAdd {
    std::string bucket;
    std::shared_ptr<const RecordSchema> schema;
    std::vector<WriteValue> values;
};

struct AnalyzedUpdate {
    std::string bucket;
    std::shared_ptr<const RecordSchema> schema;
    std::vector<WriteValue> assignments;
    AnalyzedFind keys;             // key-only read resolving the MATCHing records
};

struct AnalyzedRemove {
    std::string bucket;
    std::shared_ptr<const RecordSchema> schema;
    AnalyzedFind keys;
};

struct AnalyzedCreateRecord {
    std::string bucket;
    RecordSpec spec;
};

struct AnalyzedCreateRelation {
    std::string bucket;
    std::string record;
    std::string attribute;
    AttributeDefinition definition;
};

struct AnalyzedAlterRecord {
    std::string bucket;
    std::string record;
    std::vector<RecordSchema::Attribute> additions;
};

struct AnalyzedCreateIndex {
    std::string bucket;
    std::string record;
    std::vector<std::string> attributes;
};

struct AnalyzedStatement;
using AnalyzedStatementPtr = std::shared_ptr<const AnalyzedStatement>;

struct AnalyzedTransaction {
    std::vector<AnalyzedStatementPtr> statements;
};

struct AnalyzedExplain {
    AnalyzedStatementPtr inner;
};

struct AnalyzedStatement {
    using Node = std::variant<AnalyzedFind, AnalyzedAdd, AnalyzedUpdate, AnalyzedRemove,
                              AnalyzedCreateRecord, AnalyzedCreateRelation,
                              AnalyzedAlterRecord, AnalyzedCreateIndex,
                              AnalyzedTransaction, AnalyzedExplain>;
    Node node;
};

/**
 * Resolves a parsed statement against the schema registry.
 *
 * Every attribute reference in the output carries a ResolvedAttribute with its owning
 * storage class; downstream stages route on that annotation only. Fails with
 * SchemaError for unknown records/attributes and TypeError for operator/operand
 * mismatches. Standalone NAVIGATE statements are lowered into FIND.
 */
class SemanticAnalyzer {
public:
    explicit SemanticAnalyzer(const SchemaRegistry& registry) : registry_(registry) {}

    std::pair<Status, AnalyzedStatementPtr> analyze(const std::string& bucket, const Statement& stmt) const;

private:
    const SchemaRegistry& registry_;

    AnalyzedStatementPtr analyzeStatement(const std::string& bucket, const Statement& stmt) const;
    AnalyzedFind analyzeFind(const std::string& bucket, const FindStatement& find) const;
    AnalyzedAdd analyzeAdd(const std::string& bucket, const AddStatement& add) const;
    AnalyzedUpdate analyzeUpdate(const std::string& bucket, const UpdateStatement& update) const;
    AnalyzedRemove analyzeRemove(const std::string& bucket, const RemoveStatement& remove) const;
    AnalyzedCreateRecord analyzeCreateRecord(const std::string& bucket, const CreateRecordStatement& create) const;
    AnalyzedCreateRelation analyzeCreateRelation(const std::string& bucket, const CreateRelationStatement& create) const;
    AnalyzedAlterRecord analyzeAlterRecord(const std::string& bucket, const AlterRecordStatement& alter) const;
    AnalyzedCreateIndex analyzeCreateIndex(const std::string& bucket, const CreateIndexStatement& create) const;

    std::shared_ptr<const RecordSchema> requireRecord(const std::string& bucket, const std::string& record) const;
    AnalyzedFind keyQuery(const std::string& bucket, const RecordSchema& schema, const ExprPtr& match,
                          size_t position) const;
};

/// binding.attribute[.sub.path] of a resolved reference
std::string attributeKey(const ResolvedAttribute& attr);

} // namespace query
} // namespace quanta
