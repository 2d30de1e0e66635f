#pragma once

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

#include "config/engine_config.h"
#include "query/ast.h"
#include "query/semantic_analyzer.h"

namespace quanta {
namespace query {

struct LogicalNode;
using LogicalNodePtr = std::unique_ptr<LogicalNode>;

/// Reads one binding's attributes from one engine
struct ScanOp {
    std::string binding;
    std::string record;
    StorageClass engine = StorageClass::Scalar;
    std::string key_attribute;
    std::vector<std::string> attributes;   // the key is always returned in addition
    std::vector<ExprPtr> predicates;       // pushed into the native query
    bool indexed = false;                  // a pushed predicate filters an INDEXED attribute
};

struct FilterOp {
    ExprPtr predicate;
    bool client_side = false;              // evaluated by the result assembler
    std::string reason;                    // "cross-engine" or "not pushable"
    LogicalNodePtr input;
};

enum class JoinKind {
    KeyMerge,      // same binding, different engines, joined on the record key
    Navigate       // relation traversal from one binding to another
};

struct JoinOp {
    JoinKind kind = JoinKind::KeyMerge;
    std::string source;                    // binding (KeyMerge: the merged binding)
    std::string attribute;                 // Navigate: relation attribute
    std::string target;                    // Navigate: target binding
    std::string target_record;
    LogicalNodePtr left;
    LogicalNodePtr right;                  // Navigate: null when no target attribute is read
};

struct ProjectOp {
    std::vector<OutputColumn> columns;
    LogicalNodePtr input;
};

struct AggregateOp {
    std::vector<ExprPtr> group_by;
    std::vector<ExprPtr> aggregates;
    ExprPtr having;
    LogicalNodePtr input;
};

struct SortOp {
    std::vector<OrderItem> order_by;
    LogicalNodePtr input;
};

struct LimitOp {
    std::optional<int64_t> limit;
    std::optional<int64_t> offset;
    LogicalNodePtr input;
};

struct LogicalNode {
    using Op = std::variant<ScanOp, FilterOp, JoinOp, ProjectOp, AggregateOp, SortOp, LimitOp>;

    Op op;
    double cardinality = 0.0;
    std::set<StorageClass> engines;

    explicit LogicalNode(Op o) : op(std::move(o)) {}
};

const char* logicalOpName(const LogicalNode& node);
nlohmann::json logicalNodeToJSON(const LogicalNode& node);

/// Engines owning the attributes an expression reads
std::set<StorageClass> enginesOf(const ExprPtr& expr);

/// Bindings an expression reads
std::set<std::string> bindingsOf(const ExprPtr& expr);

/**
 * Builds the unoptimized operator tree of a FIND:
 *
 *   Project <- Limit <- Sort <- Aggregate <- Filter(MATCH) <- Navigate joins <- per-binding scans
 *
 * Every binding starts with one Scan per engine its record uses, reading every attribute
 * of that engine; the optimizer narrows this down.
 */
class LogicalPlanner {
public:
    explicit LogicalPlanner(config::EngineConfig::PlannerConfig cfg) : cfg_(cfg) {}

    LogicalNodePtr build(const AnalyzedFind& find) const;

    /// Recomputes cardinality estimates and engine sets bottom-up
    void annotate(LogicalNode& node) const;

    LogicalNodePtr bindingSubtree(const Binding& binding) const;

    const config::EngineConfig::PlannerConfig& config() const { return cfg_; }

private:
    config::EngineConfig::PlannerConfig cfg_;

    double scanEstimate(const ScanOp& scan) const;
};

} // namespace query
} // namespace quanta
