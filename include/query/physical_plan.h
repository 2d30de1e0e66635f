#pragma once

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

#include "engine/native_query.h"
#include "query/logical_plan.h"

namespace quanta {
namespace query {

enum class ScanAlgorithm { FullScan, IndexScan, KeyLookup };
enum class JoinAlgorithm { HashJoin, NestedLoop };
enum class AggregateAlgorithm { Streaming, Hash };
enum class ExecutionMode { Parallel, Sequential };

const char* scanAlgorithmName(ScanAlgorithm a);
const char* joinAlgorithmName(JoinAlgorithm a);
const char* aggregateAlgorithmName(AggregateAlgorithm a);

/// Keys produced by an upstream fragment: the values of `column` in its rows
struct KeyInput {
    int fragment = -1;
    std::string column;
};

enum class FragmentKind { Scan, Traverse };

/// One native query against one engine. The unit of scheduling.
struct Fragment {
    int id = -1;
    FragmentKind kind = FragmentKind::Scan;
    std::string bucket;
    std::string binding;
    std::string record;
    StorageClass engine = StorageClass::Scalar;
    ScanAlgorithm algorithm = ScanAlgorithm::FullScan;
    std::string key_attribute;
    std::vector<std::string> attributes;
    std::vector<ExprPtr> predicates;

    // Required fragments define their binding's key set (inner semantics);
    // the others only contribute attribute values (left semantics).
    bool required = true;

    // Run-time key restriction: intersection of the listed upstream outputs
    std::vector<KeyInput> key_inputs;
    std::vector<int> depends_on;
    int wave = 0;

    // Traverse
    std::string relation_attribute;
    std::string target_binding;

    // Native ordering, set only when one fragment answers the whole query.
    // Paging always stays with the assembler so the total match count is known.
    std::vector<OrderItem> order_by;

    NativeQuery native;

    nlohmann::json toJSON() const;
};

struct PhysicalNode;
using PhysicalNodePtr = std::unique_ptr<PhysicalNode>;

struct PhysicalScan {
    int fragment = -1;
    ScanAlgorithm algorithm = ScanAlgorithm::FullScan;
};

struct PhysicalFilter {
    ExprPtr predicate;
    bool client_side = true;
    PhysicalNodePtr input;
};

struct PhysicalJoin {
    JoinKind kind = JoinKind::KeyMerge;
    JoinAlgorithm algorithm = JoinAlgorithm::HashJoin;
    std::string source;
    std::string attribute;
    std::string target;
    int traversal_fragment = -1;
    PhysicalNodePtr left;
    PhysicalNodePtr right;
};

struct PhysicalProject {
    std::vector<OutputColumn> columns;
    PhysicalNodePtr input;
};

struct PhysicalAggregate {
    AggregateAlgorithm algorithm = AggregateAlgorithm::Hash;
    std::vector<ExprPtr> group_by;
    std::vector<ExprPtr> aggregates;
    ExprPtr having;
    PhysicalNodePtr input;
};

struct PhysicalSort {
    std::vector<OrderItem> order_by;
    bool native = false;           // already satisfied by the engine
    PhysicalNodePtr input;
};

struct PhysicalLimit {
    std::optional<int64_t> limit;
    std::optional<int64_t> offset;
    PhysicalNodePtr input;
};

/// 1:1 refinement of a LogicalNode
struct PhysicalNode {
    using Op = std::variant<PhysicalScan, PhysicalFilter, PhysicalJoin, PhysicalProject,
                            PhysicalAggregate, PhysicalSort, PhysicalLimit>;

    Op op;
    double cardinality = 0.0;
    std::set<StorageClass> engines;
    ExecutionMode mode = ExecutionMode::Sequential;
    bool materialize = false;      // output fully collected before it is consumed

    explicit PhysicalNode(Op o) : op(std::move(o)) {}
};

nlohmann::json physicalNodeToJSON(const PhysicalNode& node);

struct PhysicalPlan {
    std::string bucket;
    std::string primary;
    PhysicalNodePtr root;
    std::vector<Fragment> fragments;
    int wave_count = 0;

    const Fragment* fragment(int id) const;

    /// Fragment ids grouped by wave; fragments of one wave are independent
    std::vector<std::vector<int>> waves() const;

    nlohmann::json toJSON() const;
};

/// One backend write of an ADD / UPDATE / REMOVE
struct WriteFragment {
    StorageClass engine = StorageClass::Scalar;
    NativeOperation operation = NativeOperation::Insert;
    std::string bucket;
    std::string record;
    std::string key_attribute;
    nlohmann::json values = nlohmann::json::object();
    std::vector<nlohmann::json> keys;
    NativeQuery native;

    nlohmann::json toJSON() const;
};

struct WritePlan {
    NativeOperation operation = NativeOperation::Insert;
    std::string bucket;
    std::string record;
    std::vector<WriteFragment> fragments;

    bool multiEngine() const { return fragments.size() > 1; }
    nlohmann::json toJSON() const;
};

} // namespace query
} // namespace quanta
