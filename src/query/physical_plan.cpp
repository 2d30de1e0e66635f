#include "query/physical_plan.h"

namespace quanta {
namespace query {

using json = nlohmann::json;

const char* scanAlgorithmName(ScanAlgorithm a) {
    switch (a) {
        case ScanAlgorithm::FullScan: return "FullScan";
        case ScanAlgorithm::IndexScan: return "IndexScan";
        case ScanAlgorithm::KeyLookup: return "KeyLookup";
    }
    return "FullScan";
}

const char* joinAlgorithmName(JoinAlgorithm a) {
    return a == JoinAlgorithm::HashJoin ? "HashJoin" : "NestedLoop";
}

const char* aggregateAlgorithmName(AggregateAlgorithm a) {
    return a == AggregateAlgorithm::Streaming ? "Streaming" : "Hash";
}

namespace {

json exprList(const std::vector<ExprPtr>& exprs) {
    json out = json::array();
    for (const auto& e : exprs) out.push_back(exprToString(e));
    return out;
}

json orderList(const std::vector<OrderItem>& items) {
    json out = json::array();
    for (const auto& o : items) out.push_back(exprToString(o.expr) + (o.ascending ? " ASC" : " DESC"));
    return out;
}

} // namespace

json Fragment::toJSON() const {
    json j = {{"id", id},
              {"kind", kind == FragmentKind::Traverse ? "traverse" : "scan"},
              {"binding", binding},
              {"record", record},
              {"engine", storageClassName(engine)},
              {"algorithm", scanAlgorithmName(algorithm)},
              {"attributes", attributes},
              {"predicates", exprList(predicates)},
              {"required", required},
              {"wave", wave},
              {"depends_on", depends_on}};
    if (!key_inputs.empty()) {
        json inputs = json::array();
        for (const auto& in : key_inputs) inputs.push_back({{"fragment", in.fragment}, {"column", in.column}});
        j["key_inputs"] = inputs;
    }
    if (kind == FragmentKind::Traverse) {
        j["relation"] = relation_attribute;
        j["target_binding"] = target_binding;
    }
    if (!order_by.empty()) j["order_by"] = orderList(order_by);
    j["native"] = native.toJSON();
    return j;
}

json physicalNodeToJSON(const PhysicalNode& node) {
    json engines = json::array();
    for (auto e : node.engines) engines.push_back(storageClassName(e));

    json j = {{"cardinality", node.cardinality},
              {"engines", engines},
              {"mode", node.mode == ExecutionMode::Parallel ? "parallel" : "sequential"}};
    if (node.materialize) j["materialize"] = true;

    std::visit([&j](const auto& op) {
        using T = std::decay_t<decltype(op)>;
        if constexpr (std::is_same_v<T, PhysicalScan>) {
            j["op"] = scanAlgorithmName(op.algorithm);
            j["fragment"] = op.fragment;
        } else if constexpr (std::is_same_v<T, PhysicalFilter>) {
            j["op"] = "Filter";
            j["predicate"] = exprToString(op.predicate);
            j["client_side"] = op.client_side;
            j["input"] = physicalNodeToJSON(*op.input);
        } else if constexpr (std::is_same_v<T, PhysicalJoin>) {
            j["op"] = op.kind == JoinKind::Navigate ? "Navigate" : "KeyMerge";
            j["algorithm"] = joinAlgorithmName(op.algorithm);
            j["source"] = op.source;
            if (op.kind == JoinKind::Navigate) {
                j["attribute"] = op.attribute;
                j["target"] = op.target;
                j["traversal_fragment"] = op.traversal_fragment;
            }
            j["left"] = physicalNodeToJSON(*op.left);
            j["right"] = op.right ? physicalNodeToJSON(*op.right) : json();
        } else if constexpr (std::is_same_v<T, PhysicalProject>) {
            j["op"] = "Project";
            json cols = json::array();
            for (const auto& c : op.columns) cols.push_back(c.name);
            j["columns"] = cols;
            j["input"] = physicalNodeToJSON(*op.input);
        } else if constexpr (std::is_same_v<T, PhysicalAggregate>) {
            j["op"] = std::string(aggregateAlgorithmName(op.algorithm)) + "Aggregate";
            j["group_by"] = exprList(op.group_by);
            j["aggregates"] = exprList(op.aggregates);
            if (op.having) j["having"] = exprToString(op.having);
            j["input"] = physicalNodeToJSON(*op.input);
        } else if constexpr (std::is_same_v<T, PhysicalSort>) {
            j["op"] = "Sort";
            j["order_by"] = orderList(op.order_by);
            j["native"] = op.native;
            j["input"] = physicalNodeToJSON(*op.input);
        } else {
            j["op"] = "Limit";
            if (op.limit) j["limit"] = *op.limit;
            if (op.offset) j["offset"] = *op.offset;
            j["input"] = physicalNodeToJSON(*op.input);
        }
    }, node.op);
    return j;
}

const Fragment* PhysicalPlan::fragment(int id) const {
    for (const auto& f : fragments) {
        if (f.id == id) return &f;
    }
    return nullptr;
}

std::vector<std::vector<int>> PhysicalPlan::waves() const {
    std::vector<std::vector<int>> out(static_cast<size_t>(wave_count));
    for (const auto& f : fragments) {
        if (f.wave >= 0 && f.wave < wave_count) out[static_cast<size_t>(f.wave)].push_back(f.id);
    }
    return out;
}

json PhysicalPlan::toJSON() const {
    json frags = json::array();
    for (const auto& f : fragments) frags.push_back(f.toJSON());
    return {{"bucket", bucket},
            {"primary", primary},
            {"waves", wave_count},
            {"fragments", frags},
            {"tree", root ? physicalNodeToJSON(*root) : json()}};
}

json WriteFragment::toJSON() const {
    json j = {{"engine", storageClassName(engine)},
              {"operation", nativeOperationName(operation)},
              {"record", record},
              {"native", native.toJSON()}};
    if (!keys.empty()) j["key_count"] = keys.size();
    return j;
}

json WritePlan::toJSON() const {
    json frags = json::array();
    for (const auto& f : fragments) frags.push_back(f.toJSON());
    return {{"operation", nativeOperationName(operation)},
            {"bucket", bucket},
            {"record", record},
            {"multi_engine", multiEngine()},
            {"fragments", frags}};
}

} // namespace query
} // namespace quanta
