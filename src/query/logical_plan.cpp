#include "query/logical_plan.h"
#include <algorithm>

namespace quanta {
namespace query {

namespace {

nlohmann::json enginesToJSON(const std::set<StorageClass>& engines) {
    nlohmann::json out = nlohmann::json::array();
    for (auto e : engines) out.push_back(storageClassName(e));
    return out;
}

nlohmann::json exprListToJSON(const std::vector<ExprPtr>& exprs) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& e : exprs) out.push_back(exprToString(e));
    return out;
}

bool isEqualityPredicate(const ExprPtr& expr) {
    auto* bin = std::get_if<BinaryExpr>(&expr->node);
    return bin && (bin->op == BinaryOp::Eq || bin->op == BinaryOp::In);
}

} // namespace

std::set<StorageClass> enginesOf(const ExprPtr& expr) {
    std::set<StorageClass> engines;
    forEachAttribute(expr, [&](const AttributeRef& ref, size_t) {
        if (ref.resolved && !ref.resolved->isBinding()) engines.insert(ref.resolved->storage);
    });
    return engines;
}

std::set<std::string> bindingsOf(const ExprPtr& expr) {
    std::set<std::string> bindings;
    forEachAttribute(expr, [&](const AttributeRef& ref, size_t) {
        if (ref.resolved) bindings.insert(ref.resolved->binding);
    });
    return bindings;
}

const char* logicalOpName(const LogicalNode& node) {
    switch (node.op.index()) {
        case 0: return "Scan";
        case 1: return "Filter";
        case 2: return std::get<JoinOp>(node.op).kind == JoinKind::Navigate ? "Navigate" : "KeyMerge";
        case 3: return "Project";
        case 4: return "Aggregate";
        case 5: return "Sort";
        case 6: return "Limit";
    }
    return "Unknown";
}

nlohmann::json logicalNodeToJSON(const LogicalNode& node) {
    nlohmann::json j = {{"op", logicalOpName(node)},
                        {"cardinality", node.cardinality},
                        {"engines", enginesToJSON(node.engines)}};

    std::visit([&j](const auto& op) {
        using T = std::decay_t<decltype(op)>;
        if constexpr (std::is_same_v<T, ScanOp>) {
            j["binding"] = op.binding;
            j["record"] = op.record;
            j["engine"] = storageClassName(op.engine);
            j["attributes"] = op.attributes;
            j["predicates"] = exprListToJSON(op.predicates);
            j["indexed"] = op.indexed;
        } else if constexpr (std::is_same_v<T, FilterOp>) {
            j["predicate"] = exprToString(op.predicate);
            j["client_side"] = op.client_side;
            if (!op.reason.empty()) j["reason"] = op.reason;
            j["input"] = logicalNodeToJSON(*op.input);
        } else if constexpr (std::is_same_v<T, JoinOp>) {
            j["source"] = op.source;
            if (op.kind == JoinKind::Navigate) {
                j["attribute"] = op.attribute;
                j["target"] = op.target;
            }
            j["left"] = logicalNodeToJSON(*op.left);
            j["right"] = op.right ? logicalNodeToJSON(*op.right) : nlohmann::json();
        } else if constexpr (std::is_same_v<T, ProjectOp>) {
            nlohmann::json cols = nlohmann::json::array();
            for (const auto& c : op.columns) cols.push_back(exprToString(c.expr));
            j["columns"] = cols;
            j["input"] = logicalNodeToJSON(*op.input);
        } else if constexpr (std::is_same_v<T, AggregateOp>) {
            j["group_by"] = exprListToJSON(op.group_by);
            j["aggregates"] = exprListToJSON(op.aggregates);
            if (op.having) j["having"] = exprToString(op.having);
            j["input"] = logicalNodeToJSON(*op.input);
        } else if constexpr (std::is_same_v<T, SortOp>) {
            nlohmann::json items = nlohmann::json::array();
            for (const auto& o : op.order_by) {
                items.push_back(exprToString(o.expr) + (o.ascending ? " ASC" : " DESC"));
            }
            j["order_by"] = items;
            j["input"] = logicalNodeToJSON(*op.input);
        } else {
            if (op.limit) j["limit"] = *op.limit;
            if (op.offset) j["offset"] = *op.offset;
            j["input"] = logicalNodeToJSON(*op.input);
        }
    }, node.op);
    return j;
}

// ============================================================================
// LogicalPlanner
// ============================================================================

LogicalNodePtr LogicalPlanner::bindingSubtree(const Binding& binding) const {
    LogicalNodePtr subtree;
    for (StorageClass engine : kAllStorageClasses) {
        if (!binding.schema->usesEngine(engine)) continue;

        ScanOp scan;
        scan.binding = binding.name;
        scan.record = binding.schema->name();
        scan.engine = engine;
        scan.key_attribute = binding.schema->keyAttribute();
        for (const auto& name : binding.schema->attributesOf(engine)) {
            if (name != scan.key_attribute) scan.attributes.push_back(name);
        }
        auto node = std::make_unique<LogicalNode>(std::move(scan));

        if (!subtree) {
            subtree = std::move(node);
        } else {
            JoinOp join;
            join.kind = JoinKind::KeyMerge;
            join.source = binding.name;
            join.left = std::move(subtree);
            join.right = std::move(node);
            subtree = std::make_unique<LogicalNode>(std::move(join));
        }
    }
    return subtree;
}

LogicalNodePtr LogicalPlanner::build(const AnalyzedFind& find) const {
    LogicalNodePtr root = bindingSubtree(*find.binding(find.primary));

    for (const auto& step : find.navigations) {
        JoinOp join;
        join.kind = JoinKind::Navigate;
        join.source = step.source;
        join.attribute = step.attribute;
        join.target = step.target;
        join.target_record = step.target_record;
        join.left = std::move(root);
        join.right = bindingSubtree(*find.binding(step.target));
        root = std::make_unique<LogicalNode>(std::move(join));
    }

    if (find.match) {
        root = std::make_unique<LogicalNode>(FilterOp{find.match, false, "", std::move(root)});
    }
    if (find.aggregate) {
        root = std::make_unique<LogicalNode>(AggregateOp{find.group_by, find.aggregates, find.having, std::move(root)});
    }
    if (!find.order_by.empty()) {
        root = std::make_unique<LogicalNode>(SortOp{find.order_by, std::move(root)});
    }
    if (find.limit || find.offset) {
        root = std::make_unique<LogicalNode>(LimitOp{find.limit, find.offset, std::move(root)});
    }
    root = std::make_unique<LogicalNode>(ProjectOp{find.columns, std::move(root)});

    annotate(*root);
    return root;
}

double LogicalPlanner::scanEstimate(const ScanOp& scan) const {
    double card = cfg_.default_scan_cardinality;
    for (const auto& pred : scan.predicates) {
        double sel = isEqualityPredicate(pred) ? cfg_.eq_selectivity : cfg_.range_selectivity;
        bool indexed = false;
        forEachAttribute(pred, [&](const AttributeRef& ref, size_t) {
            if (ref.resolved && ref.resolved->indexed) indexed = true;
        });
        if (indexed) sel *= cfg_.indexed_selectivity_factor;
        card *= sel;
    }
    return std::max(card, 1.0);
}

void LogicalPlanner::annotate(LogicalNode& node) const {
    std::visit([&](auto& op) {
        using T = std::decay_t<decltype(op)>;
        if constexpr (std::is_same_v<T, ScanOp>) {
            node.cardinality = scanEstimate(op);
            node.engines = {op.engine};
        } else if constexpr (std::is_same_v<T, FilterOp>) {
            annotate(*op.input);
            node.cardinality = std::max(1.0, op.input->cardinality * cfg_.range_selectivity);
            node.engines = op.input->engines;
            auto refs = enginesOf(op.predicate);
            node.engines.insert(refs.begin(), refs.end());
        } else if constexpr (std::is_same_v<T, JoinOp>) {
            annotate(*op.left);
            node.engines = op.left->engines;
            if (op.right) {
                annotate(*op.right);
                node.engines.insert(op.right->engines.begin(), op.right->engines.end());
            }
            if (op.kind == JoinKind::KeyMerge) {
                node.cardinality = std::min(op.left->cardinality, op.right->cardinality);
            } else {
                node.engines.insert(StorageClass::Relation);
                double card = op.left->cardinality * cfg_.relation_fanout;
                if (op.right) card *= op.right->cardinality / cfg_.default_scan_cardinality;
                node.cardinality = std::max(card, 1.0);
            }
        } else if constexpr (std::is_same_v<T, AggregateOp>) {
            annotate(*op.input);
            node.cardinality = op.group_by.empty() ? 1.0
                             : std::max(1.0, op.input->cardinality * cfg_.eq_selectivity);
            node.engines = op.input->engines;
        } else if constexpr (std::is_same_v<T, LimitOp>) {
            annotate(*op.input);
            node.cardinality = op.input->cardinality;
            if (op.limit) node.cardinality = std::min(node.cardinality, static_cast<double>(*op.limit));
            node.engines = op.input->engines;
        } else {
            annotate(*op.input);
            node.cardinality = op.input->cardinality;
            node.engines = op.input->engines;
        }
    }, node.op);
}

} // namespace query
} // namespace quanta
