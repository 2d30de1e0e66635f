#include "query/query_optimizer.h"
#include "utils/logger.h"

#include <algorithm>
#include <map>
#include <optional>
#include <set>

namespace quanta {
namespace query {

namespace {

using Needed = std::map<std::string, std::set<std::string>>;

// Skips Project / Limit / Sort / Aggregate
LogicalNodePtr* belowOutputOps(LogicalNodePtr& root) {
    LogicalNodePtr* cur = &root;
    while (*cur) {
        LogicalNode& n = **cur;
        if (auto* p = std::get_if<ProjectOp>(&n.op)) { cur = &p->input; continue; }
        if (auto* l = std::get_if<LimitOp>(&n.op)) { cur = &l->input; continue; }
        if (auto* s = std::get_if<SortOp>(&n.op)) { cur = &s->input; continue; }
        if (auto* a = std::get_if<AggregateOp>(&n.op)) { cur = &a->input; continue; }
        break;
    }
    return cur;
}

bool isNavigate(const LogicalNode& node) {
    auto* join = std::get_if<JoinOp>(&node.op);
    return join && join->kind == JoinKind::Navigate;
}

/// Binding of a subtree built from one binding's scans, filters and key merges
std::optional<std::string> subtreeBinding(const LogicalNode& node) {
    if (auto* scan = std::get_if<ScanOp>(&node.op)) return scan->binding;
    if (auto* join = std::get_if<JoinOp>(&node.op)) {
        if (join->kind == JoinKind::KeyMerge) return join->source;
        return std::nullopt;
    }
    if (auto* filter = std::get_if<FilterOp>(&node.op)) return subtreeBinding(*filter->input);
    return std::nullopt;
}

LogicalNodePtr* findBindingSubtree(LogicalNodePtr& node, const std::string& binding) {
    if (!node) return nullptr;
    auto b = subtreeBinding(*node);
    if (b && *b == binding) return &node;
    if (auto* join = std::get_if<JoinOp>(&node->op)) {
        if (join->kind == JoinKind::Navigate) {
            if (auto* found = findBindingSubtree(join->left, binding)) return found;
            return findBindingSubtree(join->right, binding);
        }
    }
    return nullptr;
}

ScanOp* findScan(LogicalNode& node, const std::string& binding, StorageClass engine) {
    if (auto* scan = std::get_if<ScanOp>(&node.op)) {
        return scan->binding == binding && scan->engine == engine ? scan : nullptr;
    }
    if (auto* filter = std::get_if<FilterOp>(&node.op)) return findScan(*filter->input, binding, engine);
    if (auto* join = std::get_if<JoinOp>(&node.op)) {
        if (auto* found = findScan(*join->left, binding, engine)) return found;
        if (join->right) return findScan(*join->right, binding, engine);
    }
    return nullptr;
}

bool readsIndexed(const ExprPtr& expr) {
    bool indexed = false;
    forEachAttribute(expr, [&](const AttributeRef& ref, size_t) {
        if (ref.resolved && ref.resolved->indexed) indexed = true;
    });
    return indexed;
}

bool readsBindingRef(const ExprPtr& expr) {
    bool found = false;
    forEachAttribute(expr, [&](const AttributeRef& ref, size_t) {
        if (!ref.resolved || ref.resolved->isBinding()) found = true;
    });
    return found;
}

void collectNeeded(const ExprPtr& expr, Needed& needed) {
    if (!expr) return;
    forEachAttribute(expr, [&](const AttributeRef& ref, size_t) {
        if (ref.resolved && !ref.resolved->isBinding()) {
            needed[ref.resolved->binding].insert(ref.resolved->attribute);
        }
    });
}

void collectFilterNeeds(const LogicalNode& node, Needed& needed) {
    std::visit([&](const auto& op) {
        using T = std::decay_t<decltype(op)>;
        if constexpr (std::is_same_v<T, ScanOp>) {
            return;
        } else if constexpr (std::is_same_v<T, FilterOp>) {
            collectNeeded(op.predicate, needed);
            collectFilterNeeds(*op.input, needed);
        } else if constexpr (std::is_same_v<T, JoinOp>) {
            collectFilterNeeds(*op.left, needed);
            if (op.right) collectFilterNeeds(*op.right, needed);
        } else {
            collectFilterNeeds(*op.input, needed);
        }
    }, node.op);
}

/// Moves the leftmost scan out of a binding subtree; for the primary binding and
/// filtered targets that is the scalar scan carrying the key.
LogicalNodePtr takeDriverScan(LogicalNodePtr& node) {
    if (auto* join = std::get_if<JoinOp>(&node->op)) return takeDriverScan(join->left);
    if (auto* filter = std::get_if<FilterOp>(&node->op)) return takeDriverScan(filter->input);
    return std::move(node);
}

// Returns false when nothing of the subtree needs to be read.
bool prune(LogicalNodePtr& node, const Needed& needed, std::vector<std::string>& details) {
    if (auto* scan = std::get_if<ScanOp>(&node->op)) {
        auto it = needed.find(scan->binding);
        std::vector<std::string> kept;
        for (const auto& attr : scan->attributes) {
            if (it != needed.end() && it->second.count(attr)) {
                kept.push_back(attr);
            }
        }
        if (kept.size() != scan->attributes.size()) {
            details.push_back(scan->binding + "/" + storageClassName(scan->engine) + ": " +
                              std::to_string(scan->attributes.size() - kept.size()) + " attribute(s) dropped");
        }
        scan->attributes = std::move(kept);
        return !scan->attributes.empty() || !scan->predicates.empty();
    }

    if (auto* filter = std::get_if<FilterOp>(&node->op)) {
        if (!prune(filter->input, needed, details)) {
            filter->input = takeDriverScan(filter->input);
        }
        return true;
    }

    auto& join = std::get<JoinOp>(node->op);
    if (join.kind == JoinKind::Navigate) {
        if (!prune(join.left, needed, details)) {
            join.left = takeDriverScan(join.left);
        }
        if (join.right && !prune(join.right, needed, details)) {
            details.push_back(join.target + ": no attributes read, keys come from the traversal");
            join.right.reset();
        }
        return true;
    }

    bool left = prune(join.left, needed, details);
    bool right = prune(join.right, needed, details);
    if (left && right) return true;
    if (left) {
        LogicalNodePtr keep = std::move(join.left);
        node = std::move(keep);
        return true;
    }
    if (right) {
        LogicalNodePtr keep = std::move(join.right);
        node = std::move(keep);
        return true;
    }
    return false;
}

void markFilters(LogicalNode& node, std::vector<std::string>& details) {
    std::visit([&](auto& op) {
        using T = std::decay_t<decltype(op)>;
        if constexpr (std::is_same_v<T, ScanOp>) {
            return;
        } else if constexpr (std::is_same_v<T, FilterOp>) {
            op.client_side = true;
            op.reason = (enginesOf(op.predicate).size() > 1 || bindingsOf(op.predicate).size() > 1)
                      ? "cross-engine" : "not pushable";
            details.push_back(exprToString(op.predicate) + " (" + op.reason + ")");
            markFilters(*op.input, details);
        } else if constexpr (std::is_same_v<T, JoinOp>) {
            markFilters(*op.left, details);
            if (op.right) markFilters(*op.right, details);
        } else {
            markFilters(*op.input, details);
        }
    }, node.op);
}

} // namespace

nlohmann::json QueryOptimizer::Plan::passesToJSON() const {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& p : passes) {
        out.push_back({{"pass", p.name}, {"changed", p.changed}, {"details", p.details}});
    }
    return out;
}

QueryOptimizer::Plan QueryOptimizer::optimize(LogicalNodePtr root, const AnalyzedFind& find) const {
    Plan plan;
    plan.passes.push_back(pushDownPredicates(root));
    planner_.annotate(*root);
    plan.passes.push_back(pruneAttributes(root, find));
    planner_.annotate(*root);
    plan.passes.push_back(orderNavigations(root, find));
    planner_.annotate(*root);
    plan.passes.push_back(markClientSideFilters(*root));

    for (const auto& p : plan.passes) {
        if (p.changed) QUANTA_DEBUG("Optimizer pass {}: {} change(s)", p.name, p.details.size());
    }
    plan.root = std::move(root);
    return plan;
}

QueryOptimizer::PassReport QueryOptimizer::pushDownPredicates(LogicalNodePtr& root) const {
    PassReport report{"predicate_pushdown", false, {}};
    LogicalNodePtr* slot = belowOutputOps(root);
    auto* match = std::get_if<FilterOp>(&(*slot)->op);
    if (!match) return report;

    ExprPtr predicate = match->predicate;
    LogicalNodePtr input = std::move(match->input);

    std::vector<ExprPtr> remaining;
    std::map<std::string, std::vector<ExprPtr>> per_binding;

    for (const auto& conjunct : splitConjuncts(predicate)) {
        auto bindings = bindingsOf(conjunct);
        auto engines = enginesOf(conjunct);
        if (bindings.size() != 1 || engines.empty() || readsBindingRef(conjunct)) {
            remaining.push_back(conjunct);
            continue;
        }
        const std::string& binding = *bindings.begin();
        if (engines.size() == 1) {
            StorageClass engine = *engines.begin();
            ScanOp* scan = findScan(*input, binding, engine);
            if (scan && translators_.get(engine).canPushDown(conjunct)) {
                scan->predicates.push_back(conjunct);
                if (readsIndexed(conjunct)) scan->indexed = true;
                report.details.push_back(exprToString(conjunct) + " -> " + binding + "/" + storageClassName(engine));
                continue;
            }
        }
        per_binding[binding].push_back(conjunct);
    }

    for (auto& entry : per_binding) {
        LogicalNodePtr* subtree = findBindingSubtree(input, entry.first);
        if (!subtree) {
            remaining.insert(remaining.end(), entry.second.begin(), entry.second.end());
            continue;
        }
        ExprPtr local = combineConjuncts(entry.second);
        report.details.push_back(exprToString(local) + " -> above " + entry.first);
        *subtree = std::make_unique<LogicalNode>(FilterOp{local, false, "", std::move(*subtree)});
    }

    if (remaining.empty()) {
        *slot = std::move(input);
    } else {
        *slot = std::make_unique<LogicalNode>(FilterOp{combineConjuncts(remaining), false, "", std::move(input)});
    }
    report.changed = !report.details.empty();
    return report;
}

QueryOptimizer::PassReport QueryOptimizer::pruneAttributes(LogicalNodePtr& root, const AnalyzedFind& find) const {
    PassReport report{"projection_pruning", false, {}};

    Needed needed;
    for (const auto& col : find.columns) collectNeeded(col.expr, needed);
    for (const auto& g : find.group_by) collectNeeded(g, needed);
    for (const auto& a : find.aggregates) collectNeeded(a, needed);
    collectNeeded(find.having, needed);
    for (const auto& o : find.order_by) collectNeeded(o.expr, needed);
    collectFilterNeeds(*root, needed);

    LogicalNodePtr* slot = belowOutputOps(root);
    if (!prune(*slot, needed, report.details)) {
        // nothing but keys is read, e.g. FIND COUNT(*) FROM users
        *slot = takeDriverScan(*slot);
        report.details.push_back("key-only read of " + find.primary);
    }
    report.changed = !report.details.empty();
    return report;
}

QueryOptimizer::PassReport QueryOptimizer::orderNavigations(LogicalNodePtr& root, const AnalyzedFind& find) const {
    PassReport report{"navigation_ordering", false, {}};

    LogicalNodePtr* slot = belowOutputOps(root);
    if (auto* filter = std::get_if<FilterOp>(&(*slot)->op)) {
        if (isNavigate(*filter->input)) slot = &filter->input;
    }
    if (!isNavigate(**slot)) return report;

    std::vector<LogicalNodePtr> steps;
    LogicalNodePtr cur = std::move(*slot);
    while (cur && isNavigate(*cur)) {
        LogicalNodePtr left = std::move(std::get<JoinOp>(cur->op).left);
        steps.push_back(std::move(cur));
        cur = std::move(left);
    }
    std::reverse(steps.begin(), steps.end());

    auto estimate = [this](const LogicalNode& step) {
        const auto& join = std::get<JoinOp>(step.op);
        return join.right ? join.right->cardinality : planner_.config().default_scan_cardinality;
    };

    std::set<std::string> available = {find.primary};
    std::vector<LogicalNodePtr> ordered;
    std::vector<size_t> original_positions;
    std::vector<bool> used(steps.size(), false);

    while (ordered.size() < steps.size()) {
        std::optional<size_t> best;
        for (size_t i = 0; i < steps.size(); ++i) {
            if (used[i]) continue;
            const auto& join = std::get<JoinOp>(steps[i]->op);
            if (!available.count(join.source)) continue;
            if (!best || estimate(*steps[i]) < estimate(*steps[*best])) best = i;
        }
        if (!best) {
            // unreachable source; keep the remaining steps in declaration order
            for (size_t i = 0; i < steps.size() && !best; ++i) {
                if (!used[i]) best = i;
            }
        }
        used[*best] = true;
        available.insert(std::get<JoinOp>(steps[*best]->op).target);
        original_positions.push_back(*best);
        ordered.push_back(std::move(steps[*best]));
    }

    for (size_t i = 0; i < ordered.size(); ++i) {
        const auto& join = std::get<JoinOp>(ordered[i]->op);
        report.details.push_back(join.source + "." + join.attribute + " -> " + join.target);
        if (original_positions[i] != i) report.changed = true;
    }

    for (auto& step : ordered) {
        std::get<JoinOp>(step->op).left = std::move(cur);
        cur = std::move(step);
    }
    *slot = std::move(cur);
    if (!report.changed) report.details.clear();
    return report;
}

QueryOptimizer::PassReport QueryOptimizer::markClientSideFilters(LogicalNode& root) const {
    PassReport report{"client_side_detection", false, {}};
    markFilters(root, report.details);
    report.changed = !report.details.empty();
    return report;
}

} // namespace query
} // namespace quanta
