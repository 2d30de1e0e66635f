#include "query/physical_planner.h"
#include "utils/logger.h"

#include <algorithm>
#include <set>

namespace quanta {
namespace query {

namespace {

using json = nlohmann::json;

bool isKeyEquality(const ExprPtr& expr) {
    auto* bin = std::get_if<BinaryExpr>(&expr->node);
    if (!bin || (bin->op != BinaryOp::Eq && bin->op != BinaryOp::In)) return false;
    for (const auto& side : {bin->left, bin->right}) {
        auto* ref = std::get_if<AttributeRef>(&side->node);
        if (ref && ref->resolved && ref->resolved->is_key) return true;
    }
    return false;
}

ScanAlgorithm chooseScan(const ScanOp& scan, bool keyed) {
    if (keyed) return ScanAlgorithm::KeyLookup;
    if (scan.indexed) return ScanAlgorithm::IndexScan;
    for (const auto& pred : scan.predicates) {
        if (isKeyEquality(pred)) return ScanAlgorithm::IndexScan;
    }
    return ScanAlgorithm::FullScan;
}

void collectScans(const LogicalNode& node, std::vector<const ScanOp*>& out) {
    if (auto* scan = std::get_if<ScanOp>(&node.op)) {
        out.push_back(scan);
    } else if (auto* filter = std::get_if<FilterOp>(&node.op)) {
        collectScans(*filter->input, out);
    } else if (auto* join = std::get_if<JoinOp>(&node.op)) {
        collectScans(*join->left, out);
        if (join->right) collectScans(*join->right, out);
    }
}

bool isBindingSubtree(const LogicalNode& node) {
    if (std::holds_alternative<ScanOp>(node.op)) return true;
    if (auto* join = std::get_if<JoinOp>(&node.op)) return join->kind == JoinKind::KeyMerge;
    if (auto* filter = std::get_if<FilterOp>(&node.op)) return isBindingSubtree(*filter->input);
    return false;
}

std::string bindingOf(const LogicalNode& node) {
    std::vector<const ScanOp*> scans;
    collectScans(node, scans);
    return scans.empty() ? std::string() : scans.front()->binding;
}

Fragment fragmentFromScan(const ScanOp& scan) {
    Fragment f;
    f.kind = FragmentKind::Scan;
    f.binding = scan.binding;
    f.record = scan.record;
    f.engine = scan.engine;
    f.key_attribute = scan.key_attribute;
    f.attributes = scan.attributes;
    f.predicates = scan.predicates;
    return f;
}

void collectFragmentIds(const PhysicalNode& node, std::vector<int>& out) {
    std::visit([&](const auto& op) {
        using T = std::decay_t<decltype(op)>;
        if constexpr (std::is_same_v<T, PhysicalScan>) {
            out.push_back(op.fragment);
        } else if constexpr (std::is_same_v<T, PhysicalJoin>) {
            if (op.traversal_fragment >= 0) out.push_back(op.traversal_fragment);
            collectFragmentIds(*op.left, out);
            if (op.right) collectFragmentIds(*op.right, out);
        } else {
            collectFragmentIds(*op.input, out);
        }
    }, node.op);
}

bool hasClientFilter(const PhysicalNode& node) {
    return std::visit([](const auto& op) -> bool {
        using T = std::decay_t<decltype(op)>;
        if constexpr (std::is_same_v<T, PhysicalScan>) {
            return false;
        } else if constexpr (std::is_same_v<T, PhysicalFilter>) {
            return true;
        } else if constexpr (std::is_same_v<T, PhysicalJoin>) {
            return hasClientFilter(*op.left) || (op.right && hasClientFilter(*op.right));
        } else {
            return hasClientFilter(*op.input);
        }
    }, node.op);
}

PhysicalNodePtr makeNode(PhysicalNode::Op op, const LogicalNode& from) {
    auto node = std::make_unique<PhysicalNode>(std::move(op));
    node->cardinality = from.cardinality;
    node->engines = from.engines;
    return node;
}

} // namespace

JoinAlgorithm PhysicalPlanner::chooseJoin(double left, double right) const {
    double smaller = std::min(left, right);
    return smaller < static_cast<double>(cfg_.nested_loop_threshold) ? JoinAlgorithm::NestedLoop
                                                                       : JoinAlgorithm::HashJoin;
}

int PhysicalPlanner::addFragment(Fragment fragment, BuildState& state) const {
    fragment.id = static_cast<int>(state.plan.fragments.size());
    fragment.bucket = state.plan.bucket;

    int wave = 0;
    for (const auto& input : fragment.key_inputs) {
        const Fragment* upstream = state.plan.fragment(input.fragment);
        wave = std::max(wave, upstream->wave + 1);
        if (std::find(fragment.depends_on.begin(), fragment.depends_on.end(), input.fragment) ==
            fragment.depends_on.end()) {
            fragment.depends_on.push_back(input.fragment);
        }
    }
    fragment.wave = wave;
    state.plan.wave_count = std::max(state.plan.wave_count, wave + 1);

    int id = fragment.id;
    state.plan.fragments.push_back(std::move(fragment));
    return id;
}

PhysicalNodePtr PhysicalPlanner::mirrorBinding(const LogicalNode& node,
                                               const std::map<const ScanOp*, int>& fragment_of,
                                               const PhysicalPlan& plan) const {
    if (auto* scan = std::get_if<ScanOp>(&node.op)) {
        int id = fragment_of.at(scan);
        return makeNode(PhysicalScan{id, plan.fragment(id)->algorithm}, node);
    }
    if (auto* filter = std::get_if<FilterOp>(&node.op)) {
        return makeNode(PhysicalFilter{filter->predicate, filter->client_side,
                                       mirrorBinding(*filter->input, fragment_of, plan)}, node);
    }
    const auto& join = std::get<JoinOp>(node.op);
    PhysicalJoin out;
    out.kind = JoinKind::KeyMerge;
    out.algorithm = chooseJoin(join.left->cardinality, join.right->cardinality);
    out.source = join.source;
    out.left = mirrorBinding(*join.left, fragment_of, plan);
    out.right = mirrorBinding(*join.right, fragment_of, plan);
    return makeNode(std::move(out), node);
}

PhysicalNodePtr PhysicalPlanner::convertBinding(const LogicalNode& subtree, const std::string& binding,
                                                const std::vector<KeyInput>& entry, BuildState& state) const {
    std::vector<const ScanOp*> scans;
    collectScans(subtree, scans);

    std::vector<const ScanOp*> required;
    for (const auto* scan : scans) {
        if (!scan->predicates.empty()) required.push_back(scan);
    }
    if (required.empty() && entry.empty()) {
        required.push_back(scans.front());   // driver of the primary binding
    }

    std::map<const ScanOp*, int> fragment_of;
    std::vector<KeyInput> required_inputs;
    for (const auto* scan : required) {
        Fragment f = fragmentFromScan(*scan);
        f.required = true;
        f.key_inputs = entry;
        f.algorithm = chooseScan(*scan, !entry.empty());
        int id = addFragment(std::move(f), state);
        fragment_of[scan] = id;
        required_inputs.push_back(KeyInput{id, scan->key_attribute});
    }

    const std::vector<KeyInput>& lookup_inputs = required_inputs.empty() ? entry : required_inputs;
    for (const auto* scan : scans) {
        if (fragment_of.count(scan)) continue;
        Fragment f = fragmentFromScan(*scan);
        f.required = false;
        f.key_inputs = lookup_inputs;
        f.algorithm = ScanAlgorithm::KeyLookup;
        fragment_of[scan] = addFragment(std::move(f), state);
    }

    state.key_sources[binding] = lookup_inputs;

    PhysicalNodePtr node = mirrorBinding(subtree, fragment_of, state.plan);
    node->materialize = true;
    return node;
}

PhysicalNodePtr PhysicalPlanner::convert(const LogicalNode& node, BuildState& state) const {
    if (isBindingSubtree(node)) {
        return convertBinding(node, bindingOf(node), {}, state);
    }

    return std::visit([&](const auto& op) -> PhysicalNodePtr {
        using T = std::decay_t<decltype(op)>;
        if constexpr (std::is_same_v<T, ScanOp>) {
            return convertBinding(node, op.binding, {}, state);
        } else if constexpr (std::is_same_v<T, FilterOp>) {
            return makeNode(PhysicalFilter{op.predicate, op.client_side, convert(*op.input, state)}, node);
        } else if constexpr (std::is_same_v<T, JoinOp>) {
            PhysicalNodePtr left = convert(*op.left, state);

            const Binding* source = state.find->binding(op.source);
            Fragment traversal;
            traversal.kind = FragmentKind::Traverse;
            traversal.binding = op.source;
            traversal.record = source->schema->name();
            traversal.engine = StorageClass::Relation;
            traversal.algorithm = ScanAlgorithm::KeyLookup;
            traversal.key_attribute = source->schema->keyAttribute();
            traversal.relation_attribute = op.attribute;
            traversal.target_binding = op.target;
            traversal.required = true;
            traversal.key_inputs = state.key_sources[op.source];
            int traversal_id = addFragment(std::move(traversal), state);

            std::vector<KeyInput> entry = {KeyInput{traversal_id, "target"}};
            PhysicalNodePtr right;
            if (op.right) {
                right = convertBinding(*op.right, op.target, entry, state);
            } else {
                state.key_sources[op.target] = entry;
            }

            PhysicalJoin join;
            join.kind = JoinKind::Navigate;
            join.algorithm = chooseJoin(op.left->cardinality,
                                        op.right ? op.right->cardinality : node.cardinality);
            join.source = op.source;
            join.attribute = op.attribute;
            join.target = op.target;
            join.traversal_fragment = traversal_id;
            join.left = std::move(left);
            join.right = std::move(right);
            return makeNode(std::move(join), node);
        } else if constexpr (std::is_same_v<T, ProjectOp>) {
            return makeNode(PhysicalProject{op.columns, convert(*op.input, state)}, node);
        } else if constexpr (std::is_same_v<T, AggregateOp>) {
            PhysicalAggregate agg;
            agg.algorithm = op.group_by.empty() ? AggregateAlgorithm::Streaming : AggregateAlgorithm::Hash;
            agg.group_by = op.group_by;
            agg.aggregates = op.aggregates;
            agg.having = op.having;
            agg.input = convert(*op.input, state);
            auto out = makeNode(std::move(agg), node);
            out->materialize = true;
            return out;
        } else if constexpr (std::is_same_v<T, SortOp>) {
            auto out = makeNode(PhysicalSort{op.order_by, false, convert(*op.input, state)}, node);
            out->materialize = true;
            return out;
        } else {
            return makeNode(PhysicalLimit{op.limit, op.offset, convert(*op.input, state)}, node);
        }
    }, node.op);
}

void PhysicalPlanner::finishModes(PhysicalNode& node, const PhysicalPlan& plan) const {
    std::vector<int> ids;
    collectFragmentIds(node, ids);
    std::map<int, int> per_wave;
    for (int id : ids) {
        if (++per_wave[plan.fragment(id)->wave] > 1) {
            node.mode = ExecutionMode::Parallel;
            break;
        }
    }
    if (auto* scan = std::get_if<PhysicalScan>(&node.op)) {
        int wave = plan.fragment(scan->fragment)->wave;
        for (const auto& f : plan.fragments) {
            if (f.id != scan->fragment && f.wave == wave) node.mode = ExecutionMode::Parallel;
        }
        return;
    }

    std::visit([&](auto& op) {
        using T = std::decay_t<decltype(op)>;
        if constexpr (std::is_same_v<T, PhysicalJoin>) {
            finishModes(*op.left, plan);
            if (op.right) finishModes(*op.right, plan);
        } else if constexpr (!std::is_same_v<T, PhysicalScan>) {
            finishModes(*op.input, plan);
        }
    }, node.op);
}

PhysicalPlan PhysicalPlanner::plan(const LogicalNode& root, const AnalyzedFind& find) const {
    BuildState state;
    state.find = &find;
    state.plan.bucket = find.bucket;
    state.plan.primary = find.primary;
    state.plan.root = convert(root, state);

    PhysicalPlan& out = state.plan;

    // Ordering goes to the engine only when one fragment answers everything.
    // LIMIT/OFFSET stay client-side: the response reports the full match count.
    if (out.fragments.size() == 1 && !find.aggregate && !hasClientFilter(*out.root) && !find.order_by.empty()) {
        Fragment& only = out.fragments.front();
        if (only.kind == FragmentKind::Scan && translators_.get(only.engine).canPushOrder(find.order_by)) {
            only.order_by = find.order_by;

            PhysicalNode* cur = out.root.get();
            while (cur) {
                if (auto* p = std::get_if<PhysicalProject>(&cur->op)) {
                    cur = p->input.get();
                } else if (auto* l = std::get_if<PhysicalLimit>(&cur->op)) {
                    cur = l->input.get();
                } else if (auto* s = std::get_if<PhysicalSort>(&cur->op)) {
                    s->native = true;
                    cur->materialize = false;
                    cur = s->input.get();
                } else {
                    break;
                }
            }
        }
    }

    for (auto& f : out.fragments) {
        f.native = translators_.get(f.engine).translate(f);
    }
    finishModes(*out.root, out);

    QUANTA_DEBUG("Physical plan for {}: {} fragment(s) in {} wave(s)", find.primary, out.fragments.size(),
                 out.wave_count);
    return std::move(state.plan);
}

// ============================================================================
// Writes
// ============================================================================

WritePlan PhysicalPlanner::translateWrites(WritePlan plan) const {
    for (auto& f : plan.fragments) {
        f.native = translators_.get(f.engine).translateWrite(f);
    }
    return plan;
}

WritePlan PhysicalPlanner::planInsert(const AnalyzedAdd& add, const json& key) const {
    const std::string& key_attr = add.schema->keyAttribute();
    std::map<StorageClass, json> per_engine;
    per_engine[StorageClass::Scalar][key_attr] = key;
    for (const auto& v : add.values) {
        if (v.attribute == key_attr) continue;
        json& values = per_engine[v.definition.type];
        values[key_attr] = key;
        values[v.attribute] = v.value;
    }

    WritePlan plan;
    plan.operation = NativeOperation::Insert;
    plan.bucket = add.bucket;
    plan.record = add.schema->name();
    for (StorageClass engine : kAllStorageClasses) {
        auto it = per_engine.find(engine);
        if (it == per_engine.end()) continue;
        WriteFragment f;
        f.engine = engine;
        f.operation = NativeOperation::Insert;
        f.bucket = add.bucket;
        f.record = plan.record;
        f.key_attribute = key_attr;
        f.values = it->second;
        plan.fragments.push_back(std::move(f));
    }
    return translateWrites(std::move(plan));
}

WritePlan PhysicalPlanner::planUpdate(const AnalyzedUpdate& update, const std::vector<json>& keys) const {
    std::map<StorageClass, json> per_engine;
    for (const auto& v : update.assignments) {
        per_engine[v.definition.type][v.attribute] = v.value;
    }

    WritePlan plan;
    plan.operation = NativeOperation::Update;
    plan.bucket = update.bucket;
    plan.record = update.schema->name();
    for (StorageClass engine : kAllStorageClasses) {
        auto it = per_engine.find(engine);
        if (it == per_engine.end()) continue;
        WriteFragment f;
        f.engine = engine;
        f.operation = NativeOperation::Update;
        f.bucket = update.bucket;
        f.record = plan.record;
        f.key_attribute = update.schema->keyAttribute();
        f.values = it->second;
        f.keys = keys;
        plan.fragments.push_back(std::move(f));
    }
    return translateWrites(std::move(plan));
}

WritePlan PhysicalPlanner::planRemove(const AnalyzedRemove& remove, const std::vector<json>& keys) const {
    WritePlan plan;
    plan.operation = NativeOperation::Delete;
    plan.bucket = remove.bucket;
    plan.record = remove.schema->name();
    for (StorageClass engine : kAllStorageClasses) {
        if (engine != StorageClass::Scalar && !remove.schema->usesEngine(engine)) continue;
        WriteFragment f;
        f.engine = engine;
        f.operation = NativeOperation::Delete;
        f.bucket = remove.bucket;
        f.record = plan.record;
        f.key_attribute = remove.schema->keyAttribute();
        f.keys = keys;
        plan.fragments.push_back(std::move(f));
    }
    return translateWrites(std::move(plan));
}

} // namespace query
} // namespace quanta
