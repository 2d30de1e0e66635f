#include "query/result_assembler.h"
#include "query/value_normalizer.h"
#include "utils/logger.h"

#include <algorithm>
#include <set>
#include <unordered_map>

namespace quanta {
namespace query {

namespace {

using json = nlohmann::json;

bool isBindingNode(const PhysicalNode& node) {
    if (std::holds_alternative<PhysicalScan>(node.op)) return true;
    if (auto* join = std::get_if<PhysicalJoin>(&node.op)) return join->kind == JoinKind::KeyMerge;
    if (auto* filter = std::get_if<PhysicalFilter>(&node.op)) return isBindingNode(*filter->input);
    return false;
}

int firstFragment(const PhysicalNode& node) {
    if (auto* scan = std::get_if<PhysicalScan>(&node.op)) return scan->fragment;
    if (auto* join = std::get_if<PhysicalJoin>(&node.op)) return firstFragment(*join->left);
    if (auto* filter = std::get_if<PhysicalFilter>(&node.op)) return firstFragment(*filter->input);
    return -1;
}

/// Stored form of an attribute: metric series and document paths unreduced
json rawValue(const ResolvedAttribute& attr, const json& tuple) {
    auto row = tuple.find(attr.binding);
    if (row == tuple.end() || !row->is_object()) return nullptr;
    if (attr.isBinding()) return *row;
    auto field = row->find(attr.attribute);
    if (field == row->end()) return nullptr;
    json value = *field;
    for (const auto& step : attr.sub_path) {
        if (!value.is_object() || !value.contains(step)) return nullptr;
        value = value[step];
    }
    return value;
}

json numericSum(const std::vector<json>& values, size_t& count) {
    bool all_int = true;
    int64_t isum = 0;
    double dsum = 0.0;
    count = 0;
    for (const auto& v : values) {
        if (!v.is_number()) continue;
        ++count;
        if (v.is_number_integer() && all_int) {
            isum += v.get<int64_t>();
        } else {
            if (all_int) {
                dsum = static_cast<double>(isum);
                all_int = false;
            }
            dsum += v.get<double>();
        }
    }
    if (count == 0) return nullptr;
    return all_int ? json(isum) : json(dsum);
}

} // namespace

AggregateValues ResultAssembler::computeAggregates(const std::vector<ExprPtr>& aggregates,
                                                   const std::vector<const json*>& group) {
    AggregateValues out;
    for (const auto& expr : aggregates) {
        const auto& call = std::get<FunctionCall>(expr->node);
        const std::string key = exprToString(expr);

        if (call.star) {
            out[key] = group.size();
            continue;
        }

        const ExprPtr& arg = call.args.front();
        auto* ref = std::get_if<AttributeRef>(&arg->node);
        std::vector<json> values;

        if (ref && ref->resolved && ref->resolved->isBinding()) {
            // COUNT(binding): distinct related records
            std::set<std::string> seen;
            for (const json* t : group) {
                json row = rawValue(*ref->resolved, *t);
                if (!row.is_null()) seen.insert(row.dump());
            }
            out[key] = seen.size();
            continue;
        }
        if (ref && ref->resolved && ref->resolved->storage == StorageClass::Metric) {
            for (const json* t : group) {
                for (const auto& sample : normalizeMetricSamples(rawValue(*ref->resolved, *t))) {
                    values.push_back(sample["value"]);
                }
            }
        } else {
            for (const json* t : group) values.push_back(ExpressionEvaluator::evaluate(arg, *t));
        }

        if (call.name == "COUNT") {
            out[key] = std::count_if(values.begin(), values.end(), [](const json& v) { return !v.is_null(); });
        } else if (call.name == "SUM") {
            size_t n = 0;
            out[key] = numericSum(values, n);
        } else if (call.name == "AVG") {
            size_t n = 0;
            json sum = numericSum(values, n);
            out[key] = n == 0 ? json() : json(sum.get<double>() / static_cast<double>(n));
        } else {
            const bool want_min = call.name == "MIN";
            json best;
            for (const auto& v : values) {
                if (v.is_null()) continue;
                if (best.is_null()) {
                    best = v;
                    continue;
                }
                auto cmp = ExpressionEvaluator::compare(v, best);
                if (cmp && ((want_min && *cmp < 0) || (!want_min && *cmp > 0))) best = v;
            }
            out[key] = best;
        }
    }
    return out;
}

ResultAssembler::BindingRows ResultAssembler::bindingRows(const PhysicalNode& node, Context& ctx) const {
    BindingRows out;

    if (auto* scan = std::get_if<PhysicalScan>(&node.op)) {
        const Fragment* frag = ctx.plan.fragment(scan->fragment);
        const FragmentResult* result = ctx.execution.fragment(scan->fragment);
        out.defines_keys = frag->required;
        if (!result) return out;
        for (const auto& row : result->rows) {
            auto key = row.find(frag->key_attribute);
            if (key == row.end() || key->is_null()) continue;
            std::string k = key->dump();
            auto it = out.rows.find(k);
            if (it == out.rows.end()) {
                out.order.push_back(k);
                out.rows.emplace(k, row);
            } else {
                it->second.update(row);
            }
        }
        return out;
    }

    if (auto* filter = std::get_if<PhysicalFilter>(&node.op)) {
        BindingRows input = bindingRows(*filter->input, ctx);
        const Fragment* frag = ctx.plan.fragment(firstFragment(node));
        out.defines_keys = true;
        for (const auto& k : input.order) {
            json tuple = {{frag->binding, input.rows[k]}};
            if (ExpressionEvaluator::test(filter->predicate, tuple)) {
                out.order.push_back(k);
                out.rows.emplace(k, std::move(input.rows[k]));
            }
        }
        return out;
    }

    const auto& join = std::get<PhysicalJoin>(node.op);
    BindingRows left = bindingRows(*join.left, ctx);
    BindingRows right = bindingRows(*join.right, ctx);

    auto mergeInto = [](BindingRows& into, BindingRows& from, bool keep_unmatched_from) {
        for (const auto& k : from.order) {
            auto it = into.rows.find(k);
            if (it != into.rows.end()) {
                it->second.update(from.rows[k]);
            } else if (keep_unmatched_from) {
                into.order.push_back(k);
                into.rows.emplace(k, std::move(from.rows[k]));
            }
        }
    };

    if (left.defines_keys && right.defines_keys) {
        for (const auto& k : left.order) {
            auto r = right.rows.find(k);
            if (r == right.rows.end()) continue;
            json merged = left.rows[k];
            merged.update(r->second);
            out.order.push_back(k);
            out.rows.emplace(k, std::move(merged));
        }
        out.defines_keys = true;
    } else if (right.defines_keys) {
        mergeInto(right, left, false);
        out = std::move(right);
    } else {
        mergeInto(left, right, !left.defines_keys);
        out = std::move(left);
    }
    return out;
}

std::vector<ResultAssembler::Row> ResultAssembler::navigate(const PhysicalJoin& join, std::vector<Row> left,
                                                            Context& ctx) const {
    const std::string source_key = ctx.find.binding(join.source)->schema->keyAttribute();
    const std::string target_key = ctx.find.binding(join.target)->schema->keyAttribute();

    const FragmentResult* pairs_result = ctx.execution.fragment(join.traversal_fragment);
    static const std::vector<json> kNoPairs;
    const std::vector<json>& pairs = pairs_result ? pairs_result->rows : kNoPairs;

    BindingRows right;
    if (join.right) right = bindingRows(*join.right, ctx);

    std::vector<Row> out;
    auto emit = [&](const Row& l, const json& target) {
        json trow;
        auto it = right.rows.find(target.dump());
        if (it != right.rows.end()) {
            trow = it->second;
        } else if (right.defines_keys) {
            return;
        } else {
            trow = {{target_key, target}};
        }
        Row r{l.tuple, l.aggregates};
        r.tuple[join.target] = std::move(trow);
        out.push_back(std::move(r));
    };

    if (join.algorithm == JoinAlgorithm::HashJoin) {
        std::unordered_map<std::string, std::vector<json>> targets;
        for (const auto& p : pairs) targets[p.value("source", json()).dump()].push_back(p.value("target", json()));
        for (const auto& l : left) {
            auto src = l.tuple.find(join.source);
            if (src == l.tuple.end() || !src->is_object()) continue;
            auto it = targets.find(src->value(source_key, json()).dump());
            if (it == targets.end()) continue;
            for (const auto& t : it->second) emit(l, t);
        }
    } else {
        for (const auto& l : left) {
            auto src = l.tuple.find(join.source);
            if (src == l.tuple.end() || !src->is_object()) continue;
            const json skey = src->value(source_key, json());
            for (const auto& p : pairs) {
                if (p.value("source", json()) == skey) emit(l, p.value("target", json()));
            }
        }
    }
    return out;
}

std::vector<ResultAssembler::Row> ResultAssembler::aggregate(const PhysicalAggregate& agg, std::vector<Row> input) const {
    std::vector<std::vector<const json*>> groups;
    std::unordered_map<std::string, size_t> index;

    if (agg.group_by.empty()) {
        groups.emplace_back();
        for (const auto& r : input) groups.front().push_back(&r.tuple);
    } else {
        for (const auto& r : input) {
            json key = json::array();
            for (const auto& g : agg.group_by) key.push_back(ExpressionEvaluator::evaluate(g, r.tuple));
            auto [it, inserted] = index.emplace(key.dump(), groups.size());
            if (inserted) groups.emplace_back();
            groups[it->second].push_back(&r.tuple);
        }
    }

    std::vector<Row> out;
    for (const auto& group : groups) {
        Row row;
        row.tuple = group.empty() ? json::object() : *group.front();
        row.aggregates = computeAggregates(agg.aggregates, group);
        if (agg.having && !ExpressionEvaluator::test(agg.having, row.tuple, &row.aggregates)) continue;
        out.push_back(std::move(row));
    }
    return out;
}

std::vector<ResultAssembler::Row> ResultAssembler::run(const PhysicalNode& node, Context& ctx) const {
    if (isBindingNode(node)) {
        BindingRows rows = bindingRows(node, ctx);
        const std::string& binding = ctx.plan.fragment(firstFragment(node))->binding;
        std::vector<Row> out;
        out.reserve(rows.order.size());
        for (const auto& k : rows.order) {
            Row r;
            r.tuple[binding] = std::move(rows.rows[k]);
            out.push_back(std::move(r));
        }
        return out;
    }

    return std::visit([&](const auto& op) -> std::vector<Row> {
        using T = std::decay_t<decltype(op)>;
        if constexpr (std::is_same_v<T, PhysicalScan>) {
            return {};
        } else if constexpr (std::is_same_v<T, PhysicalFilter>) {
            std::vector<Row> rows = run(*op.input, ctx);
            rows.erase(std::remove_if(rows.begin(), rows.end(), [&](const Row& r) {
                return !ExpressionEvaluator::test(op.predicate, r.tuple, &r.aggregates);
            }), rows.end());
            return rows;
        } else if constexpr (std::is_same_v<T, PhysicalJoin>) {
            return navigate(op, run(*op.left, ctx), ctx);
        } else if constexpr (std::is_same_v<T, PhysicalProject>) {
            return run(*op.input, ctx);
        } else if constexpr (std::is_same_v<T, PhysicalAggregate>) {
            return aggregate(op, run(*op.input, ctx));
        } else if constexpr (std::is_same_v<T, PhysicalSort>) {
            std::vector<Row> rows = run(*op.input, ctx);
            if (op.native) return rows;

            std::vector<std::vector<json>> keys;
            keys.reserve(rows.size());
            for (const auto& r : rows) {
                std::vector<json> k;
                for (const auto& item : op.order_by) {
                    k.push_back(ExpressionEvaluator::evaluate(item.expr, r.tuple, &r.aggregates));
                }
                keys.push_back(std::move(k));
            }
            std::vector<size_t> idx(rows.size());
            for (size_t i = 0; i < idx.size(); ++i) idx[i] = i;
            std::stable_sort(idx.begin(), idx.end(), [&](size_t a, size_t b) {
                for (size_t i = 0; i < op.order_by.size(); ++i) {
                    if (ExpressionEvaluator::sortLess(keys[a][i], keys[b][i])) return op.order_by[i].ascending;
                    if (ExpressionEvaluator::sortLess(keys[b][i], keys[a][i])) return !op.order_by[i].ascending;
                }
                return false;
            });
            std::vector<Row> sorted;
            sorted.reserve(rows.size());
            for (size_t i : idx) sorted.push_back(std::move(rows[i]));
            return sorted;
        } else {
            std::vector<Row> rows = run(*op.input, ctx);
            ctx.total_count = rows.size();
            ctx.counted = true;

            size_t begin = op.offset ? static_cast<size_t>(std::max<int64_t>(*op.offset, 0)) : 0;
            size_t end = rows.size();
            if (op.limit) end = std::min(end, begin + static_cast<size_t>(std::max<int64_t>(*op.limit, 0)));
            if (begin >= rows.size()) return {};
            return std::vector<Row>(std::make_move_iterator(rows.begin() + static_cast<std::ptrdiff_t>(begin)),
                                    std::make_move_iterator(rows.begin() + static_cast<std::ptrdiff_t>(end)));
        }
    }, node.op);
}

json ResultAssembler::project(const std::vector<OutputColumn>& columns, const Row& row) const {
    json item = json::object();
    for (const auto& col : columns) {
        json value;
        auto* ref = std::get_if<AttributeRef>(&col.expr->node);
        if (col.definition && ref && ref->resolved) {
            value = normalizeValue(rawValue(*ref->resolved, row.tuple), *col.definition);
        } else {
            value = ExpressionEvaluator::evaluate(col.expr, row.tuple, &row.aggregates);
            if (value.is_string()) {
                if (auto dt = normalizeDateTime(value.get<std::string>())) value = *dt;
            }
        }
        if (col.binding.empty()) {
            item[col.name] = std::move(value);
        } else {
            item[col.binding][col.name] = std::move(value);
        }
    }
    return item;
}

std::vector<ResultAssembler::Row> ResultAssembler::evaluate(const PhysicalPlan& plan, const AnalyzedFind& find,
                                                            const ExecutionResult& execution) const {
    Context ctx{plan, find, execution};
    return run(*plan.root, ctx);
}

json ResultAssembler::assemble(const PhysicalPlan& plan, const AnalyzedFind& find,
                               const ExecutionResult& execution, double elapsed_ms) const {
    Context ctx{plan, find, execution};
    const auto* project_op = std::get_if<PhysicalProject>(&plan.root->op);
    std::vector<Row> rows = run(*plan.root, ctx);

    json data = json::array();
    for (const auto& r : rows) {
        data.push_back(project_op ? project(project_op->columns, r) : r.tuple);
    }

    const size_t total = ctx.counted ? ctx.total_count : rows.size();
    size_t page = 1;
    size_t page_size = default_page_size_;
    if (find.limit && *find.limit > 0) {
        page_size = static_cast<size_t>(*find.limit);
        page = static_cast<size_t>(find.offset.value_or(0)) / page_size + 1;
    }

    json metadata = {{"total_count", total},
                     {"returned_count", data.size()},
                     {"page", page},
                     {"page_size", page_size},
                     {"execution_time_ms", elapsed_ms}};
    if (!execution.failed_engines.empty()) {
        metadata["failed_engines"] = execution.failed_engines;
        metadata["partial"] = true;
    }

    json engines = json::object();
    for (const auto& [name, stats] : execution.engines) {
        engines[name] = {{"units_scanned", stats.units_scanned}, {"execution_time_ms", stats.execution_time_ms}};
    }

    return {{"data", std::move(data)}, {"metadata", std::move(metadata)}, {"engines", std::move(engines)}};
}

} // namespace query
} // namespace quanta
