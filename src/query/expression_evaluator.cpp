#include "query/expression_evaluator.h"
#include "query/value_normalizer.h"
#include "utils/status.h"
#include <cmath>

namespace quanta {
namespace query {

namespace {

using json = nlohmann::json;

json walkPath(const json& start, const std::vector<std::string>& path, size_t from) {
    const json* cur = &start;
    for (size_t i = from; i < path.size(); ++i) {
        if (!cur->is_object()) return nullptr;
        auto it = cur->find(path[i]);
        if (it == cur->end()) return nullptr;
        cur = &*it;
    }
    return *cur;
}

json arithmetic(BinaryOp op, const json& l, const json& r) {
    if (l.is_null() || r.is_null()) return nullptr;

    if (op == BinaryOp::Add && l.is_string() && r.is_string()) {
        return l.get<std::string>() + r.get<std::string>();
    }
    if (!l.is_number() || !r.is_number()) return nullptr;

    bool integral = l.is_number_integer() && r.is_number_integer();
    if (integral) {
        int64_t a = l.get<int64_t>();
        int64_t b = r.get<int64_t>();
        switch (op) {
            case BinaryOp::Add: return a + b;
            case BinaryOp::Sub: return a - b;
            case BinaryOp::Mul: return a * b;
            case BinaryOp::Div:
                if (b == 0) return nullptr;
                return static_cast<double>(a) / static_cast<double>(b);
            case BinaryOp::Mod:
                if (b == 0) return nullptr;
                return a % b;
            default: return nullptr;
        }
    }

    double a = l.get<double>();
    double b = r.get<double>();
    switch (op) {
        case BinaryOp::Add: return a + b;
        case BinaryOp::Sub: return a - b;
        case BinaryOp::Mul: return a * b;
        case BinaryOp::Div:
            if (b == 0.0) return nullptr;
            return a / b;
        case BinaryOp::Mod:
            if (b == 0.0) return nullptr;
            return std::fmod(a, b);
        default: return nullptr;
    }
}

json membership(BinaryOp op, const json& l, const json& r) {
    if (l.is_null() || r.is_null()) return false;

    const json& haystack = op == BinaryOp::Contains ? l : r;
    const json& needle = op == BinaryOp::Contains ? r : l;

    if (haystack.is_array()) {
        for (const auto& item : haystack) {
            if (ExpressionEvaluator::equals(item, needle)) return true;
        }
        return false;
    }
    if (haystack.is_string() && needle.is_string()) {
        return haystack.get<std::string>().find(needle.get<std::string>()) != std::string::npos;
    }
    if (haystack.is_object() && needle.is_string()) {
        return haystack.contains(needle.get<std::string>());
    }
    return false;
}

json comparison(BinaryOp op, const json& l, const json& r) {
    if (op == BinaryOp::Eq) return ExpressionEvaluator::equals(l, r);
    if (op == BinaryOp::Neq) {
        if (l.is_null() && r.is_null()) return false;
        if (l.is_null() || r.is_null()) return true;
        return !ExpressionEvaluator::equals(l, r);
    }

    auto cmp = ExpressionEvaluator::compare(l, r);
    if (!cmp) return false;
    switch (op) {
        case BinaryOp::Lt: return *cmp < 0;
        case BinaryOp::Lte: return *cmp <= 0;
        case BinaryOp::Gt: return *cmp > 0;
        case BinaryOp::Gte: return *cmp >= 0;
        default: return false;
    }
}

} // namespace

json ExpressionEvaluator::resolve(const ResolvedAttribute& attr, const json& tuple) {
    auto it = tuple.find(attr.binding);
    if (it == tuple.end() || it->is_null()) return nullptr;
    if (attr.isBinding()) return *it;

    auto field = it->find(attr.attribute);
    if (field == it->end()) return nullptr;
    if (attr.storage == StorageClass::Metric) {
        return latestSampleValue(*field);
    }
    if (attr.sub_path.empty()) return *field;
    return walkPath(*field, attr.sub_path, 0);
}

json ExpressionEvaluator::evaluate(const ExprPtr& expr, const json& tuple, const AggregateValues* aggregates) {
    if (!expr) return nullptr;

    return std::visit([&](const auto& node) -> json {
        using T = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<T, Literal>) {
            return node.value;
        } else if constexpr (std::is_same_v<T, AttributeRef>) {
            if (node.resolved) return resolve(*node.resolved, tuple);
            return walkPath(tuple, node.path, 0);
        } else if constexpr (std::is_same_v<T, BinaryExpr>) {
            if (node.op == BinaryOp::And) {
                return isTruthy(evaluate(node.left, tuple, aggregates)) &&
                       isTruthy(evaluate(node.right, tuple, aggregates));
            }
            if (node.op == BinaryOp::Or) {
                return isTruthy(evaluate(node.left, tuple, aggregates)) ||
                       isTruthy(evaluate(node.right, tuple, aggregates));
            }
            json l = evaluate(node.left, tuple, aggregates);
            json r = evaluate(node.right, tuple, aggregates);
            if (isArithmetic(node.op)) return arithmetic(node.op, l, r);
            if (node.op == BinaryOp::Contains || node.op == BinaryOp::In) return membership(node.op, l, r);
            return comparison(node.op, l, r);
        } else if constexpr (std::is_same_v<T, UnaryExpr>) {
            json v = evaluate(node.operand, tuple, aggregates);
            if (v.is_null()) return nullptr;
            if (node.op == UnaryOp::Not) return !isTruthy(v);
            if (v.is_number_integer()) return -v.get<int64_t>();
            if (v.is_number()) return -v.get<double>();
            return nullptr;
        } else if constexpr (std::is_same_v<T, FunctionCall>) {
            if (isAggregateFunction(node.name) && aggregates) {
                auto it = aggregates->find(exprToString(expr));
                if (it != aggregates->end()) return it->second;
            }
            throw StatusError(Status::TypeError(expr->position,
                "function " + node.name + " cannot be evaluated in this context"));
        } else if constexpr (std::is_same_v<T, ListExpr>) {
            json arr = json::array();
            for (const auto& item : node.items) arr.push_back(evaluate(item, tuple, aggregates));
            return arr;
        } else {
            json obj = json::object();
            for (const auto& field : node.fields) obj[field.first] = evaluate(field.second, tuple, aggregates);
            return obj;
        }
    }, expr->node);
}

bool ExpressionEvaluator::test(const ExprPtr& expr, const json& tuple, const AggregateValues* aggregates) {
    return isTruthy(evaluate(expr, tuple, aggregates));
}

bool ExpressionEvaluator::isTruthy(const json& value) {
    if (value.is_boolean()) return value.get<bool>();
    if (value.is_null()) return false;
    if (value.is_number()) return value.get<double>() != 0.0;
    if (value.is_string()) return !value.get_ref<const std::string&>().empty();
    return !value.empty();
}

std::optional<int> ExpressionEvaluator::compare(const json& a, const json& b) {
    if (a.is_null() || b.is_null()) return std::nullopt;

    if (a.is_number() && b.is_number()) {
        if (a.is_number_integer() && b.is_number_integer()) {
            int64_t x = a.get<int64_t>(), y = b.get<int64_t>();
            return x < y ? -1 : (x > y ? 1 : 0);
        }
        double x = a.get<double>(), y = b.get<double>();
        return x < y ? -1 : (x > y ? 1 : 0);
    }
    if (a.is_boolean() && b.is_boolean()) {
        int x = a.get<bool>() ? 1 : 0, y = b.get<bool>() ? 1 : 0;
        return x - y;
    }
    if (a.is_string() && b.is_string()) {
        const std::string& x = a.get_ref<const std::string&>();
        const std::string& y = b.get_ref<const std::string&>();
        auto dx = normalizeDateTime(x);
        if (dx) {
            auto dy = normalizeDateTime(y);
            if (dy) {
                int c = dx->compare(*dy);
                return c < 0 ? -1 : (c > 0 ? 1 : 0);
            }
        }
        int c = x.compare(y);
        return c < 0 ? -1 : (c > 0 ? 1 : 0);
    }
    return std::nullopt;
}

bool ExpressionEvaluator::equals(const json& a, const json& b) {
    if (a.is_null() || b.is_null()) return a.is_null() && b.is_null();
    auto cmp = compare(a, b);
    if (cmp) return *cmp == 0;
    return a == b;
}

bool ExpressionEvaluator::sortLess(const json& a, const json& b) {
    if (a.is_null() || b.is_null()) return a.is_null() && !b.is_null();
    auto cmp = compare(a, b);
    if (cmp) return *cmp < 0;
    return a.dump() < b.dump();
}

} // namespace query
} // namespace quanta
