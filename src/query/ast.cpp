#include "query/ast.h"

namespace quanta {
namespace query {

const char* binaryOpSymbol(BinaryOp op) {
    switch (op) {
        case BinaryOp::Eq: return "=";
        case BinaryOp::Neq: return "!=";
        case BinaryOp::Lt: return "<";
        case BinaryOp::Lte: return "<=";
        case BinaryOp::Gt: return ">";
        case BinaryOp::Gte: return ">=";
        case BinaryOp::And: return "AND";
        case BinaryOp::Or: return "OR";
        case BinaryOp::Add: return "+";
        case BinaryOp::Sub: return "-";
        case BinaryOp::Mul: return "*";
        case BinaryOp::Div: return "/";
        case BinaryOp::Mod: return "%";
        case BinaryOp::Contains: return "CONTAINS";
        case BinaryOp::In: return "IN";
    }
    return "?";
}

bool isComparison(BinaryOp op) {
    switch (op) {
        case BinaryOp::Eq: case BinaryOp::Neq:
        case BinaryOp::Lt: case BinaryOp::Lte:
        case BinaryOp::Gt: case BinaryOp::Gte:
            return true;
        default:
            return false;
    }
}

bool isArithmetic(BinaryOp op) {
    switch (op) {
        case BinaryOp::Add: case BinaryOp::Sub:
        case BinaryOp::Mul: case BinaryOp::Div: case BinaryOp::Mod:
            return true;
        default:
            return false;
    }
}

ExprPtr makeExpr(Expr::Node node, size_t position) {
    auto expr = std::make_shared<Expr>();
    expr->node = std::move(node);
    expr->position = position;
    return expr;
}

bool isAggregateFunction(const std::string& upper_name) {
    return upper_name == "COUNT" || upper_name == "SUM" || upper_name == "AVG" ||
           upper_name == "MIN" || upper_name == "MAX";
}

bool containsAggregate(const ExprPtr& expr) {
    if (!expr) return false;
    if (auto* call = std::get_if<FunctionCall>(&expr->node)) {
        if (isAggregateFunction(call->name)) return true;
        for (const auto& arg : call->args) {
            if (containsAggregate(arg)) return true;
        }
        return false;
    }
    if (auto* bin = std::get_if<BinaryExpr>(&expr->node)) {
        return containsAggregate(bin->left) || containsAggregate(bin->right);
    }
    if (auto* un = std::get_if<UnaryExpr>(&expr->node)) {
        return containsAggregate(un->operand);
    }
    if (auto* list = std::get_if<ListExpr>(&expr->node)) {
        for (const auto& item : list->items) {
            if (containsAggregate(item)) return true;
        }
    }
    return false;
}

namespace {

std::string literalToString(const Literal& lit) {
    switch (lit.kind) {
        case LiteralKind::Null: return "NULL";
        case LiteralKind::Boolean: return lit.value.get<bool>() ? "TRUE" : "FALSE";
        case LiteralKind::DateTime: return lit.value.get<std::string>();
        default: return lit.value.dump();
    }
}

std::string joinPath(const std::vector<std::string>& path) {
    std::string out;
    for (size_t i = 0; i < path.size(); ++i) {
        if (i > 0) out += '.';
        out += path[i];
    }
    return out;
}

std::string operandToString(const ExprPtr& expr) {
    if (expr && std::holds_alternative<BinaryExpr>(expr->node)) {
        return "(" + exprToString(expr) + ")";
    }
    return exprToString(expr);
}

} // namespace

std::string exprToString(const ExprPtr& expr) {
    if (!expr) return "";
    return std::visit([](const auto& node) -> std::string {
        using T = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<T, Literal>) {
            return literalToString(node);
        } else if constexpr (std::is_same_v<T, AttributeRef>) {
            return joinPath(node.path);
        } else if constexpr (std::is_same_v<T, BinaryExpr>) {
            return operandToString(node.left) + " " + binaryOpSymbol(node.op) + " " + operandToString(node.right);
        } else if constexpr (std::is_same_v<T, UnaryExpr>) {
            if (node.op == UnaryOp::Not) return "NOT " + operandToString(node.operand);
            return "-" + operandToString(node.operand);
        } else if constexpr (std::is_same_v<T, FunctionCall>) {
            std::string out = node.name + "(";
            if (node.star) out += "*";
            for (size_t i = 0; i < node.args.size(); ++i) {
                if (i > 0) out += ", ";
                out += exprToString(node.args[i]);
            }
            return out + ")";
        } else if constexpr (std::is_same_v<T, ListExpr>) {
            std::string out = "[";
            for (size_t i = 0; i < node.items.size(); ++i) {
                if (i > 0) out += ", ";
                out += exprToString(node.items[i]);
            }
            return out + "]";
        } else {
            std::string out = "{";
            for (size_t i = 0; i < node.fields.size(); ++i) {
                if (i > 0) out += ", ";
                out += node.fields[i].first + ": " + exprToString(node.fields[i].second);
            }
            return out + "}";
        }
    }, expr->node);
}

nlohmann::json exprToJSON(const ExprPtr& expr) {
    if (!expr) return nullptr;
    return std::visit([](const auto& node) -> nlohmann::json {
        using T = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<T, Literal>) {
            return {{"type", "literal"}, {"value", node.value}};
        } else if constexpr (std::is_same_v<T, AttributeRef>) {
            nlohmann::json j = {{"type", "attribute"}, {"path", node.path}};
            if (node.resolved) {
                j["binding"] = node.resolved->binding;
                j["attribute"] = node.resolved->attribute;
                j["engine"] = storageClassName(node.resolved->storage);
            }
            return j;
        } else if constexpr (std::is_same_v<T, BinaryExpr>) {
            return {{"type", "binary"}, {"op", binaryOpSymbol(node.op)},
                    {"left", exprToJSON(node.left)}, {"right", exprToJSON(node.right)}};
        } else if constexpr (std::is_same_v<T, UnaryExpr>) {
            return {{"type", "unary"}, {"op", node.op == UnaryOp::Not ? "NOT" : "-"},
                    {"operand", exprToJSON(node.operand)}};
        } else if constexpr (std::is_same_v<T, FunctionCall>) {
            nlohmann::json args = nlohmann::json::array();
            for (const auto& a : node.args) args.push_back(exprToJSON(a));
            return {{"type", "call"}, {"name", node.name}, {"star", node.star}, {"args", args}};
        } else if constexpr (std::is_same_v<T, ListExpr>) {
            nlohmann::json items = nlohmann::json::array();
            for (const auto& i : node.items) items.push_back(exprToJSON(i));
            return {{"type", "list"}, {"items", items}};
        } else {
            nlohmann::json fields = nlohmann::json::object();
            for (const auto& f : node.fields) fields[f.first] = exprToJSON(f.second);
            return {{"type", "object"}, {"fields", fields}};
        }
    }, expr->node);
}

std::vector<ExprPtr> splitConjuncts(const ExprPtr& expr) {
    std::vector<ExprPtr> out;
    if (!expr) return out;
    if (auto* bin = std::get_if<BinaryExpr>(&expr->node)) {
        if (bin->op == BinaryOp::And) {
            auto left = splitConjuncts(bin->left);
            auto right = splitConjuncts(bin->right);
            out.insert(out.end(), left.begin(), left.end());
            out.insert(out.end(), right.begin(), right.end());
            return out;
        }
    }
    out.push_back(expr);
    return out;
}

ExprPtr combineConjuncts(const std::vector<ExprPtr>& terms) {
    ExprPtr result;
    for (const auto& term : terms) {
        if (!result) {
            result = term;
        } else {
            result = makeExpr(BinaryExpr{BinaryOp::And, result, term}, result->position);
        }
    }
    return result;
}

const char* statementKindName(const Statement& stmt) {
    switch (stmt.node.index()) {
        case 0: return "FIND";
        case 1: return "NAVIGATE";
        case 2: return "ADD";
        case 3: return "UPDATE";
        case 4: return "REMOVE";
        case 5: return "CREATE RECORD";
        case 6: return "CREATE RELATION";
        case 7: return "ALTER RECORD";
        case 8: return "CREATE INDEX";
        case 9: return "TRANSACTION";
        case 10: return "EXPLAIN";
    }
    return "UNKNOWN";
}

namespace {

nlohmann::json navigationToJSON(const NavigationPath& path) {
    nlohmann::json hops = nlohmann::json::array();
    for (const auto& hop : path.hops) {
        hops.push_back({{"attribute", hop.attribute}, {"target", hop.target}, {"alias", hop.alias}});
    }
    return {{"source", path.source}, {"hops", hops}};
}

nlohmann::json orderToJSON(const std::vector<OrderItem>& items) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& item : items) {
        out.push_back({{"expr", exprToString(item.expr)}, {"ascending", item.ascending}});
    }
    return out;
}

} // namespace

nlohmann::json statementToJSON(const Statement& stmt) {
    nlohmann::json j = std::visit([](const auto& node) -> nlohmann::json {
        using T = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<T, FindStatement>) {
            nlohmann::json projections = nlohmann::json::array();
            for (const auto& p : node.projections) {
                if (p.wildcard) {
                    projections.push_back(p.wildcard_binding.empty() ? "*" : p.wildcard_binding + ".*");
                } else {
                    projections.push_back({{"expr", exprToString(p.expr)}, {"alias", p.alias}});
                }
            }
            nlohmann::json navigations = nlohmann::json::array();
            for (const auto& n : node.navigations) navigations.push_back(navigationToJSON(n));
            nlohmann::json groups = nlohmann::json::array();
            for (const auto& g : node.group_by) groups.push_back(exprToString(g));
            nlohmann::json out = {{"projections", projections}, {"from", node.from},
                                  {"navigations", navigations}, {"match", exprToJSON(node.match)},
                                  {"group_by", groups}, {"having", exprToJSON(node.having)},
                                  {"order_by", orderToJSON(node.order_by)}};
            if (node.limit) out["limit"] = *node.limit;
            if (node.offset) out["offset"] = *node.offset;
            return out;
        } else if constexpr (std::is_same_v<T, NavigateStatement>) {
            nlohmann::json out = {{"path", navigationToJSON(node.path)}, {"match", exprToJSON(node.match)},
                                  {"order_by", orderToJSON(node.order_by)}};
            if (node.limit) out["limit"] = *node.limit;
            if (node.offset) out["offset"] = *node.offset;
            return out;
        } else if constexpr (std::is_same_v<T, AddStatement>) {
            return {{"record", node.record}, {"values", exprToJSON(node.values)}};
        } else if constexpr (std::is_same_v<T, UpdateStatement>) {
            nlohmann::json set = nlohmann::json::object();
            for (const auto& a : node.assignments) set[a.attribute] = exprToJSON(a.value);
            return {{"record", node.record}, {"set", set}, {"match", exprToJSON(node.match)}};
        } else if constexpr (std::is_same_v<T, RemoveStatement>) {
            return {{"record", node.record}, {"match", exprToJSON(node.match)}};
        } else if constexpr (std::is_same_v<T, CreateRecordStatement>) {
            nlohmann::json attrs = nlohmann::json::array();
            for (const auto& a : node.attributes) {
                attrs.push_back({{"name", a.name}, {"type", storageClassName(a.type)}, {"hint", a.hint},
                                 {"primary_key", a.primary_key}, {"indexed", a.indexed}});
            }
            return {{"record", node.record}, {"attributes", attrs}};
        } else if constexpr (std::is_same_v<T, CreateRelationStatement>) {
            return {{"name", node.name}, {"from", node.from}, {"to", node.to}};
        } else if constexpr (std::is_same_v<T, AlterRecordStatement>) {
            nlohmann::json attrs = nlohmann::json::array();
            for (const auto& a : node.additions) {
                attrs.push_back({{"name", a.name}, {"type", storageClassName(a.type)}, {"hint", a.hint},
                                 {"indexed", a.indexed}});
            }
            return {{"record", node.record}, {"add", attrs}};
        } else if constexpr (std::is_same_v<T, CreateIndexStatement>) {
            return {{"record", node.record}, {"attributes", node.attributes}};
        } else if constexpr (std::is_same_v<T, TransactionStatement>) {
            nlohmann::json stmts = nlohmann::json::array();
            for (const auto& s : node.statements) stmts.push_back(statementToJSON(*s));
            return {{"statements", stmts}};
        } else {
            return {{"inner", node.inner ? statementToJSON(*node.inner) : nlohmann::json()}};
        }
    }, stmt.node);
    j["kind"] = statementKindName(stmt);
    return j;
}

} // namespace query
} // namespace quanta
