#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

#include "schema/record_schema.h"

namespace quanta {
namespace query {

// ============================================================================
// Expressions
// ============================================================================

struct Expr;
using ExprPtr = std::shared_ptr<const Expr>;

enum class BinaryOp {
    Eq, Neq, Lt, Lte, Gt, Gte,  // comparison
    And, Or,                    // logical
    Add, Sub, Mul, Div, Mod,    // arithmetic
    Contains, In                // membership
};

enum class UnaryOp { Not, Neg };

const char* binaryOpSymbol(BinaryOp op);
bool isComparison(BinaryOp op);
bool isArithmetic(BinaryOp op);

enum class LiteralKind { Null, Boolean, Integer, Number, String, DateTime };

struct Literal {
    LiteralKind kind = LiteralKind::Null;
    nlohmann::json value;
};

/// Filled in by the semantic analyzer. Carries the owning storage engine of the leaf.
struct ResolvedAttribute {
    std::string binding;                  // query-level name of the record occurrence
    std::string record;
    std::string attribute;                // empty: the reference names the binding itself
    std::vector<std::string> sub_path;    // nested path inside a document attribute
    StorageClass storage = StorageClass::Scalar;
    ValueType value_type = ValueType::Any;
    bool indexed = false;
    bool is_key = false;

    bool isBinding() const { return attribute.empty(); }
};

struct AttributeRef {
    std::vector<std::string> path;        // dotted reference as written
    std::optional<ResolvedAttribute> resolved;
};

struct BinaryExpr {
    BinaryOp op;
    ExprPtr left;
    ExprPtr right;
};

struct UnaryExpr {
    UnaryOp op;
    ExprPtr operand;
};

struct FunctionCall {
    std::string name;                     // upper-cased
    std::vector<ExprPtr> args;
    bool star = false;                    // COUNT(*)
};

struct ListExpr {
    std::vector<ExprPtr> items;
};

struct ObjectExpr {
    std::vector<std::pair<std::string, ExprPtr>> fields;
};

struct Expr {
    using Node = std::variant<Literal, AttributeRef, BinaryExpr, UnaryExpr, FunctionCall, ListExpr, ObjectExpr>;

    Node node;
    size_t position = 0;
};

ExprPtr makeExpr(Expr::Node node, size_t position);

bool isAggregateFunction(const std::string& upper_name);
bool containsAggregate(const ExprPtr& expr);

/// Canonical source text. Used as output column name and for structural comparison.
std::string exprToString(const ExprPtr& expr);
nlohmann::json exprToJSON(const ExprPtr& expr);

/// Splits a conjunction into its AND-ed terms
std::vector<ExprPtr> splitConjuncts(const ExprPtr& expr);
ExprPtr combineConjuncts(const std::vector<ExprPtr>& terms);

/// Calls fn for every resolved or unresolved attribute reference in the tree
template<typename Fn>
void forEachAttribute(const ExprPtr& expr, Fn&& fn);

// ============================================================================
// Statements
// ============================================================================

struct Projection {
    ExprPtr expr;                         // null for wildcards
    std::string alias;
    bool wildcard = false;
    std::string wildcard_binding;         // "tasks" for tasks.*, empty for *
    size_t position = 0;
};

struct Hop {
    std::string attribute;                // relation attribute of the previous record
    std::string target;                   // optional explicit target record
    std::string alias;
    size_t position = 0;
};

struct NavigationPath {
    std::string source;
    std::vector<Hop> hops;
    size_t position = 0;
};

struct OrderItem {
    ExprPtr expr;
    bool ascending = true;
};

struct FindStatement {
    std::vector<Projection> projections;
    std::string from;
    size_t from_position = 0;
    std::vector<NavigationPath> navigations;
    ExprPtr match;
    std::vector<ExprPtr> group_by;
    ExprPtr having;
    std::vector<OrderItem> order_by;
    std::optional<int64_t> limit;
    std::optional<int64_t> offset;
};

struct NavigateStatement {
    NavigationPath path;
    ExprPtr match;
    std::vector<OrderItem> order_by;
    std::optional<int64_t> limit;
    std::optional<int64_t> offset;
};

struct AddStatement {
    std::string record;
    size_t record_position = 0;
    ExprPtr values;                       // ObjectExpr
};

struct Assignment {
    std::string attribute;
    ExprPtr value;
    size_t position = 0;
};

struct UpdateStatement {
    std::string record;
    size_t record_position = 0;
    std::vector<Assignment> assignments;
    ExprPtr match;
};

struct RemoveStatement {
    std::string record;
    size_t record_position = 0;
    ExprPtr match;
};

struct AttributeDecl {
    std::string name;
    StorageClass type = StorageClass::Scalar;
    std::string hint;                     // datatype, relation target or metric unit
    bool primary_key = false;
    bool indexed = false;
    size_t position = 0;
};

struct CreateRecordStatement {
    std::string record;
    std::vector<AttributeDecl> attributes;
};

struct CreateRelationStatement {
    std::string name;
    std::string from;
    std::string to;
};

// ALTER RECORD r ADD [COLUMN] a: CLASS[<hint>] [INDEXED], ...
struct AlterRecordStatement {
    std::string record;
    std::vector<AttributeDecl> additions;
};

// CREATE INDEX ON r(a, b)
struct CreateIndexStatement {
    std::string record;
    std::vector<std::string> attributes;
    std::vector<size_t> positions;
};

struct Statement;
using StatementPtr = std::shared_ptr<const Statement>;

struct TransactionStatement {
    std::vector<StatementPtr> statements;
};

struct ExplainStatement {
    StatementPtr inner;
};

struct Statement {
    using Node = std::variant<FindStatement, NavigateStatement, AddStatement, UpdateStatement,
                              RemoveStatement, CreateRecordStatement, CreateRelationStatement,
                              AlterRecordStatement, CreateIndexStatement,
                              TransactionStatement, ExplainStatement>;

    Node node;
    size_t position = 0;
};

const char* statementKindName(const Statement& stmt);
nlohmann::json statementToJSON(const Statement& stmt);

// ============================================================================
// Template implementation
// ============================================================================

template<typename Fn>
void forEachAttribute(const ExprPtr& expr, Fn&& fn) {
    if (!expr) return;
    if (auto* ref = std::get_if<AttributeRef>(&expr->node)) {
        fn(*ref, expr->position);
    } else if (auto* bin = std::get_if<BinaryExpr>(&expr->node)) {
        forEachAttribute(bin->left, fn);
        forEachAttribute(bin->right, fn);
    } else if (auto* un = std::get_if<UnaryExpr>(&expr->node)) {
        forEachAttribute(un->operand, fn);
    } else if (auto* call = std::get_if<FunctionCall>(&expr->node)) {
        for (const auto& arg : call->args) forEachAttribute(arg, fn);
    } else if (auto* list = std::get_if<ListExpr>(&expr->node)) {
        for (const auto& item : list->items) forEachAttribute(item, fn);
    } else if (auto* obj = std::get_if<ObjectExpr>(&expr->node)) {
        for (const auto& field : obj->fields) forEachAttribute(field.second, fn);
    }
}

} // namespace query
} // namespace quanta
