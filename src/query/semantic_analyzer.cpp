#include "query/semantic_analyzer.h"
#include "query/expression_evaluator.h"
#include "query/value_normalizer.h"
#include <algorithm>
#include <set>

namespace quanta {
namespace query {

namespace {

using json = nlohmann::json;

// Static type of an expression, coarser than ValueType
enum class TypeTag { Unknown, Null, String, Number, Boolean, DateTime, List, Object, Relation };

const char* typeTagName(TypeTag tag) {
    switch (tag) {
        case TypeTag::Unknown: return "any";
        case TypeTag::Null: return "null";
        case TypeTag::String: return "string";
        case TypeTag::Number: return "number";
        case TypeTag::Boolean: return "boolean";
        case TypeTag::DateTime: return "datetime";
        case TypeTag::List: return "list";
        case TypeTag::Object: return "object";
        case TypeTag::Relation: return "relation";
    }
    return "any";
}

TypeTag tagOf(ValueType type) {
    switch (type) {
        case ValueType::String: return TypeTag::String;
        case ValueType::Integer:
        case ValueType::Number: return TypeTag::Number;
        case ValueType::Boolean: return TypeTag::Boolean;
        case ValueType::DateTime: return TypeTag::DateTime;
        default: return TypeTag::Unknown;
    }
}

struct Typed {
    ExprPtr expr;
    TypeTag tag = TypeTag::Unknown;
    bool date_like = false;        // string literal that parses as a date-time
};

struct ResolveOptions {
    bool allow_aggregates = false;
    bool in_aggregate = false;
    bool in_count = false;
    bool allow_aliases = false;
    const char* clause = "MATCH";
};

/// Name resolution scope of one FIND
class Scope {
public:
    Scope(const AnalyzedFind& find, const std::string& bucket, const SchemaRegistry& registry)
        : find_(find), bucket_(bucket), registry_(registry) {}

    Typed resolve(const ExprPtr& expr, const ResolveOptions& opts) const;

    /// ORDER BY / HAVING may name a projection alias
    std::vector<std::pair<std::string, ExprPtr>> aliases;

private:
    const AnalyzedFind& find_;
    const std::string& bucket_;
    const SchemaRegistry& registry_;

    Typed resolveAttribute(const AttributeRef& ref, size_t position, const ResolveOptions& opts) const;
    Typed resolveBinary(const BinaryExpr& bin, size_t position, const ResolveOptions& opts) const;
    Typed resolveCall(const FunctionCall& call, size_t position, const ResolveOptions& opts) const;
};

bool comparable(const Typed& a, const Typed& b) {
    if (a.tag == TypeTag::Unknown || b.tag == TypeTag::Unknown) return true;
    if (a.tag == TypeTag::Null || b.tag == TypeTag::Null) return true;
    if (a.tag == b.tag) return true;
    if (a.tag == TypeTag::DateTime && b.tag == TypeTag::String) return b.date_like || !b.expr ||
        !std::holds_alternative<Literal>(b.expr->node);
    if (b.tag == TypeTag::DateTime && a.tag == TypeTag::String) return a.date_like || !a.expr ||
        !std::holds_alternative<Literal>(a.expr->node);
    return false;
}

Typed Scope::resolve(const ExprPtr& expr, const ResolveOptions& opts) const {
    if (!expr) return {};

    if (auto* lit = std::get_if<Literal>(&expr->node)) {
        Typed t{expr, TypeTag::Unknown, false};
        switch (lit->kind) {
            case LiteralKind::Null: t.tag = TypeTag::Null; break;
            case LiteralKind::Boolean: t.tag = TypeTag::Boolean; break;
            case LiteralKind::Integer:
            case LiteralKind::Number: t.tag = TypeTag::Number; break;
            case LiteralKind::DateTime: t.tag = TypeTag::DateTime; break;
            case LiteralKind::String:
                t.tag = TypeTag::String;
                t.date_like = looksLikeDateTime(lit->value.get<std::string>());
                break;
        }
        return t;
    }

    if (auto* ref = std::get_if<AttributeRef>(&expr->node)) {
        return resolveAttribute(*ref, expr->position, opts);
    }

    if (auto* bin = std::get_if<BinaryExpr>(&expr->node)) {
        return resolveBinary(*bin, expr->position, opts);
    }

    if (auto* un = std::get_if<UnaryExpr>(&expr->node)) {
        Typed operand = resolve(un->operand, opts);
        if (un->op == UnaryOp::Not) {
            if (operand.tag != TypeTag::Boolean && operand.tag != TypeTag::Unknown && operand.tag != TypeTag::Null) {
                throw StatusError(Status::TypeError(expr->position,
                    std::string("NOT expects a boolean operand, got ") + typeTagName(operand.tag)));
            }
            return {makeExpr(UnaryExpr{un->op, operand.expr}, expr->position), TypeTag::Boolean, false};
        }
        if (operand.tag != TypeTag::Number && operand.tag != TypeTag::Unknown && operand.tag != TypeTag::Null) {
            throw StatusError(Status::TypeError(expr->position,
                std::string("unary '-' expects a number, got ") + typeTagName(operand.tag)));
        }
        return {makeExpr(UnaryExpr{un->op, operand.expr}, expr->position), TypeTag::Number, false};
    }

    if (auto* call = std::get_if<FunctionCall>(&expr->node)) {
        return resolveCall(*call, expr->position, opts);
    }

    if (auto* list = std::get_if<ListExpr>(&expr->node)) {
        ListExpr out;
        for (const auto& item : list->items) out.items.push_back(resolve(item, opts).expr);
        return {makeExpr(std::move(out), expr->position), TypeTag::List, false};
    }

    const auto& obj = std::get<ObjectExpr>(expr->node);
    ObjectExpr out;
    for (const auto& field : obj.fields) out.fields.emplace_back(field.first, resolve(field.second, opts).expr);
    return {makeExpr(std::move(out), expr->position), TypeTag::Object, false};
}

Typed Scope::resolveAttribute(const AttributeRef& ref, size_t position, const ResolveOptions& opts) const {
    // projection alias used in ORDER BY / HAVING
    if (opts.allow_aliases && ref.path.size() == 1) {
        for (const auto& [alias, target] : aliases) {
            if (alias == ref.path[0]) {
                ResolveOptions inner = opts;
                inner.allow_aggregates = true;
                inner.allow_aliases = false;
                return resolve(target, inner);
            }
        }
    }

    const Binding* binding = find_.binding(ref.path[0]);
    size_t attr_index = 1;
    if (!binding) {
        binding = find_.binding(find_.primary);
        attr_index = 0;
        if (!binding->schema->has(ref.path[0])) {
            if (ref.path.size() > 1 && registry_.getRecord(bucket_, ref.path[0])) {
                throw StatusError(Status::SchemaError(ref.path[0], "",
                    "record '" + ref.path[0] + "' is not part of this query; add a NAVIGATE clause"));
            }
            throw StatusError(Status::SchemaError(binding->schema->name(), ref.path[0],
                "unknown attribute '" + ref.path[0] + "' in record '" + binding->schema->name() + "'"));
        }
    }

    ResolvedAttribute resolved;
    resolved.binding = binding->name;
    resolved.record = binding->schema->name();

    if (attr_index >= ref.path.size()) {
        if (!opts.in_count) {
            throw StatusError(Status::TypeError(position,
                "binding '" + binding->name + "' can only be used inside COUNT(); use " + binding->name + ".*"));
        }
        AttributeRef out{ref.path, resolved};
        return {makeExpr(std::move(out), position), TypeTag::Object, false};
    }

    const std::string& attr = ref.path[attr_index];
    const AttributeDefinition* def = binding->schema->find(attr);
    if (!def) {
        throw StatusError(Status::SchemaError(resolved.record, attr,
            "unknown attribute '" + attr + "' in record '" + resolved.record + "'"));
    }

    resolved.attribute = attr;
    resolved.sub_path.assign(ref.path.begin() + static_cast<long>(attr_index) + 1, ref.path.end());
    if (!resolved.sub_path.empty() && def->type != StorageClass::Document) {
        throw StatusError(Status::SchemaError(resolved.record, attr,
            "nested path requires a DOCUMENT attribute, '" + attr + "' is " + storageClassName(def->type)));
    }
    resolved.storage = def->type;
    resolved.value_type = resolved.sub_path.empty() ? def->valueType() : ValueType::Any;
    resolved.indexed = def->indexed;
    resolved.is_key = attr == binding->schema->keyAttribute();

    TypeTag tag = def->type == StorageClass::Relation ? TypeTag::Relation : tagOf(resolved.value_type);
    AttributeRef out{ref.path, resolved};
    return {makeExpr(std::move(out), position), tag, false};
}

Typed Scope::resolveBinary(const BinaryExpr& bin, size_t position, const ResolveOptions& opts) const {
    Typed left = resolve(bin.left, opts);
    Typed right = resolve(bin.right, opts);
    ExprPtr out = makeExpr(BinaryExpr{bin.op, left.expr, right.expr}, position);

    auto mismatch = [&](const std::string& msg) {
        return StatusError(Status::TypeError(position, msg));
    };

    if (bin.op == BinaryOp::And || bin.op == BinaryOp::Or) {
        for (const Typed* side : {&left, &right}) {
            if (side->tag != TypeTag::Boolean && side->tag != TypeTag::Unknown && side->tag != TypeTag::Null) {
                throw mismatch(std::string(binaryOpSymbol(bin.op)) + " expects boolean operands, got " +
                               typeTagName(side->tag));
            }
        }
        return {out, TypeTag::Boolean, false};
    }

    if (left.tag == TypeTag::Relation || right.tag == TypeTag::Relation) {
        if (bin.op != BinaryOp::Contains) {
            throw mismatch(std::string("relation attributes cannot be used with '") + binaryOpSymbol(bin.op) +
                           "'; use NAVIGATE");
        }
    }

    if (isArithmetic(bin.op)) {
        bool concat = bin.op == BinaryOp::Add && left.tag == TypeTag::String && right.tag == TypeTag::String;
        if (!concat) {
            for (const Typed* side : {&left, &right}) {
                if (side->tag != TypeTag::Number && side->tag != TypeTag::Unknown && side->tag != TypeTag::Null) {
                    throw mismatch(std::string("'") + binaryOpSymbol(bin.op) + "' expects numbers, got " +
                                   typeTagName(side->tag));
                }
            }
        }
        return {out, concat ? TypeTag::String : TypeTag::Number, false};
    }

    if (bin.op == BinaryOp::In) {
        if (right.tag != TypeTag::List && right.tag != TypeTag::Unknown && right.tag != TypeTag::String) {
            throw mismatch(std::string("IN expects a list, got ") + typeTagName(right.tag));
        }
        if (auto* list = std::get_if<ListExpr>(&bin.right->node)) {
            for (const auto& item : list->items) {
                Typed t = resolve(item, opts);
                if (!comparable(left, t)) {
                    throw mismatch(std::string("IN list element of type ") + typeTagName(t.tag) +
                                   " does not match " + typeTagName(left.tag));
                }
            }
        }
        return {out, TypeTag::Boolean, false};
    }

    if (bin.op == BinaryOp::Contains) {
        if (left.tag != TypeTag::String && left.tag != TypeTag::List && left.tag != TypeTag::Object &&
            left.tag != TypeTag::Unknown && left.tag != TypeTag::Relation) {
            throw mismatch(std::string("CONTAINS expects a string, list or document, got ") + typeTagName(left.tag));
        }
        return {out, TypeTag::Boolean, false};
    }

    // comparison
    if (!comparable(left, right)) {
        throw mismatch(std::string("cannot compare ") + typeTagName(left.tag) + " with " + typeTagName(right.tag));
    }
    if (bin.op != BinaryOp::Eq && bin.op != BinaryOp::Neq) {
        for (const Typed* side : {&left, &right}) {
            if (side->tag == TypeTag::List || side->tag == TypeTag::Object || side->tag == TypeTag::Boolean) {
                throw mismatch(std::string("'") + binaryOpSymbol(bin.op) + "' is not defined for " +
                               typeTagName(side->tag));
            }
        }
    }
    return {out, TypeTag::Boolean, false};
}

Typed Scope::resolveCall(const FunctionCall& call, size_t position, const ResolveOptions& opts) const {
    if (!isAggregateFunction(call.name)) {
        throw StatusError(Status::TypeError(position, "unknown function " + call.name));
    }
    if (!opts.allow_aggregates) {
        throw StatusError(Status::TypeError(position,
            std::string("aggregate ") + call.name + " is not allowed in " + opts.clause));
    }
    if (opts.in_aggregate) {
        throw StatusError(Status::TypeError(position, "aggregate functions cannot be nested"));
    }

    bool is_count = call.name == "COUNT";
    if (call.star ? !is_count || !call.args.empty() : call.args.size() != 1) {
        throw StatusError(Status::TypeError(position, call.name + " expects exactly one argument"));
    }

    FunctionCall out{call.name, {}, call.star};
    TypeTag result = TypeTag::Number;
    if (!call.star) {
        ResolveOptions inner = opts;
        inner.in_aggregate = true;
        inner.in_count = is_count;
        Typed arg = resolve(call.args[0], inner);
        if ((call.name == "SUM" || call.name == "AVG") &&
            arg.tag != TypeTag::Number && arg.tag != TypeTag::Unknown) {
            throw StatusError(Status::TypeError(position,
                call.name + " expects a numeric argument, got " + typeTagName(arg.tag)));
        }
        if ((call.name == "MIN" || call.name == "MAX")) {
            if (arg.tag == TypeTag::Relation || arg.tag == TypeTag::Object || arg.tag == TypeTag::List) {
                throw StatusError(Status::TypeError(position,
                    call.name + " is not defined for " + typeTagName(arg.tag)));
            }
            result = arg.tag;
        }
        out.args.push_back(arg.expr);
    }
    return {makeExpr(std::move(out), position), result, false};
}

void collectAggregates(const ExprPtr& expr, std::vector<ExprPtr>& out, std::set<std::string>& seen) {
    if (!expr) return;
    if (auto* call = std::get_if<FunctionCall>(&expr->node)) {
        if (isAggregateFunction(call->name)) {
            if (seen.insert(exprToString(expr)).second) out.push_back(expr);
            return;
        }
    }
    if (auto* bin = std::get_if<BinaryExpr>(&expr->node)) {
        collectAggregates(bin->left, out, seen);
        collectAggregates(bin->right, out, seen);
    } else if (auto* un = std::get_if<UnaryExpr>(&expr->node)) {
        collectAggregates(un->operand, out, seen);
    } else if (auto* list = std::get_if<ListExpr>(&expr->node)) {
        for (const auto& item : list->items) collectAggregates(item, out, seen);
    }
}

/// Attribute references outside aggregate calls must be grouping keys
void checkGrouped(const ExprPtr& expr, const std::set<std::string>& group_keys) {
    if (!expr) return;
    if (auto* call = std::get_if<FunctionCall>(&expr->node)) {
        if (isAggregateFunction(call->name)) return;
    }
    if (auto* ref = std::get_if<AttributeRef>(&expr->node)) {
        if (ref->resolved && !group_keys.count(attributeKey(*ref->resolved))) {
            throw StatusError(Status::TypeError(expr->position,
                "'" + exprToString(expr) + "' must appear in GROUP BY or inside an aggregate"));
        }
        return;
    }
    if (auto* bin = std::get_if<BinaryExpr>(&expr->node)) {
        checkGrouped(bin->left, group_keys);
        checkGrouped(bin->right, group_keys);
    } else if (auto* un = std::get_if<UnaryExpr>(&expr->node)) {
        checkGrouped(un->operand, group_keys);
    } else if (auto* list = std::get_if<ListExpr>(&expr->node)) {
        for (const auto& item : list->items) checkGrouped(item, group_keys);
    }
}

void requireConstant(const ExprPtr& expr, const std::string& what) {
    forEachAttribute(expr, [&](const AttributeRef&, size_t position) {
        throw StatusError(Status::TypeError(position, what + " must be a constant expression"));
    });
    if (containsAggregate(expr)) {
        throw StatusError(Status::TypeError(expr->position, what + " must be a constant expression"));
    }
}

bool isSampleValue(const json& v) {
    return v.is_number() || (v.is_object() && v.contains("value") && v["value"].is_number());
}

/// Checks a constant write value against the attribute definition
void checkWriteValue(const json& value, const std::string& record, const std::string& attribute,
                     const AttributeDefinition& def, size_t position) {
    if (value.is_null()) return;

    auto reject = [&](const std::string& expected) {
        throw StatusError(Status::TypeError(position,
            "value for " + record + "." + attribute + " must be " + expected + ", got " + value.dump()));
    };

    switch (def.type) {
        case StorageClass::Relation:
            if (value.is_string()) return;
            if (value.is_array() && std::all_of(value.begin(), value.end(),
                                                [](const json& v) { return v.is_string() || v.is_number_integer(); })) {
                return;
            }
            reject("a target key or a list of target keys");
            return;
        case StorageClass::Metric:
            if (isSampleValue(value)) return;
            if (value.is_array() && std::all_of(value.begin(), value.end(), isSampleValue)) return;
            reject("a number, a {time, value} sample or a list of samples");
            return;
        case StorageClass::Document:
            return;
        case StorageClass::Scalar:
            break;
    }

    switch (def.valueType()) {
        case ValueType::String:
            if (!value.is_string()) reject("a string");
            return;
        case ValueType::Integer:
            if (!value.is_number_integer()) reject("an integer");
            return;
        case ValueType::Number:
            if (value.is_number()) return;
            if (value.is_string()) {
                json normalized = normalizeValue(value, def);
                if (normalized.is_number()) return;
            }
            reject("a number");
            return;
        case ValueType::Boolean:
            if (!value.is_boolean()) reject("a boolean");
            return;
        case ValueType::DateTime:
            if (!value.is_string() || !looksLikeDateTime(value.get<std::string>())) reject("an ISO date-time");
            return;
        case ValueType::Any:
            return;
    }
}

AttributeDefinition definitionOf(const AttributeDecl& decl) {
    AttributeDefinition def;
    def.type = decl.type;
    def.indexed = decl.indexed;
    def.primary_key = decl.primary_key;
    if (!decl.hint.empty()) {
        switch (decl.type) {
            case StorageClass::Relation: def.target = decl.hint; break;
            case StorageClass::Metric: def.unit = decl.hint; break;
            default: def.datatype = decl.hint; break;
        }
    }
    return def;
}

} // namespace

std::string attributeKey(const ResolvedAttribute& attr) {
    std::string key = attr.binding;
    if (!attr.attribute.empty()) key += "." + attr.attribute;
    for (const auto& p : attr.sub_path) key += "." + p;
    return key;
}

const Binding* AnalyzedFind::binding(const std::string& name) const {
    for (const auto& b : bindings) {
        if (b.name == name) return &b;
    }
    return nullptr;
}

// ============================================================================
// Entry point
// ============================================================================

std::pair<Status, AnalyzedStatementPtr> SemanticAnalyzer::analyze(const std::string& bucket,
                                                                  const Statement& stmt) const {
    try {
        if (!registry_.hasBucket(bucket)) {
            return {Status::SchemaError("", "", "unknown bucket '" + bucket + "'"), nullptr};
        }
        return {Status::OK(), analyzeStatement(bucket, stmt)};
    } catch (const StatusError& e) {
        return {e.status(), nullptr};
    }
}

AnalyzedStatementPtr SemanticAnalyzer::analyzeStatement(const std::string& bucket, const Statement& stmt) const {
    auto out = std::make_shared<AnalyzedStatement>();

    std::visit([&](const auto& node) {
        using T = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<T, FindStatement>) {
            out->node = analyzeFind(bucket, node);
        } else if constexpr (std::is_same_v<T, NavigateStatement>) {
            // NAVIGATE p == FIND <last target>.* NAVIGATE p
            FindStatement find;
            find.from = node.path.source;
            find.from_position = node.path.position;
            find.navigations.push_back(node.path);
            find.match = node.match;
            find.order_by = node.order_by;
            find.limit = node.limit;
            find.offset = node.offset;

            std::string target = node.path.hops.back().alias;
            if (target.empty()) {
                // default binding name of the last hop is its target record
                auto schema = requireRecord(bucket, node.path.source);
                for (const auto& hop : node.path.hops) {
                    const AttributeDefinition* def = schema->find(hop.attribute);
                    if (!def || def->type != StorageClass::Relation || !def->target) {
                        throw StatusError(Status::SchemaError(schema->name(), hop.attribute,
                            "'" + hop.attribute + "' is not a RELATION attribute of '" + schema->name() + "'"));
                    }
                    schema = requireRecord(bucket, hop.target.empty() ? *def->target : hop.target);
                }
                target = schema->name();
            }

            Projection proj;
            proj.wildcard = true;
            proj.wildcard_binding = target;
            proj.position = stmt.position;
            find.projections.push_back(std::move(proj));
            out->node = analyzeFind(bucket, find);
        } else if constexpr (std::is_same_v<T, AddStatement>) {
            out->node = analyzeAdd(bucket, node);
        } else if constexpr (std::is_same_v<T, UpdateStatement>) {
            out->node = analyzeUpdate(bucket, node);
        } else if constexpr (std::is_same_v<T, RemoveStatement>) {
            out->node = analyzeRemove(bucket, node);
        } else if constexpr (std::is_same_v<T, CreateRecordStatement>) {
            out->node = analyzeCreateRecord(bucket, node);
        } else if constexpr (std::is_same_v<T, CreateRelationStatement>) {
            out->node = analyzeCreateRelation(bucket, node);
        } else if constexpr (std::is_same_v<T, AlterRecordStatement>) {
            out->node = analyzeAlterRecord(bucket, node);
        } else if constexpr (std::is_same_v<T, CreateIndexStatement>) {
            out->node = analyzeCreateIndex(bucket, node);
        } else if constexpr (std::is_same_v<T, TransactionStatement>) {
            AnalyzedTransaction txn;
            for (const auto& inner : node.statements) {
                txn.statements.push_back(analyzeStatement(bucket, *inner));
            }
            out->node = std::move(txn);
        } else {
            out->node = AnalyzedExplain{analyzeStatement(bucket, *node.inner)};
        }
    }, stmt.node);

    return out;
}

std::shared_ptr<const RecordSchema> SemanticAnalyzer::requireRecord(const std::string& bucket,
                                                                    const std::string& record) const {
    auto schema = registry_.getRecord(bucket, record);
    if (!schema) {
        throw StatusError(Status::SchemaError(record, "", "unknown record '" + record + "' in bucket '" + bucket + "'"));
    }
    return schema;
}

// ============================================================================
// FIND
// ============================================================================

AnalyzedFind SemanticAnalyzer::analyzeFind(const std::string& bucket, const FindStatement& find) const {
    AnalyzedFind out;
    out.bucket = bucket;

    // primary record: FROM, else the first NAVIGATE source, else the first reference in the projection list
    std::string primary = find.from;
    size_t primary_position = find.from_position;
    if (primary.empty() && !find.navigations.empty()) {
        primary = find.navigations.front().source;
        primary_position = find.navigations.front().position;
    }
    if (primary.empty()) {
        for (const auto& proj : find.projections) {
            if (proj.wildcard && !proj.wildcard_binding.empty()) {
                primary = proj.wildcard_binding;
                primary_position = proj.position;
                break;
            }
            bool found = false;
            forEachAttribute(proj.expr, [&](const AttributeRef& ref, size_t pos) {
                if (!found) {
                    primary = ref.path[0];
                    primary_position = pos;
                    found = true;
                }
            });
            if (found) break;
        }
    }
    if (primary.empty()) {
        throw StatusError(Status::SchemaError("", "", "cannot determine the record to query; add FROM <record>"));
    }

    out.primary = primary;
    out.bindings.push_back({primary, requireRecord(bucket, primary), primary_position});

    // bindings introduced by NAVIGATE
    for (const auto& path : find.navigations) {
        const Binding* source = out.binding(path.source);
        if (!source) {
            throw StatusError(Status::SchemaError(path.source, "",
                "NAVIGATE source '" + path.source + "' is not part of this query"));
        }
        std::string current = source->name;
        for (const auto& hop : path.hops) {
            const Binding* from = out.binding(current);
            const AttributeDefinition* def = from->schema->find(hop.attribute);
            if (!def) {
                throw StatusError(Status::SchemaError(from->schema->name(), hop.attribute,
                    "unknown attribute '" + hop.attribute + "' in record '" + from->schema->name() + "'"));
            }
            if (def->type != StorageClass::Relation) {
                throw StatusError(Status::SchemaError(from->schema->name(), hop.attribute,
                    "'" + hop.attribute + "' is not a RELATION attribute"));
            }
            std::string target_record = hop.target.empty() ? def->target.value_or("") : hop.target;
            if (def->target && !hop.target.empty() && *def->target != hop.target) {
                throw StatusError(Status::SchemaError(from->schema->name(), hop.attribute,
                    "'" + hop.attribute + "' targets '" + *def->target + "', not '" + hop.target + "'"));
            }
            auto target_schema = requireRecord(bucket, target_record);
            std::string name = hop.alias.empty() ? target_record : hop.alias;

            auto existing = std::find_if(out.navigations.begin(), out.navigations.end(),
                                         [&](const NavigationStep& s) { return s.target == name; });
            if (existing != out.navigations.end()) {
                if (existing->source != current || existing->attribute != hop.attribute) {
                    throw StatusError(Status::SchemaError(target_record, "",
                        "binding '" + name + "' is already defined; use AS to name this hop"));
                }
            } else {
                if (out.binding(name)) {
                    throw StatusError(Status::SchemaError(target_record, "",
                        "binding '" + name + "' is already defined; use AS to name this hop"));
                }
                out.bindings.push_back({name, target_schema, hop.position});
                out.navigations.push_back({current, hop.attribute, name, target_record, hop.position});
            }
            current = name;
        }
    }

    Scope scope(out, bucket, registry_);

    // GROUP BY first: projections are validated against it
    ResolveOptions group_opts;
    group_opts.clause = "GROUP BY";
    std::set<std::string> group_keys;
    for (const auto& g : find.group_by) {
        ExprPtr resolved = scope.resolve(g, group_opts).expr;
        if (auto* ref = std::get_if<AttributeRef>(&resolved->node)) {
            group_keys.insert(attributeKey(*ref->resolved));
        }
        out.group_by.push_back(resolved);
    }

    bool has_aggregates = !find.group_by.empty() || containsAggregate(find.having);
    for (const auto& proj : find.projections) {
        if (containsAggregate(proj.expr)) has_aggregates = true;
    }
    for (const auto& item : find.order_by) {
        if (containsAggregate(item.expr)) has_aggregates = true;
    }
    out.aggregate = has_aggregates;

    // projections
    ResolveOptions proj_opts;
    proj_opts.allow_aggregates = true;
    proj_opts.clause = "the projection list";
    std::set<std::string> seen_columns;
    auto addColumn = [&](OutputColumn col) {
        std::string id = col.binding + "\x1f" + col.name;
        if (seen_columns.insert(id).second) out.columns.push_back(std::move(col));
    };

    for (const auto& proj : find.projections) {
        if (proj.wildcard) {
            if (out.aggregate) {
                throw StatusError(Status::TypeError(proj.position,
                    "wildcard projections cannot be combined with GROUP BY or aggregates"));
            }
            std::vector<const Binding*> targets;
            if (proj.wildcard_binding.empty()) {
                for (const auto& b : out.bindings) targets.push_back(&b);
            } else {
                const Binding* b = out.binding(proj.wildcard_binding);
                if (!b) {
                    throw StatusError(Status::SchemaError(proj.wildcard_binding, "",
                        "'" + proj.wildcard_binding + "' is not part of this query"));
                }
                targets.push_back(b);
            }
            for (const Binding* b : targets) {
                for (const auto& [name, def] : b->schema->attributes()) {
                    if (def.type == StorageClass::Relation) continue;
                    AttributeRef ref{{b->name, name}, std::nullopt};
                    Typed t = scope.resolve(makeExpr(std::move(ref), proj.position), proj_opts);
                    addColumn({t.expr, b->name, name, def});
                }
            }
            continue;
        }

        Typed t = scope.resolve(proj.expr, proj_opts);
        OutputColumn col;
        col.expr = t.expr;
        if (!proj.alias.empty()) {
            col.name = proj.alias;
            scope.aliases.emplace_back(proj.alias, proj.expr);
        } else if (auto* ref = std::get_if<AttributeRef>(&t.expr->node); ref && !ref->resolved->isBinding()) {
            col.binding = ref->resolved->binding;
            col.name = ref->resolved->attribute;
            for (const auto& p : ref->resolved->sub_path) col.name += "." + p;
        } else {
            col.name = exprToString(t.expr);
        }
        if (auto* ref = std::get_if<AttributeRef>(&t.expr->node)) {
            if (ref->resolved && !ref->resolved->isBinding() && ref->resolved->sub_path.empty()) {
                col.definition = *out.binding(ref->resolved->binding)->schema->find(ref->resolved->attribute);
            }
        }
        if (out.aggregate) checkGrouped(col.expr, group_keys);
        addColumn(std::move(col));
    }

    // MATCH
    if (find.match) {
        ResolveOptions match_opts;
        Typed t = scope.resolve(find.match, match_opts);
        if (t.tag != TypeTag::Boolean && t.tag != TypeTag::Unknown) {
            throw StatusError(Status::TypeError(find.match->position,
                std::string("MATCH expects a boolean expression, got ") + typeTagName(t.tag)));
        }
        out.match = t.expr;
    }

    // HAVING
    if (find.having) {
        if (!out.aggregate) {
            throw StatusError(Status::TypeError(find.having->position, "HAVING requires GROUP BY or an aggregate"));
        }
        ResolveOptions having_opts;
        having_opts.allow_aggregates = true;
        having_opts.allow_aliases = true;
        having_opts.clause = "HAVING";
        Typed t = scope.resolve(find.having, having_opts);
        if (t.tag != TypeTag::Boolean && t.tag != TypeTag::Unknown) {
            throw StatusError(Status::TypeError(find.having->position, "HAVING expects a boolean expression"));
        }
        checkGrouped(t.expr, group_keys);
        out.having = t.expr;
    }

    // ORDER BY
    ResolveOptions order_opts;
    order_opts.allow_aggregates = out.aggregate;
    order_opts.allow_aliases = true;
    order_opts.clause = "ORDER BY without GROUP BY";
    for (const auto& item : find.order_by) {
        Typed t = scope.resolve(item.expr, order_opts);
        if (t.tag == TypeTag::Relation || t.tag == TypeTag::Object || t.tag == TypeTag::List) {
            throw StatusError(Status::TypeError(item.expr->position,
                std::string("cannot order by a value of type ") + typeTagName(t.tag)));
        }
        if (out.aggregate) checkGrouped(t.expr, group_keys);
        out.order_by.push_back({t.expr, item.ascending});
    }

    std::set<std::string> seen_aggregates;
    for (const auto& col : out.columns) collectAggregates(col.expr, out.aggregates, seen_aggregates);
    collectAggregates(out.having, out.aggregates, seen_aggregates);
    for (const auto& item : out.order_by) collectAggregates(item.expr, out.aggregates, seen_aggregates);

    out.limit = find.limit;
    out.offset = find.offset;
    return out;
}

// ============================================================================
// Writes
// ============================================================================

AnalyzedAdd SemanticAnalyzer::analyzeAdd(const std::string& bucket, const AddStatement& add) const {
    AnalyzedAdd out;
    out.bucket = bucket;
    out.schema = requireRecord(bucket, add.record);

    const auto& obj = std::get<ObjectExpr>(add.values->node);
    std::set<std::string> seen;
    for (const auto& [name, expr] : obj.fields) {
        const AttributeDefinition* def = out.schema->find(name);
        if (!def) {
            throw StatusError(Status::SchemaError(add.record, name,
                "unknown attribute '" + name + "' in record '" + add.record + "'"));
        }
        if (!seen.insert(name).second) {
            throw StatusError(Status::SchemaError(add.record, name, "attribute '" + name + "' assigned twice"));
        }
        requireConstant(expr, "value of " + name);
        json value = ExpressionEvaluator::evaluate(expr, json::object());
        checkWriteValue(value, add.record, name, *def, expr->position);
        if (name == out.schema->keyAttribute() && !(value.is_string() || value.is_number_integer())) {
            throw StatusError(Status::TypeError(expr->position, "key '" + name + "' must be a string or an integer"));
        }
        out.values.push_back({name, *def, std::move(value)});
    }
    return out;
}

AnalyzedFind SemanticAnalyzer::keyQuery(const std::string& bucket, const RecordSchema& schema,
                                        const ExprPtr& match, size_t position) const {
    FindStatement find;
    find.from = schema.name();
    find.from_position = position;
    Projection key;
    key.expr = makeExpr(AttributeRef{{schema.name(), schema.keyAttribute()}, std::nullopt}, position);
    key.position = position;
    find.projections.push_back(std::move(key));
    find.match = match;
    return analyzeFind(bucket, find);
}

AnalyzedUpdate SemanticAnalyzer::analyzeUpdate(const std::string& bucket, const UpdateStatement& update) const {
    AnalyzedUpdate out;
    out.bucket = bucket;
    out.schema = requireRecord(bucket, update.record);

    std::set<std::string> seen;
    for (const auto& assignment : update.assignments) {
        const AttributeDefinition* def = out.schema->find(assignment.attribute);
        if (!def) {
            throw StatusError(Status::SchemaError(update.record, assignment.attribute,
                "unknown attribute '" + assignment.attribute + "' in record '" + update.record + "'"));
        }
        if (assignment.attribute == out.schema->keyAttribute()) {
            throw StatusError(Status::SchemaError(update.record, assignment.attribute,
                "the key attribute cannot be updated"));
        }
        if (!seen.insert(assignment.attribute).second) {
            throw StatusError(Status::SchemaError(update.record, assignment.attribute,
                "attribute '" + assignment.attribute + "' assigned twice"));
        }
        requireConstant(assignment.value, "value of " + assignment.attribute);
        json value = ExpressionEvaluator::evaluate(assignment.value, json::object());
        checkWriteValue(value, update.record, assignment.attribute, *def, assignment.value->position);
        out.assignments.push_back({assignment.attribute, *def, std::move(value)});
    }

    out.keys = keyQuery(bucket, *out.schema, update.match, update.record_position);
    return out;
}

AnalyzedRemove SemanticAnalyzer::analyzeRemove(const std::string& bucket, const RemoveStatement& remove) const {
    AnalyzedRemove out;
    out.bucket = bucket;
    out.schema = requireRecord(bucket, remove.record);
    out.keys = keyQuery(bucket, *out.schema, remove.match, remove.record_position);
    return out;
}

// ============================================================================
// DDL
// ============================================================================

AnalyzedCreateRecord SemanticAnalyzer::analyzeCreateRecord(const std::string& bucket,
                                                           const CreateRecordStatement& create) const {
    AnalyzedCreateRecord out;
    out.bucket = bucket;
    out.spec.record = create.record;

    for (const auto& decl : create.attributes) {
        out.spec.attributes.emplace_back(decl.name, definitionOf(decl));
    }
    return out;
}

AnalyzedCreateRelation SemanticAnalyzer::analyzeCreateRelation(const std::string& bucket,
                                                               const CreateRelationStatement& create) const {
    requireRecord(bucket, create.from);
    requireRecord(bucket, create.to);

    AnalyzedCreateRelation out;
    out.bucket = bucket;
    out.record = create.from;
    out.attribute = create.name;
    out.definition.type = StorageClass::Relation;
    out.definition.target = create.to;
    return out;
}

AnalyzedAlterRecord SemanticAnalyzer::analyzeAlterRecord(const std::string& bucket,
                                                         const AlterRecordStatement& alter) const {
    auto schema = requireRecord(bucket, alter.record);

    AnalyzedAlterRecord out;
    out.bucket = bucket;
    out.record = alter.record;
    for (const auto& decl : alter.additions) {
        if (schema->has(decl.name)) {
            throw StatusError(Status::SchemaError(alter.record, decl.name,
                                                  "attribute '" + decl.name + "' already exists"));
        }
        out.additions.emplace_back(decl.name, definitionOf(decl));
    }
    return out;
}

AnalyzedCreateIndex SemanticAnalyzer::analyzeCreateIndex(const std::string& bucket,
                                                         const CreateIndexStatement& create) const {
    auto schema = requireRecord(bucket, create.record);
    for (const auto& attribute : create.attributes) {
        if (!schema->has(attribute)) {
            throw StatusError(Status::SchemaError(create.record, attribute,
                                                  "unknown attribute '" + attribute + "' in record '" +
                                                  create.record + "'"));
        }
    }
    return AnalyzedCreateIndex{bucket, create.record, create.attributes};
}

} // namespace query
} // namespace quanta
