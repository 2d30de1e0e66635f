#include "query/document_translator.h"

namespace quanta {
namespace query {

namespace {

using json = nlohmann::json;

std::string fieldPath(const ResolvedAttribute& attr) {
    std::string path = attr.attribute;
    for (const auto& p : attr.sub_path) path += "." + p;
    return path;
}

const char* mongoOperator(BinaryOp op) {
    switch (op) {
        case BinaryOp::Eq: return "$eq";
        case BinaryOp::Neq: return "$ne";
        case BinaryOp::Lt: return "$lt";
        case BinaryOp::Lte: return "$lte";
        case BinaryOp::Gt: return "$gt";
        case BinaryOp::Gte: return "$gte";
        case BinaryOp::In: return "$in";
        default: return nullptr;
    }
}

// a < b  <=>  b > a
BinaryOp mirror(BinaryOp op) {
    switch (op) {
        case BinaryOp::Lt: return BinaryOp::Gt;
        case BinaryOp::Lte: return BinaryOp::Gte;
        case BinaryOp::Gt: return BinaryOp::Lt;
        case BinaryOp::Gte: return BinaryOp::Lte;
        default: return op;
    }
}

const ResolvedAttribute* documentAttribute(const ExprPtr& expr) {
    auto* ref = std::get_if<AttributeRef>(&expr->node);
    if (!ref || !ref->resolved || ref->resolved->isBinding()) return nullptr;
    if (ref->resolved->storage != StorageClass::Document) return nullptr;
    return &*ref->resolved;
}

bool isLiteralOrList(const ExprPtr& expr) {
    if (std::holds_alternative<Literal>(expr->node)) return true;
    if (auto* list = std::get_if<ListExpr>(&expr->node)) {
        for (const auto& item : list->items) {
            if (!std::holds_alternative<Literal>(item->node)) return false;
        }
        return true;
    }
    return false;
}

json constantValue(const ExprPtr& expr) {
    if (auto* lit = std::get_if<Literal>(&expr->node)) return lit->value;
    json values = json::array();
    for (const auto& item : std::get<ListExpr>(expr->node).items) {
        values.push_back(std::get<Literal>(item->node).value);
    }
    return values;
}

bool pushable(const ExprPtr& expr) {
    if (auto* un = std::get_if<UnaryExpr>(&expr->node)) {
        return un->op == UnaryOp::Not && pushable(un->operand);
    }
    auto* bin = std::get_if<BinaryExpr>(&expr->node);
    if (!bin) return false;
    if (bin->op == BinaryOp::And || bin->op == BinaryOp::Or) {
        return pushable(bin->left) && pushable(bin->right);
    }
    if (!mongoOperator(bin->op)) return false;
    if (bin->op == BinaryOp::In) {
        return documentAttribute(bin->left) && std::holds_alternative<ListExpr>(bin->right->node) &&
               isLiteralOrList(bin->right);
    }
    return (documentAttribute(bin->left) && std::holds_alternative<Literal>(bin->right->node)) ||
           (documentAttribute(bin->right) && std::holds_alternative<Literal>(bin->left->node));
}

class FilterWriter {
public:
    explicit FilterWriter(json& params) : params_(params) {}

    json param(json value) {
        params_.push_back(std::move(value));
        return {{"$param", params_.size() - 1}};
    }

    json render(const ExprPtr& expr) {
        if (auto* un = std::get_if<UnaryExpr>(&expr->node)) {
            return {{"$nor", json::array({render(un->operand)})}};
        }
        const auto& bin = std::get<BinaryExpr>(expr->node);
        if (bin.op == BinaryOp::And || bin.op == BinaryOp::Or) {
            return {{bin.op == BinaryOp::And ? "$and" : "$or", json::array({render(bin.left), render(bin.right)})}};
        }

        const ResolvedAttribute* attr = documentAttribute(bin.left);
        ExprPtr value = bin.right;
        BinaryOp op = bin.op;
        if (!attr) {
            attr = documentAttribute(bin.right);
            value = bin.left;
            op = mirror(op);
        }
        return {{fieldPath(*attr), {{mongoOperator(op), param(constantValue(value))}}}};
    }

private:
    json& params_;
};

json commandHeader(const char* command, const std::string& record, const std::string& bucket) {
    json cmd = json::object();
    cmd[command] = record;
    cmd["$db"] = bucket;
    return cmd;
}

} // namespace

bool DocumentTranslator::canPushDown(const ExprPtr& predicate) const {
    return predicate && pushable(predicate);
}

bool DocumentTranslator::canPushOrder(const std::vector<OrderItem>& order_by) const {
    for (const auto& item : order_by) {
        if (!documentAttribute(item.expr)) return false;
    }
    return true;
}

NativeQuery DocumentTranslator::translate(const Fragment& fragment) const {
    NativeQuery q = describe(fragment, ResultShape::Documents);
    FilterWriter writer(q.params);

    json cmd = commandHeader("find", fragment.record, fragment.bucket);

    json conditions = json::array();
    for (const auto& pred : fragment.predicates) {
        conditions.push_back(writer.render(pred));
    }
    if (!fragment.key_inputs.empty()) {
        q.key_param = q.params.size();
        conditions.push_back({{fragment.key_attribute, {{"$in", writer.param(json::array())}}}});
    }
    if (conditions.empty()) {
        cmd["filter"] = json::object();
    } else if (conditions.size() == 1) {
        cmd["filter"] = conditions[0];
    } else {
        cmd["filter"] = {{"$and", conditions}};
    }

    json projection = json::object();
    projection[fragment.key_attribute] = 1;
    for (const auto& attr : fragment.attributes) projection[attr] = 1;
    cmd["projection"] = projection;

    if (!fragment.order_by.empty()) {
        json sort = json::array();
        for (const auto& item : fragment.order_by) {
            sort.push_back({fieldPath(*documentAttribute(item.expr)), item.ascending ? 1 : -1});
        }
        cmd["sort"] = sort;
    }

    q.text = cmd.dump();
    return q;
}

NativeQuery DocumentTranslator::translateWrite(const WriteFragment& fragment) const {
    NativeQuery q = describe(fragment);
    q.shape = ResultShape::Documents;
    FilterWriter writer(q.params);
    json cmd;

    switch (fragment.operation) {
        case NativeOperation::Insert:
            cmd = commandHeader("insert", fragment.record, fragment.bucket);
            cmd["documents"] = json::array({writer.param(fragment.values)});
            break;
        case NativeOperation::Update: {
            cmd = commandHeader("update", fragment.record, fragment.bucket);
            json set = writer.param(fragment.values);
            q.key_param = q.params.size();
            json match = {{fragment.key_attribute, {{"$in", writer.param(fragment.keys)}}}};
            cmd["updates"] = json::array({{{"q", match}, {"u", {{"$set", set}}}, {"multi", true}, {"upsert", true}}});
            break;
        }
        default: {
            cmd = commandHeader("delete", fragment.record, fragment.bucket);
            q.key_param = q.params.size();
            json match = {{fragment.key_attribute, {{"$in", writer.param(fragment.keys)}}}};
            cmd["deletes"] = json::array({{{"q", match}, {"limit", 0}}});
            break;
        }
    }
    q.text = cmd.dump();
    return q;
}

} // namespace query
} // namespace quanta
