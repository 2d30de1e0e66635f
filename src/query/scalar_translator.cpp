#include "query/scalar_translator.h"
#include <sstream>

namespace quanta {
namespace query {

namespace {

using json = nlohmann::json;

class SqlWriter {
public:
    explicit SqlWriter(json& params) : params_(params) {}

    std::string param(json value) {
        params_.push_back(std::move(value));
        return "$" + std::to_string(params_.size());
    }

    std::string render(const ExprPtr& expr) {
        if (auto* lit = std::get_if<Literal>(&expr->node)) {
            if (lit->kind == LiteralKind::Null) return "NULL";
            return param(lit->value);
        }
        if (auto* ref = std::get_if<AttributeRef>(&expr->node)) {
            return ScalarTranslator::quoteIdent(ref->resolved ? ref->resolved->attribute : ref->path.back());
        }
        if (auto* un = std::get_if<UnaryExpr>(&expr->node)) {
            if (un->op == UnaryOp::Not) return "NOT (" + render(un->operand) + ")";
            return "-(" + render(un->operand) + ")";
        }
        if (auto* list = std::get_if<ListExpr>(&expr->node)) {
            json values = json::array();
            for (const auto& item : list->items) values.push_back(std::get<Literal>(item->node).value);
            return param(std::move(values));
        }

        const auto& bin = std::get<BinaryExpr>(expr->node);
        if (bin.op == BinaryOp::In) {
            return render(bin.left) + " = ANY(" + render(bin.right) + ")";
        }
        if (bin.op == BinaryOp::Contains) {
            return render(bin.left) + " LIKE '%' || " + render(bin.right) + " || '%'";
        }
        if (isNullLiteral(bin.right) && (bin.op == BinaryOp::Eq || bin.op == BinaryOp::Neq)) {
            return render(bin.left) + (bin.op == BinaryOp::Eq ? " IS NULL" : " IS NOT NULL");
        }

        const char* op = bin.op == BinaryOp::Neq ? "<>" : binaryOpSymbol(bin.op);
        std::string left = render(bin.left);
        std::string right = render(bin.right);
        return "(" + left + " " + op + " " + right + ")";
    }

private:
    json& params_;

    static bool isNullLiteral(const ExprPtr& expr) {
        auto* lit = std::get_if<Literal>(&expr->node);
        return lit && lit->kind == LiteralKind::Null;
    }
};

bool renderable(const ExprPtr& expr) {
    if (!expr) return false;
    if (std::holds_alternative<Literal>(expr->node)) return true;
    if (auto* ref = std::get_if<AttributeRef>(&expr->node)) {
        return ref->resolved && !ref->resolved->isBinding() &&
               ref->resolved->storage == StorageClass::Scalar && ref->resolved->sub_path.empty();
    }
    if (auto* un = std::get_if<UnaryExpr>(&expr->node)) return renderable(un->operand);
    if (auto* bin = std::get_if<BinaryExpr>(&expr->node)) {
        if (bin->op == BinaryOp::In) {
            auto* list = std::get_if<ListExpr>(&bin->right->node);
            if (!list) return false;
            for (const auto& item : list->items) {
                if (!std::holds_alternative<Literal>(item->node)) return false;
            }
            return renderable(bin->left);
        }
        if (bin->op == BinaryOp::Contains) {
            auto* lit = std::get_if<Literal>(&bin->right->node);
            return lit && lit->kind == LiteralKind::String && renderable(bin->left);
        }
        return renderable(bin->left) && renderable(bin->right);
    }
    return false;
}

std::string tableName(const std::string& bucket, const std::string& record) {
    return ScalarTranslator::quoteIdent(bucket) + "." + ScalarTranslator::quoteIdent(record);
}

} // namespace

std::string ScalarTranslator::quoteIdent(const std::string& ident) {
    std::string out = "\"";
    for (char c : ident) {
        if (c == '"') out += '"';
        out += c;
    }
    return out + "\"";
}

bool ScalarTranslator::canPushDown(const ExprPtr& predicate) const {
    return renderable(predicate);
}

bool ScalarTranslator::canPushOrder(const std::vector<OrderItem>& order_by) const {
    for (const auto& item : order_by) {
        auto* ref = std::get_if<AttributeRef>(&item.expr->node);
        if (!ref || !ref->resolved || ref->resolved->storage != StorageClass::Scalar ||
            ref->resolved->isBinding()) {
            return false;
        }
    }
    return true;
}

NativeQuery ScalarTranslator::translate(const Fragment& fragment) const {
    NativeQuery q = describe(fragment, ResultShape::Rows);
    SqlWriter writer(q.params);

    std::ostringstream sql;
    sql << "SELECT ";
    for (size_t i = 0; i < q.columns.size(); ++i) {
        if (i > 0) sql << ", ";
        sql << quoteIdent(q.columns[i]);
    }
    sql << " FROM " << tableName(fragment.bucket, fragment.record);

    std::vector<std::string> conditions;
    for (const auto& pred : fragment.predicates) {
        conditions.push_back(writer.render(pred));
    }
    if (!fragment.key_inputs.empty()) {
        q.key_param = q.params.size();
        conditions.push_back(quoteIdent(fragment.key_attribute) + " = ANY(" + writer.param(json::array()) + ")");
    }
    for (size_t i = 0; i < conditions.size(); ++i) {
        sql << (i == 0 ? " WHERE " : " AND ") << conditions[i];
    }

    if (!fragment.order_by.empty()) {
        sql << " ORDER BY ";
        for (size_t i = 0; i < fragment.order_by.size(); ++i) {
            if (i > 0) sql << ", ";
            sql << writer.render(fragment.order_by[i].expr) << (fragment.order_by[i].ascending ? " ASC" : " DESC");
        }
    }

    q.text = sql.str();
    return q;
}

NativeQuery ScalarTranslator::translateWrite(const WriteFragment& fragment) const {
    NativeQuery q = describe(fragment);
    q.shape = ResultShape::Rows;
    SqlWriter writer(q.params);
    std::ostringstream sql;
    const std::string table = tableName(fragment.bucket, fragment.record);

    switch (fragment.operation) {
        case NativeOperation::Insert: {
            std::ostringstream cols, vals;
            bool first = true;
            for (auto it = fragment.values.begin(); it != fragment.values.end(); ++it) {
                if (!first) {
                    cols << ", ";
                    vals << ", ";
                }
                first = false;
                cols << quoteIdent(it.key());
                vals << writer.param(it.value());
            }
            sql << "INSERT INTO " << table << " (" << cols.str() << ") VALUES (" << vals.str() << ")";
            break;
        }
        case NativeOperation::Update: {
            sql << "UPDATE " << table << " SET ";
            bool first = true;
            for (auto it = fragment.values.begin(); it != fragment.values.end(); ++it) {
                if (!first) sql << ", ";
                first = false;
                sql << quoteIdent(it.key()) << " = " << writer.param(it.value());
            }
            q.key_param = q.params.size();
            sql << " WHERE " << quoteIdent(fragment.key_attribute) << " = ANY(" << writer.param(fragment.keys) << ")";
            break;
        }
        default: {
            q.key_param = q.params.size();
            sql << "DELETE FROM " << table << " WHERE " << quoteIdent(fragment.key_attribute)
                << " = ANY(" << writer.param(fragment.keys) << ")";
            break;
        }
    }
    q.text = sql.str();
    return q;
}

} // namespace query
} // namespace quanta
