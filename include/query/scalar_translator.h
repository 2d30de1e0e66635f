#pragma once

#include <string>

#include "query/engine_translator.h"

namespace quanta {
namespace query {

/**
 * PostgreSQL-flavoured SQL for the scalar engine.
 *
 *   SELECT "id", "title" FROM "b"."tasks" WHERE ("status" = $1) AND ("id" = ANY($2))
 *
 * Literals are bound as positional parameters; key sets as one array parameter.
 */
class ScalarTranslator : public EngineTranslator {
public:
    StorageClass storageClass() const override { return StorageClass::Scalar; }
    const char* dialect() const override { return "sql"; }

    bool canPushDown(const ExprPtr& predicate) const override;
    bool canPushOrder(const std::vector<OrderItem>& order_by) const override;

    NativeQuery translate(const Fragment& fragment) const override;
    NativeQuery translateWrite(const WriteFragment& fragment) const override;

    static std::string quoteIdent(const std::string& ident);
};

} // namespace query
} // namespace quanta
