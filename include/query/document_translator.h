#pragma once

#include "query/engine_translator.h"

namespace quanta {
namespace query {

/// MongoDB command documents (find/insert/update/delete). Literals are referenced as
/// {"$param": n} and bound from the parameter list.
class DocumentTranslator : public EngineTranslator {
public:
    StorageClass storageClass() const override { return StorageClass::Document; }
    const char* dialect() const override { return "mongodb"; }

    bool canPushDown(const ExprPtr& predicate) const override;
    bool canPushOrder(const std::vector<OrderItem>& order_by) const override;

    NativeQuery translate(const Fragment& fragment) const override;
    NativeQuery translateWrite(const WriteFragment& fragment) const override;
};

} // namespace query
} // namespace quanta
