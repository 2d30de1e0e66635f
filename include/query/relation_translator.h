#pragma once

#include "query/engine_translator.h"

namespace quanta {
namespace query {

/// Cypher for the graph engine. Record keys are stored in the node property `key`,
/// relation attributes are edge types.
class RelationTranslator : public EngineTranslator {
public:
    StorageClass storageClass() const override { return StorageClass::Relation; }
    const char* dialect() const override { return "cypher"; }

    // Relation attributes are not comparable; nothing is ever pushed here
    bool canPushDown(const ExprPtr&) const override { return false; }
    bool canPushOrder(const std::vector<OrderItem>&) const override { return false; }

    NativeQuery translate(const Fragment& fragment) const override;
    NativeQuery translateWrite(const WriteFragment& fragment) const override;
};

} // namespace query
} // namespace quanta
