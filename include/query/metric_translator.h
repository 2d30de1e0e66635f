#pragma once

#include "query/engine_translator.h"

namespace quanta {
namespace query {

/**
 * Flux for the time-series engine; writes use line protocol.
 *
 * One measurement per record, one field per metric attribute, the record key as tag.
 * Predicates on metrics compare the latest sample, which Flux cannot express per key
 * in a filter, so they stay client-side.
 */
class MetricTranslator : public EngineTranslator {
public:
    StorageClass storageClass() const override { return StorageClass::Metric; }
    const char* dialect() const override { return "flux"; }

    bool canPushDown(const ExprPtr&) const override { return false; }
    bool canPushOrder(const std::vector<OrderItem>&) const override { return false; }

    NativeQuery translate(const Fragment& fragment) const override;
    NativeQuery translateWrite(const WriteFragment& fragment) const override;
};

} // namespace query
} // namespace quanta
