#pragma once

#include <array>
#include <memory>
#include <vector>

#include "engine/native_query.h"
#include "query/physical_plan.h"

namespace quanta {
namespace query {

/**
 * Turns plan fragments into one backend's native dialect.
 *
 * Translators are stateless: the same fragment always yields the same query text and
 * parameters. A predicate is only ever placed into a fragment after canPushDown()
 * accepted it, so translate() renders every predicate it is given.
 */
class EngineTranslator {
public:
    virtual ~EngineTranslator() = default;

    virtual StorageClass storageClass() const = 0;
    virtual const char* dialect() const = 0;

    /// True if the predicate can be expressed natively (it reads only this engine's attributes)
    virtual bool canPushDown(const ExprPtr& predicate) const = 0;
    virtual bool canPushOrder(const std::vector<OrderItem>& order_by) const = 0;

    virtual NativeQuery translate(const Fragment& fragment) const = 0;
    virtual NativeQuery translateWrite(const WriteFragment& fragment) const = 0;

protected:
    /// Structured part of a NativeQuery shared by all dialects
    static NativeQuery describe(const Fragment& fragment, ResultShape shape);
    static NativeQuery describe(const WriteFragment& fragment);
};

/// Dispatch table from storage class to translator
class TranslatorSet {
public:
    /// The four built-in dialects: SQL, document filter JSON, Cypher, Flux
    TranslatorSet();

    const EngineTranslator& get(StorageClass cls) const {
        return *translators_[static_cast<size_t>(cls)];
    }

    void set(StorageClass cls, std::unique_ptr<EngineTranslator> translator) {
        translators_[static_cast<size_t>(cls)] = std::move(translator);
    }

private:
    std::array<std::unique_ptr<EngineTranslator>, kStorageClassCount> translators_;
};

} // namespace query
} // namespace quanta
