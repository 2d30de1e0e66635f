#include "query/engine_translator.h"
#include "query/document_translator.h"
#include "query/metric_translator.h"
#include "query/relation_translator.h"
#include "query/scalar_translator.h"

namespace quanta {
namespace query {

NativeQuery EngineTranslator::describe(const Fragment& fragment, ResultShape shape) {
    NativeQuery q;
    q.engine = fragment.engine;
    q.operation = fragment.kind == FragmentKind::Traverse ? NativeOperation::Traverse : NativeOperation::Select;
    q.shape = shape;
    q.bucket = fragment.bucket;
    q.record = fragment.record;
    q.binding = fragment.binding;
    q.key_column = fragment.key_attribute;
    q.attributes = fragment.attributes;
    q.predicates = fragment.predicates;
    q.relation_attribute = fragment.relation_attribute;
    q.order_by = fragment.order_by;

    if (fragment.kind == FragmentKind::Traverse) {
        q.columns = {"source", "target"};
    } else {
        q.columns.push_back(fragment.key_attribute);
        q.columns.insert(q.columns.end(), fragment.attributes.begin(), fragment.attributes.end());
    }
    return q;
}

NativeQuery EngineTranslator::describe(const WriteFragment& fragment) {
    NativeQuery q;
    q.engine = fragment.engine;
    q.operation = fragment.operation;
    q.bucket = fragment.bucket;
    q.record = fragment.record;
    q.binding = fragment.record;
    q.key_column = fragment.key_attribute;
    q.values = fragment.values;
    for (auto it = fragment.values.begin(); it != fragment.values.end(); ++it) {
        if (it.key() != fragment.key_attribute) q.attributes.push_back(it.key());
    }
    if (fragment.operation != NativeOperation::Insert) {
        q.keys = fragment.keys;
    }
    return q;
}

TranslatorSet::TranslatorSet() {
    set(StorageClass::Scalar, std::make_unique<ScalarTranslator>());
    set(StorageClass::Document, std::make_unique<DocumentTranslator>());
    set(StorageClass::Relation, std::make_unique<RelationTranslator>());
    set(StorageClass::Metric, std::make_unique<MetricTranslator>());
}

} // namespace query
} // namespace quanta
