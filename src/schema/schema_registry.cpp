#include "schema/schema_registry.h"
#include "utils/logger.h"

#include <algorithm>

namespace quanta {

SchemaRegistry::SchemaRegistry() : buckets_(std::make_shared<const BucketMap>()) {}

std::shared_ptr<SchemaRegistry::BucketState> SchemaRegistry::findBucket(const std::string& name) const {
    auto snapshot = std::atomic_load(&buckets_);
    auto it = snapshot->find(name);
    return it == snapshot->end() ? nullptr : it->second;
}

Status SchemaRegistry::createBucket(const std::string& name) {
    if (name.empty()) {
        return Status::SchemaError("", "", "bucket name must not be empty");
    }
    std::lock_guard<std::mutex> lock(buckets_writer_);
    auto current = std::atomic_load(&buckets_);
    if (current->count(name)) {
        return Status::SchemaError("", "", "bucket '" + name + "' already exists");
    }
    auto next = std::make_shared<BucketMap>(*current);
    next->emplace(name, std::make_shared<BucketState>(name));
    std::atomic_store(&buckets_, std::shared_ptr<const BucketMap>(std::move(next)));
    QUANTA_INFO("Bucket '{}' registered", name);
    return Status::OK();
}

Status SchemaRegistry::dropBucket(const std::string& name) {
    std::lock_guard<std::mutex> lock(buckets_writer_);
    auto current = std::atomic_load(&buckets_);
    auto it = current->find(name);
    if (it == current->end()) {
        return Status::SchemaError("", "", "bucket '" + name + "' not found");
    }
    // Wait for an in-flight schema change on this bucket to finish
    std::lock_guard<std::mutex> bucket_lock(it->second->writer);
    auto next = std::make_shared<BucketMap>(*current);
    next->erase(name);
    std::atomic_store(&buckets_, std::shared_ptr<const BucketMap>(std::move(next)));
    QUANTA_INFO("Bucket '{}' dropped", name);
    return Status::OK();
}

bool SchemaRegistry::hasBucket(const std::string& name) const {
    return findBucket(name) != nullptr;
}

std::optional<BucketInfo> SchemaRegistry::getBucket(const std::string& name) const {
    auto bucket = findBucket(name);
    if (!bucket) return std::nullopt;
    BucketInfo info;
    info.name = bucket->name;
    auto records = std::atomic_load(&bucket->records);
    for (const auto& [record, _] : *records) {
        info.records.push_back(record);
    }
    return info;
}

std::vector<std::string> SchemaRegistry::listBuckets() const {
    std::vector<std::string> names;
    auto snapshot = std::atomic_load(&buckets_);
    for (const auto& [name, _] : *snapshot) {
        names.push_back(name);
    }
    return names;
}

std::shared_ptr<const RecordSchema> SchemaRegistry::getRecord(const std::string& bucket,
                                                              const std::string& record) const {
    auto b = findBucket(bucket);
    if (!b) return nullptr;
    auto records = std::atomic_load(&b->records);
    auto it = records->find(record);
    return it == records->end() ? nullptr : it->second;
}

Status SchemaRegistry::registerRecord(const std::string& bucket, RecordSchema schema,
                                      const ProvisionFn& provision) {
    auto b = findBucket(bucket);
    if (!b) {
        return Status::SchemaError(schema.name(), "", "bucket '" + bucket + "' not found");
    }

    std::lock_guard<std::mutex> lock(b->writer);
    auto current = std::atomic_load(&b->records);
    if (current->count(schema.name())) {
        return Status::SchemaError(schema.name(), "",
                                   "record '" + schema.name() + "' already exists in bucket '" + bucket + "'");
    }
    if (provision) {
        auto st = provision(schema);
        if (!st.ok) return st;
    }
    auto next = std::make_shared<RecordMap>(*current);
    std::string name = schema.name();
    next->emplace(name, std::make_shared<const RecordSchema>(std::move(schema)));
    std::atomic_store(&b->records, std::shared_ptr<const RecordMap>(std::move(next)));
    QUANTA_INFO("Record '{}' registered in bucket '{}'", name, bucket);
    return Status::OK();
}

Status SchemaRegistry::addAttribute(const std::string& bucket, const std::string& record,
                                    const std::string& attribute, const AttributeDefinition& def,
                                    const ProvisionFn& provision) {
    return addAttributes(bucket, record, {{attribute, def}}, provision);
}

Status SchemaRegistry::addAttributes(const std::string& bucket, const std::string& record,
                                     const std::vector<RecordSchema::Attribute>& additions,
                                     const ProvisionFn& provision) {
    auto b = findBucket(bucket);
    if (!b) {
        return Status::SchemaError(record, "", "bucket '" + bucket + "' not found");
    }

    std::lock_guard<std::mutex> lock(b->writer);
    auto current = std::atomic_load(&b->records);
    auto it = current->find(record);
    if (it == current->end()) {
        return Status::SchemaError(record, "", "record '" + record + "' not found");
    }
    RecordSchema extended = *it->second;
    RecordSchema delta(record);
    for (const auto& [attribute, def] : additions) {
        if (!extended.add(attribute, def)) {
            return Status::SchemaError(record, attribute, "attribute '" + attribute + "' already exists");
        }
        delta.add(attribute, def);
    }
    if (provision) {
        auto st = provision(delta);
        if (!st.ok) return st;
    }
    auto next = std::make_shared<RecordMap>(*current);
    (*next)[record] = std::make_shared<const RecordSchema>(std::move(extended));
    std::atomic_store(&b->records, std::shared_ptr<const RecordMap>(std::move(next)));
    for (const auto& addition : additions) {
        QUANTA_INFO("Attribute '{}.{}' added in bucket '{}'", record, addition.first, bucket);
    }
    return Status::OK();
}

Status SchemaRegistry::setIndexed(const std::string& bucket, const std::string& record,
                                  const std::vector<std::string>& attributes, const ProvisionFn& provision) {
    auto b = findBucket(bucket);
    if (!b) {
        return Status::SchemaError(record, "", "bucket '" + bucket + "' not found");
    }

    std::lock_guard<std::mutex> lock(b->writer);
    auto current = std::atomic_load(&b->records);
    auto it = current->find(record);
    if (it == current->end()) {
        return Status::SchemaError(record, "", "record '" + record + "' not found");
    }
    for (const auto& attribute : attributes) {
        if (!it->second->has(attribute)) {
            return Status::SchemaError(record, attribute,
                                       "attribute '" + attribute + "' not found in record '" + record + "'");
        }
    }

    RecordSchema updated(record);
    RecordSchema delta(record);
    for (const auto& [attribute, def] : it->second->attributes()) {
        AttributeDefinition d = def;
        bool requested = std::find(attributes.begin(), attributes.end(), attribute) != attributes.end();
        if (requested && !d.indexed) {
            d.indexed = true;
            delta.add(attribute, d);
        }
        updated.add(attribute, d);
    }
    updated.setKeyAttribute(it->second->keyAttribute());

    if (delta.attributes().empty()) return Status::OK();
    if (provision) {
        auto st = provision(delta);
        if (!st.ok) return st;
    }
    auto next = std::make_shared<RecordMap>(*current);
    (*next)[record] = std::make_shared<const RecordSchema>(std::move(updated));
    std::atomic_store(&b->records, std::shared_ptr<const RecordMap>(std::move(next)));
    for (const auto& [attribute, _] : delta.attributes()) {
        QUANTA_INFO("Attribute '{}.{}' indexed in bucket '{}'", record, attribute, bucket);
    }
    return Status::OK();
}

} // namespace quanta
