#include "schema/schema_manager.h"
#include "utils/logger.h"

#include <set>

namespace quanta {

std::pair<Status, BucketInfo> SchemaManager::createBucket(const std::string& name) {
    Status st = registry_.createBucket(name);
    if (!st.ok) return {st, BucketInfo{}};

    for (const auto& adapter : adapters_.all()) {
        try {
            adapter->initBucket(name);
        } catch (const std::exception& e) {
            QUANTA_ERROR("initBucket '{}' failed on {}: {}", name, adapter->name(), e.what());
            Status undo = registry_.dropBucket(name);
            if (!undo.ok) QUANTA_ERROR("Could not unregister bucket '{}': {}", name, undo.message);
            return {Status::EngineError(adapter->name(), std::string("initBucket failed: ") + e.what()), BucketInfo{}};
        }
    }
    return {Status::OK(), BucketInfo{name, {}}};
}

Status SchemaManager::dropBucket(const std::string& name) {
    Status st = registry_.dropBucket(name);
    if (!st.ok) return st;
    for (const auto& adapter : adapters_.all()) {
        try {
            adapter->dropBucket(name);
        } catch (const std::exception& e) {
            QUANTA_ERROR("dropBucket '{}' failed on {}: {}", name, adapter->name(), e.what());
            return Status::EngineError(adapter->name(), std::string("dropBucket failed: ") + e.what());
        }
    }
    return Status::OK();
}

Status SchemaManager::provision(const std::string& bucket, const RecordSchema& schema) const {
    for (const auto& [attribute, def] : schema.attributes()) {
        auto adapter = adapters_.get(def.type);
        if (!adapter) {
            return Status::EngineError(storageClassName(def.type),
                                       "no adapter installed for attribute '" + attribute + "'");
        }
        try {
            adapter->provision(bucket, schema.name(), attribute, def);
        } catch (const std::exception& e) {
            QUANTA_ERROR("Provisioning {}.{} on {} failed: {}", schema.name(), attribute, adapter->name(), e.what());
            Status st = Status::EngineError(adapter->name(), e.what());
            st.record = schema.name();
            st.attribute = attribute;
            return st;
        }
    }
    return Status::OK();
}

Status SchemaManager::checkRelationTarget(const std::string& bucket, const std::string& record,
                                          const std::string& attribute, const AttributeDefinition& def) const {
    if (def.type != StorageClass::Relation) return Status::OK();
    if (!def.target || def.target->empty()) {
        return Status::SchemaError(record, attribute, "relation attribute '" + attribute + "' needs a target record");
    }
    if (*def.target != record && !registry_.getRecord(bucket, *def.target)) {
        return Status::SchemaError(record, attribute, "relation target '" + *def.target + "' does not exist");
    }
    return Status::OK();
}

std::pair<Status, std::shared_ptr<const RecordSchema>> SchemaManager::createRecord(const std::string& bucket,
                                                                                   const RecordSpec& spec) {
    auto fail = [](Status st) { return std::make_pair(std::move(st), std::shared_ptr<const RecordSchema>()); };

    if (!registry_.hasBucket(bucket)) {
        return fail(Status::SchemaError(spec.record, "", "bucket '" + bucket + "' not found"));
    }
    if (spec.record.empty()) {
        return fail(Status::SchemaError("", "", "record name must not be empty"));
    }

    std::set<std::string> names;
    std::string key;
    for (const auto& [name, def] : spec.attributes) {
        if (!names.insert(name).second) {
            return fail(Status::SchemaError(spec.record, name, "duplicate attribute '" + name + "'"));
        }
        if (def.primary_key) {
            if (!key.empty()) {
                return fail(Status::SchemaError(spec.record, name, "more than one PRIMARY KEY"));
            }
            key = name;
        }
        Status st = checkRelationTarget(bucket, spec.record, name, def);
        if (!st.ok) return fail(st);
    }
    if (key.empty() && names.count("id")) key = "id";

    RecordSchema schema(spec.record);
    if (key.empty()) {
        key = "id";
        AttributeDefinition implicit;
        implicit.type = StorageClass::Scalar;
        implicit.datatype = "STRING";
        implicit.primary_key = true;
        schema.add(key, implicit);
    }
    for (const auto& [name, def] : spec.attributes) {
        AttributeDefinition d = def;
        if (name == key) {
            if (d.type != StorageClass::Scalar) {
                return fail(Status::SchemaError(spec.record, name,
                    "key attribute '" + name + "' must be SCALAR, not " + storageClassName(d.type)));
            }
            d.primary_key = true;
        }
        schema.add(name, d);
    }
    schema.setKeyAttribute(key);

    Status st = registry_.registerRecord(bucket, schema, [this, &bucket](const RecordSchema& s) {
        return provision(bucket, s);
    });
    if (!st.ok) return fail(st);
    return {Status::OK(), registry_.getRecord(bucket, spec.record)};
}

Status SchemaManager::addAttribute(const std::string& bucket, const std::string& record,
                                   const std::string& attribute, const AttributeDefinition& def) {
    return addAttributes(bucket, record, {{attribute, def}});
}

Status SchemaManager::addAttributes(const std::string& bucket, const std::string& record,
                                    const std::vector<RecordSchema::Attribute>& additions) {
    if (additions.empty()) {
        return Status::SchemaError(record, "", "no attributes to add");
    }
    std::set<std::string> names;
    for (const auto& [attribute, def] : additions) {
        if (!names.insert(attribute).second) {
            return Status::SchemaError(record, attribute, "duplicate attribute '" + attribute + "'");
        }
        if (def.primary_key) {
            return Status::SchemaError(record, attribute, "cannot add a key attribute to an existing record");
        }
        Status st = checkRelationTarget(bucket, record, attribute, def);
        if (!st.ok) return st;
    }
    return registry_.addAttributes(bucket, record, additions, [this, &bucket](const RecordSchema& delta) {
        return provision(bucket, delta);
    });
}

Status SchemaManager::createIndex(const std::string& bucket, const std::string& record,
                                  const std::vector<std::string>& attributes) {
    if (attributes.empty()) {
        return Status::SchemaError(record, "", "index needs at least one attribute");
    }
    return registry_.setIndexed(bucket, record, attributes, [this, &bucket](const RecordSchema& delta) {
        return provision(bucket, delta);
    });
}

} // namespace quanta
