#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "engine/adapter_registry.h"
#include "schema/schema_registry.h"
#include "utils/status.h"

namespace quanta {

/**
 * Schema management: the registry plus backend provisioning.
 *
 * createRecord validates the definition, then registers it while every attribute is
 * provisioned on the adapter owning its storage class, exactly once each. If any
 * provisioning call throws, nothing is registered and EngineError is returned.
 */
class SchemaManager {
public:
    SchemaManager(SchemaRegistry& registry, const AdapterRegistry& adapters)
        : registry_(registry), adapters_(adapters) {}

    /// Registers the bucket and calls initBucket on every adapter
    std::pair<Status, BucketInfo> createBucket(const std::string& name);
    Status dropBucket(const std::string& name);

    std::pair<Status, std::shared_ptr<const RecordSchema>> createRecord(const std::string& bucket,
                                                                        const RecordSpec& spec);

    /// Additive evolution (CREATE RELATION): one new attribute on an existing record
    Status addAttribute(const std::string& bucket, const std::string& record,
                        const std::string& attribute, const AttributeDefinition& def);

    /// ALTER RECORD ... ADD: all attributes are added or none
    Status addAttributes(const std::string& bucket, const std::string& record,
                         const std::vector<RecordSchema::Attribute>& additions);

    /// CREATE INDEX ON record(attributes)
    Status createIndex(const std::string& bucket, const std::string& record,
                       const std::vector<std::string>& attributes);

    std::optional<BucketInfo> getBucket(const std::string& name) const { return registry_.getBucket(name); }
    std::vector<std::string> listBuckets() const { return registry_.listBuckets(); }
    std::shared_ptr<const RecordSchema> getRecord(const std::string& bucket, const std::string& record) const {
        return registry_.getRecord(bucket, record);
    }

    const SchemaRegistry& registry() const { return registry_; }

private:
    SchemaRegistry& registry_;
    const AdapterRegistry& adapters_;

    Status provision(const std::string& bucket, const RecordSchema& schema) const;
    Status checkRelationTarget(const std::string& bucket, const std::string& record,
                               const std::string& attribute, const AttributeDefinition& def) const;
};

} // namespace quanta
