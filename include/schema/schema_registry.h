#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "schema/record_schema.h"
#include "utils/status.h"

namespace quanta {

/**
 * Process-wide catalog: bucket name -> record name -> RecordSchema.
 *
 * Reads take no lock: they load an immutable snapshot through std::atomic_load.
 * Writes are serialized per bucket (bucket creation/removal by a registry-wide mutex),
 * copy the affected map and publish the copy with std::atomic_store.
 * A bucket's schemas live exactly as long as the bucket.
 */
class SchemaRegistry {
public:
    /// Invoked under the bucket's writer lock before a schema change is published.
    /// A non-OK status aborts the change.
    using ProvisionFn = std::function<Status(const RecordSchema&)>;

    SchemaRegistry();

    Status createBucket(const std::string& name);
    Status dropBucket(const std::string& name);

    bool hasBucket(const std::string& name) const;
    std::optional<BucketInfo> getBucket(const std::string& name) const;
    std::vector<std::string> listBuckets() const;

    /// nullptr if bucket or record is unknown
    std::shared_ptr<const RecordSchema> getRecord(const std::string& bucket, const std::string& record) const;

    /// Registers a new record schema. Fails if the bucket is unknown or the record exists.
    Status registerRecord(const std::string& bucket, RecordSchema schema, const ProvisionFn& provision = {});

    /// Additive schema evolution: appends one attribute to an existing record
    Status addAttribute(const std::string& bucket, const std::string& record,
                        const std::string& attribute, const AttributeDefinition& def,
                        const ProvisionFn& provision = {});

    /// Appends several attributes as one change; provision sees only the new ones
    Status addAttributes(const std::string& bucket, const std::string& record,
                         const std::vector<RecordSchema::Attribute>& additions,
                         const ProvisionFn& provision = {});

    /// Marks existing attributes indexed. provision sees the ones not indexed before.
    Status setIndexed(const std::string& bucket, const std::string& record,
                      const std::vector<std::string>& attributes, const ProvisionFn& provision = {});

private:
    using RecordMap = std::map<std::string, std::shared_ptr<const RecordSchema>>;

    struct BucketState {
        explicit BucketState(std::string n)
            : name(std::move(n)), records(std::make_shared<const RecordMap>()) {}
        std::string name;
        std::mutex writer;
        std::shared_ptr<const RecordMap> records;
    };

    using BucketMap = std::map<std::string, std::shared_ptr<BucketState>>;

    std::shared_ptr<BucketState> findBucket(const std::string& name) const;

    std::shared_ptr<const BucketMap> buckets_;
    std::mutex buckets_writer_;
};

} // namespace quanta
