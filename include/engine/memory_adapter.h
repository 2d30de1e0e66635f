#pragma once

#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "engine/engine_adapter.h"

namespace quanta {

/**
 * @brief In-process adapter keeping rows per bucket/record in memory
 *
 * Evaluates the structured part of a NativeQuery (predicates, key set, ordering)
 * instead of parsing its dialect text. Writes made inside a sub-transaction are
 * buffered and applied on commit; reads through that sub-transaction see them,
 * other readers see committed rows only. No persistence, no indexing.
 * Metric samples written without a time are stamped with the write time.
 *
 * Row layout per storage class:
 *   scalar/document  {key: k, attr: value, ...}
 *   relation         {key: k, attr: [target keys]}
 *   metric           {key: k, attr: [{"time", "value"}, ...]}
 */
class MemoryAdapter : public EngineAdapter {
public:
    MemoryAdapter(std::string name, StorageClass cls) : name_(std::move(name)), class_(cls) {}

    std::string name() const override { return name_; }
    StorageClass storageClass() const override { return class_; }

    void initBucket(const std::string& bucket) override;
    void dropBucket(const std::string& bucket) override;
    void provision(const std::string& bucket, const std::string& record,
                   const std::string& attribute, const AttributeDefinition& def) override;

    std::unique_ptr<SubTransaction> beginTransaction() override;
    void prepareCommit(SubTransaction& txn) override;
    void commit(SubTransaction& txn) override;
    void rollback(SubTransaction& txn) override;

    std::vector<nlohmann::json> select(const std::string& bucket, const std::string& record,
                                       const NativeQuery& query, SubTransaction* txn) override;
    void insert(const std::string& bucket, const std::string& record,
                const NativeQuery& query, SubTransaction* txn) override;
    size_t update(const std::string& bucket, const std::string& record,
                  const NativeQuery& query, SubTransaction* txn) override;
    size_t remove(const std::string& bucket, const std::string& record,
                  const NativeQuery& query, SubTransaction* txn) override;

    /// Provisioned attributes of a record, in provisioning order
    std::vector<std::string> provisioned(const std::string& bucket, const std::string& record) const;

    /// Number of stored rows of a record
    size_t rowCount(const std::string& bucket, const std::string& record) const;

private:
    using Rows = std::map<std::string, nlohmann::json>;      // key.dump() -> row

    struct RecordData {
        std::vector<std::string> attributes;
        Rows rows;
    };
    using BucketData = std::map<std::string, RecordData>;

    struct PendingWrite {
        NativeOperation operation;
        std::string bucket;
        std::string record;
        NativeQuery query;
    };

    class MemorySubTransaction;

    std::string name_;
    StorageClass class_;

    mutable std::mutex mu_;
    std::map<std::string, BucketData> buckets_;
    std::atomic<uint64_t> next_txn_{1};

    RecordData& recordData(const std::string& bucket, const std::string& record);
    size_t apply(const PendingWrite& write);
    size_t applyTo(Rows& rows, const PendingWrite& write);
    // Committed rows of a record overlaid with the sub-transaction's buffered writes
    Rows visibleRows(const std::string& bucket, const std::string& record, SubTransaction* txn);
    size_t countExisting(const PendingWrite& write, SubTransaction* txn);
    NativeQuery stamped(const NativeQuery& query) const;
    void applyValues(nlohmann::json& row, const nlohmann::json& values, const std::string& key_column, bool append);
};

} // namespace quanta
