#pragma once

#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "engine/native_query.h"
#include "schema/record_schema.h"

namespace quanta {

/**
 * @brief Handle of one backend's part of a distributed transaction
 *
 * Owned exclusively by the transaction that opened it; never shared between
 * concurrent queries.
 */
class SubTransaction {
public:
    virtual ~SubTransaction() = default;
    virtual const std::string& id() const = 0;
};

/**
 * @brief Backend Adapter Interface
 *
 * The only operations the engine invokes on external storage. One implementation
 * per storage system; the adapter registry selects it by storage class.
 *
 * Failures are reported by throwing any std::exception. The execution coordinator
 * converts them into EngineError tagged with name().
 *
 * Thread-Safety: implementations must be thread-safe. Calls for different
 * sub-transactions may arrive concurrently.
 */
class EngineAdapter {
public:
    virtual ~EngineAdapter() = default;

    /// Backend name used in errors and statistics ("postgres", "neo4j", ...)
    virtual std::string name() const = 0;
    virtual StorageClass storageClass() const = 0;

    // ===== Schema =====

    virtual void initBucket(const std::string& bucket) = 0;
    virtual void dropBucket(const std::string& bucket) = 0;

    /**
     * @brief Prepare backend storage for one attribute (table column, collection
     *        field, edge type or measurement field)
     *
     * Called again with indexed set when an index is created on an attribute that
     * is already provisioned.
     */
    virtual void provision(const std::string& bucket, const std::string& record,
                           const std::string& attribute, const AttributeDefinition& def) = 0;

    // ===== Transactions =====

    virtual std::unique_ptr<SubTransaction> beginTransaction() = 0;

    /// Throws if the backend cannot guarantee the commit
    virtual void prepareCommit(SubTransaction& txn) = 0;
    virtual void commit(SubTransaction& txn) = 0;
    virtual void rollback(SubTransaction& txn) = 0;

    // ===== Data =====

    /**
     * @brief Run a select or traverse
     * @param query Native query; its key set (if any) is already bound
     * @param txn Sub-transaction to read in, or nullptr
     * @return One JSON object per row, holding query.columns
     */
    virtual std::vector<nlohmann::json> select(const std::string& bucket, const std::string& record,
                                               const NativeQuery& query, SubTransaction* txn) = 0;

    virtual void insert(const std::string& bucket, const std::string& record,
                        const NativeQuery& query, SubTransaction* txn) = 0;

    /// @return Number of keys the update applies to
    virtual size_t update(const std::string& bucket, const std::string& record,
                          const NativeQuery& query, SubTransaction* txn) = 0;

    /// @return Number of keys removed
    virtual size_t remove(const std::string& bucket, const std::string& record,
                          const NativeQuery& query, SubTransaction* txn) = 0;

    /// Best-effort abort of in-flight calls after a timeout
    virtual void cancel() {}
};

using EngineAdapterPtr = std::shared_ptr<EngineAdapter>;

} // namespace quanta
