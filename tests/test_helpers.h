#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "engine/adapter_registry.h"
#include "engine/memory_adapter.h"
#include "schema/schema_manager.h"
#include "schema/schema_registry.h"

namespace quanta {
namespace test {

/// Test double: forwards to a MemoryAdapter, counts calls and injects failures or delays
class RecordingAdapter : public EngineAdapter {
public:
    RecordingAdapter(std::string name, StorageClass cls)
        : inner_(std::make_shared<MemoryAdapter>(name, cls)) {}

    std::string name() const override { return inner_->name(); }
    StorageClass storageClass() const override { return inner_->storageClass(); }

    void initBucket(const std::string& bucket) override {
        ++init_calls;
        inner_->initBucket(bucket);
    }
    void dropBucket(const std::string& bucket) override { inner_->dropBucket(bucket); }

    void provision(const std::string& bucket, const std::string& record,
                   const std::string& attribute, const AttributeDefinition& def) override {
        {
            std::lock_guard<std::mutex> lock(mu_);
            provisions_.push_back(record + "." + attribute);
        }
        if (fail_provision) throw std::runtime_error(name() + ": provisioning rejected");
        inner_->provision(bucket, record, attribute, def);
    }

    std::unique_ptr<SubTransaction> beginTransaction() override {
        ++begin_calls;
        if (fail_begin) throw std::runtime_error(name() + ": cannot open transaction");
        return inner_->beginTransaction();
    }
    void prepareCommit(SubTransaction& txn) override {
        ++prepare_calls;
        if (fail_prepare) throw std::runtime_error(name() + ": prepare failed");
        inner_->prepareCommit(txn);
    }
    void commit(SubTransaction& txn) override {
        ++commit_calls;
        if (fail_commit) throw std::runtime_error(name() + ": commit failed");
        inner_->commit(txn);
    }
    void rollback(SubTransaction& txn) override {
        ++rollback_calls;
        inner_->rollback(txn);
    }

    std::vector<nlohmann::json> select(const std::string& bucket, const std::string& record,
                                       const NativeQuery& query, SubTransaction* txn) override {
        ++select_calls;
        {
            std::lock_guard<std::mutex> lock(mu_);
            queries_.push_back(query);
        }
        if (select_delay.count() > 0) std::this_thread::sleep_for(select_delay);
        if (fail_select) throw std::runtime_error(name() + ": select failed");
        return inner_->select(bucket, record, query, txn);
    }
    void insert(const std::string& bucket, const std::string& record,
                const NativeQuery& query, SubTransaction* txn) override {
        ++insert_calls;
        if (write_delay.count() > 0) std::this_thread::sleep_for(write_delay);
        if (fail_write) throw std::runtime_error(name() + ": insert failed");
        inner_->insert(bucket, record, query, txn);
    }
    size_t update(const std::string& bucket, const std::string& record,
                  const NativeQuery& query, SubTransaction* txn) override {
        ++update_calls;
        if (write_delay.count() > 0) std::this_thread::sleep_for(write_delay);
        if (fail_write) throw std::runtime_error(name() + ": update failed");
        return inner_->update(bucket, record, query, txn);
    }
    size_t remove(const std::string& bucket, const std::string& record,
                  const NativeQuery& query, SubTransaction* txn) override {
        ++remove_calls;
        if (write_delay.count() > 0) std::this_thread::sleep_for(write_delay);
        if (fail_write) throw std::runtime_error(name() + ": remove failed");
        return inner_->remove(bucket, record, query, txn);
    }

    void cancel() override { ++cancel_calls; }

    std::vector<std::string> provisions() const {
        std::lock_guard<std::mutex> lock(mu_);
        return provisions_;
    }
    std::vector<NativeQuery> queries() const {
        std::lock_guard<std::mutex> lock(mu_);
        return queries_;
    }
    void resetCounters() {
        init_calls = begin_calls = prepare_calls = commit_calls = rollback_calls = 0;
        select_calls = insert_calls = update_calls = remove_calls = cancel_calls = 0;
        std::lock_guard<std::mutex> lock(mu_);
        provisions_.clear();
        queries_.clear();
    }

    MemoryAdapter& memory() { return *inner_; }

    std::atomic<int> init_calls{0};
    std::atomic<int> begin_calls{0};
    std::atomic<int> prepare_calls{0};
    std::atomic<int> commit_calls{0};
    std::atomic<int> rollback_calls{0};
    std::atomic<int> select_calls{0};
    std::atomic<int> insert_calls{0};
    std::atomic<int> update_calls{0};
    std::atomic<int> remove_calls{0};
    std::atomic<int> cancel_calls{0};

    std::atomic<bool> fail_provision{false};
    std::atomic<bool> fail_begin{false};
    std::atomic<bool> fail_prepare{false};
    std::atomic<bool> fail_commit{false};
    std::atomic<bool> fail_select{false};
    std::atomic<bool> fail_write{false};
    std::chrono::milliseconds select_delay{0};
    std::chrono::milliseconds write_delay{0};

private:
    std::shared_ptr<MemoryAdapter> inner_;
    mutable std::mutex mu_;
    std::vector<std::string> provisions_;
    std::vector<NativeQuery> queries_;
};

/// Four recording adapters (postgres, mongodb, neo4j, influxdb) in one registry
struct Backends {
    std::shared_ptr<RecordingAdapter> scalar = std::make_shared<RecordingAdapter>("postgres", StorageClass::Scalar);
    std::shared_ptr<RecordingAdapter> document = std::make_shared<RecordingAdapter>("mongodb", StorageClass::Document);
    std::shared_ptr<RecordingAdapter> relation = std::make_shared<RecordingAdapter>("neo4j", StorageClass::Relation);
    std::shared_ptr<RecordingAdapter> metric = std::make_shared<RecordingAdapter>("influxdb", StorageClass::Metric);
    AdapterRegistry registry;

    Backends() {
        registry.set(scalar);
        registry.set(document);
        registry.set(relation);
        registry.set(metric);
    }

    std::vector<std::shared_ptr<RecordingAdapter>> all() const { return {scalar, document, relation, metric}; }

    RecordingAdapter& of(StorageClass cls) {
        switch (cls) {
            case StorageClass::Scalar: return *scalar;
            case StorageClass::Document: return *document;
            case StorageClass::Relation: return *relation;
            default: return *metric;
        }
    }

    void resetCounters() {
        for (auto& a : all()) a->resetCounters();
    }
};

inline AttributeDefinition attr(StorageClass type, std::optional<std::string> hint = std::nullopt,
                                bool indexed = false) {
    AttributeDefinition def;
    def.type = type;
    if (hint) {
        if (type == StorageClass::Relation) def.target = hint;
        else if (type == StorageClass::Metric) def.unit = hint;
        else def.datatype = hint;
    }
    def.indexed = indexed;
    return def;
}

/// users(id, username, email, profile, login_times) and
/// tasks(id, title, status, priority, due_date, metadata, assignees -> users, time_spent)
inline void createTaskSchema(SchemaManager& schema, const std::string& bucket) {
    auto [bst, info] = schema.createBucket(bucket);
    if (!bst.ok) throw std::runtime_error(bst.toString());

    RecordSpec users;
    users.record = "users";
    users.attributes = {
        {"id", attr(StorageClass::Scalar, std::string("UUID"))},
        {"username", attr(StorageClass::Scalar, std::string("STRING"), true)},
        {"email", attr(StorageClass::Scalar, std::string("STRING"))},
        {"profile", attr(StorageClass::Document)},
        {"login_times", attr(StorageClass::Metric, std::string("COUNT"))},
    };
    auto [ust, u] = schema.createRecord(bucket, users);
    if (!ust.ok) throw std::runtime_error(ust.toString());

    RecordSpec tasks;
    tasks.record = "tasks";
    tasks.attributes = {
        {"id", attr(StorageClass::Scalar, std::string("UUID"))},
        {"title", attr(StorageClass::Scalar, std::string("STRING"))},
        {"status", attr(StorageClass::Scalar, std::string("STRING"), true)},
        {"priority", attr(StorageClass::Scalar, std::string("INT"))},
        {"due_date", attr(StorageClass::Scalar, std::string("DATE"))},
        {"metadata", attr(StorageClass::Document)},
        {"assignees", attr(StorageClass::Relation, std::string("users"))},
        {"time_spent", attr(StorageClass::Metric, std::string("SECONDS"))},
    };
    auto [tst, t] = schema.createRecord(bucket, tasks);
    if (!tst.ok) throw std::runtime_error(tst.toString());
}

} // namespace test
} // namespace quanta
