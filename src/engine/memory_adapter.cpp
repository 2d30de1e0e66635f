#include "engine/memory_adapter.h"
#include "query/expression_evaluator.h"
#include "query/value_normalizer.h"
#include "utils/logger.h"

#include <algorithm>
#include <chrono>
#include <set>
#include <stdexcept>

namespace quanta {

using json = nlohmann::json;
using query::ExpressionEvaluator;

class MemoryAdapter::MemorySubTransaction : public SubTransaction {
public:
    explicit MemorySubTransaction(std::string id) : id_(std::move(id)) {}
    const std::string& id() const override { return id_; }

    std::vector<PendingWrite> writes;
    bool prepared = false;

private:
    std::string id_;
};

namespace {

std::vector<json> distinctKeys(const std::vector<json>& keys) {
    std::vector<json> out;
    std::set<std::string> seen;
    for (const auto& k : keys) {
        if (k.is_null()) continue;
        if (seen.insert(k.dump()).second) out.push_back(k);
    }
    return out;
}

json stampSample(const json& v, const std::string& now) {
    if (v.is_object() && v.contains("value")) {
        json sample = v;
        if (!sample.contains("time") || sample["time"].is_null()) sample["time"] = now;
        return sample;
    }
    return {{"time", now}, {"value", v}};
}

} // namespace

MemoryAdapter::RecordData& MemoryAdapter::recordData(const std::string& bucket, const std::string& record) {
    auto it = buckets_.find(bucket);
    if (it == buckets_.end()) {
        throw std::runtime_error(name_ + ": unknown bucket '" + bucket + "'");
    }
    return it->second[record];
}

void MemoryAdapter::initBucket(const std::string& bucket) {
    std::lock_guard<std::mutex> lock(mu_);
    buckets_[bucket];
    QUANTA_DEBUG("{}: bucket '{}' initialized", name_, bucket);
}

void MemoryAdapter::dropBucket(const std::string& bucket) {
    std::lock_guard<std::mutex> lock(mu_);
    buckets_.erase(bucket);
}

void MemoryAdapter::provision(const std::string& bucket, const std::string& record,
                              const std::string& attribute, const AttributeDefinition& def) {
    if (def.type != class_) {
        throw std::invalid_argument(name_ + ": cannot store " + storageClassName(def.type) +
                                    " attribute '" + attribute + "'");
    }
    std::lock_guard<std::mutex> lock(mu_);
    auto& data = recordData(bucket, record);
    if (std::find(data.attributes.begin(), data.attributes.end(), attribute) == data.attributes.end()) {
        data.attributes.push_back(attribute);
    }
}

std::vector<std::string> MemoryAdapter::provisioned(const std::string& bucket, const std::string& record) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto b = buckets_.find(bucket);
    if (b == buckets_.end()) return {};
    auto r = b->second.find(record);
    return r == b->second.end() ? std::vector<std::string>{} : r->second.attributes;
}

size_t MemoryAdapter::rowCount(const std::string& bucket, const std::string& record) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto b = buckets_.find(bucket);
    if (b == buckets_.end()) return 0;
    auto r = b->second.find(record);
    return r == b->second.end() ? 0 : r->second.rows.size();
}

// ===== Transactions =====

std::unique_ptr<SubTransaction> MemoryAdapter::beginTransaction() {
    return std::make_unique<MemorySubTransaction>(name_ + "-" + std::to_string(next_txn_++));
}

void MemoryAdapter::prepareCommit(SubTransaction& txn) {
    auto& sub = static_cast<MemorySubTransaction&>(txn);
    std::lock_guard<std::mutex> lock(mu_);
    for (const auto& w : sub.writes) {
        if (!buckets_.count(w.bucket)) {
            throw std::runtime_error(name_ + ": unknown bucket '" + w.bucket + "'");
        }
    }
    sub.prepared = true;
}

void MemoryAdapter::commit(SubTransaction& txn) {
    auto& sub = static_cast<MemorySubTransaction&>(txn);
    std::lock_guard<std::mutex> lock(mu_);
    for (const auto& w : sub.writes) apply(w);
    sub.writes.clear();
}

void MemoryAdapter::rollback(SubTransaction& txn) {
    auto& sub = static_cast<MemorySubTransaction&>(txn);
    std::lock_guard<std::mutex> lock(mu_);
    sub.writes.clear();
    sub.prepared = false;
}

// ===== Data =====

MemoryAdapter::Rows MemoryAdapter::visibleRows(const std::string& bucket, const std::string& record,
                                               SubTransaction* txn) {
    Rows rows = recordData(bucket, record).rows;
    for (const auto& w : static_cast<MemorySubTransaction*>(txn)->writes) {
        if (w.bucket == bucket && w.record == record) applyTo(rows, w);
    }
    return rows;
}

std::vector<json> MemoryAdapter::select(const std::string& bucket, const std::string& record,
                                        const NativeQuery& query, SubTransaction* txn) {
    std::lock_guard<std::mutex> lock(mu_);
    const Rows* rows = &recordData(bucket, record).rows;
    Rows overlay;
    if (txn) {
        overlay = visibleRows(bucket, record, txn);
        rows = &overlay;
    }

    std::vector<const json*> candidates;
    if (query.keys) {
        for (const auto& key : distinctKeys(*query.keys)) {
            auto it = rows->find(key.dump());
            if (it != rows->end()) candidates.push_back(&it->second);
        }
    } else {
        for (const auto& entry : *rows) candidates.push_back(&entry.second);
    }

    std::vector<json> out;
    if (query.operation == NativeOperation::Traverse) {
        for (const json* row : candidates) {
            auto edges = row->find(query.relation_attribute);
            if (edges == row->end() || !edges->is_array()) continue;
            for (const auto& target : *edges) {
                out.push_back({{"source", (*row)[query.key_column]}, {"target", target}});
            }
        }
        return out;
    }

    std::vector<std::pair<json, json>> matched;   // (tuple, projected row)
    for (const json* row : candidates) {
        json tuple = {{query.binding, *row}};
        bool keep = true;
        for (const auto& pred : query.predicates) {
            if (!ExpressionEvaluator::test(pred, tuple)) {
                keep = false;
                break;
            }
        }
        if (!keep) continue;

        json projected = json::object();
        projected[query.key_column] = row->value(query.key_column, json());
        for (const auto& attr : query.attributes) {
            projected[attr] = row->value(attr, json());
        }
        matched.emplace_back(std::move(tuple), std::move(projected));
    }

    if (!query.order_by.empty()) {
        std::vector<std::vector<json>> sort_keys;
        sort_keys.reserve(matched.size());
        for (const auto& m : matched) {
            std::vector<json> keys;
            for (const auto& item : query.order_by) keys.push_back(ExpressionEvaluator::evaluate(item.expr, m.first));
            sort_keys.push_back(std::move(keys));
        }
        std::vector<size_t> idx(matched.size());
        for (size_t i = 0; i < idx.size(); ++i) idx[i] = i;
        std::stable_sort(idx.begin(), idx.end(), [&](size_t a, size_t b) {
            for (size_t k = 0; k < query.order_by.size(); ++k) {
                const json& x = sort_keys[a][k];
                const json& y = sort_keys[b][k];
                if (ExpressionEvaluator::sortLess(x, y)) return query.order_by[k].ascending;
                if (ExpressionEvaluator::sortLess(y, x)) return !query.order_by[k].ascending;
            }
            return false;
        });
        std::vector<std::pair<json, json>> sorted;
        for (size_t i : idx) sorted.push_back(std::move(matched[i]));
        matched = std::move(sorted);
    }

    for (auto& m : matched) out.push_back(std::move(m.second));
    return out;
}

void MemoryAdapter::applyValues(json& row, const json& values, const std::string& key_column, bool append) {
    for (auto it = values.begin(); it != values.end(); ++it) {
        if (it.key() == key_column) continue;
        if (append) {
            json merged = query::normalizeMetricSamples(row.value(it.key(), json::array()));
            for (const auto& sample : query::normalizeMetricSamples(it.value())) merged.push_back(sample);
            row[it.key()] = query::normalizeMetricSamples(merged);
        } else if (class_ == StorageClass::Relation) {
            row[it.key()] = it.value().is_array() ? it.value() : json::array({it.value()});
        } else {
            row[it.key()] = it.value();
        }
    }
}

size_t MemoryAdapter::apply(const PendingWrite& write) {
    return applyTo(recordData(write.bucket, write.record).rows, write);
}

size_t MemoryAdapter::applyTo(Rows& rows, const PendingWrite& write) {
    const NativeQuery& q = write.query;
    const bool append = class_ == StorageClass::Metric;

    switch (write.operation) {
        case NativeOperation::Insert: {
            json key = q.values.value(q.key_column, json());
            json& row = rows[key.dump()];
            if (!row.is_object()) row = json::object();
            row[q.key_column] = key;
            applyValues(row, q.values, q.key_column, append);
            return 1;
        }
        case NativeOperation::Update: {
            size_t count = 0;
            for (const auto& key : distinctKeys(q.keys.value_or(std::vector<json>{}))) {
                json& row = rows[key.dump()];
                if (!row.is_object()) row = json::object();
                row[q.key_column] = key;
                applyValues(row, q.values, q.key_column, append);
                ++count;
            }
            return count;
        }
        case NativeOperation::Delete: {
            size_t count = 0;
            for (const auto& key : distinctKeys(q.keys.value_or(std::vector<json>{}))) {
                count += rows.erase(key.dump());
            }
            return count;
        }
        default:
            throw std::invalid_argument(name_ + ": not a write operation");
    }
}

size_t MemoryAdapter::countExisting(const PendingWrite& write, SubTransaction* txn) {
    Rows rows = visibleRows(write.bucket, write.record, txn);
    size_t count = 0;
    for (const auto& key : distinctKeys(write.query.keys.value_or(std::vector<json>{}))) {
        count += rows.count(key.dump());
    }
    return count;
}

NativeQuery MemoryAdapter::stamped(const NativeQuery& query) const {
    if (class_ != StorageClass::Metric || !query.values.is_object()) return query;
    const auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    const std::string time = query::formatEpochMillis(now);

    NativeQuery out = query;
    for (auto it = out.values.begin(); it != out.values.end(); ++it) {
        if (it.key() == out.key_column || it.value().is_null()) continue;
        if (it.value().is_array()) {
            json samples = json::array();
            for (const auto& v : it.value()) samples.push_back(stampSample(v, time));
            it.value() = std::move(samples);
        } else {
            it.value() = stampSample(it.value(), time);
        }
    }
    return out;
}

void MemoryAdapter::insert(const std::string& bucket, const std::string& record,
                           const NativeQuery& query, SubTransaction* txn) {
    PendingWrite w{NativeOperation::Insert, bucket, record, stamped(query)};
    std::lock_guard<std::mutex> lock(mu_);
    if (txn) {
        recordData(bucket, record);
        static_cast<MemorySubTransaction*>(txn)->writes.push_back(std::move(w));
        return;
    }
    apply(w);
}

size_t MemoryAdapter::update(const std::string& bucket, const std::string& record,
                             const NativeQuery& query, SubTransaction* txn) {
    PendingWrite w{NativeOperation::Update, bucket, record, stamped(query)};
    std::lock_guard<std::mutex> lock(mu_);
    if (txn) {
        recordData(bucket, record);
        size_t count = distinctKeys(query.keys.value_or(std::vector<json>{})).size();
        static_cast<MemorySubTransaction*>(txn)->writes.push_back(std::move(w));
        return count;
    }
    return apply(w);
}

size_t MemoryAdapter::remove(const std::string& bucket, const std::string& record,
                             const NativeQuery& query, SubTransaction* txn) {
    PendingWrite w{NativeOperation::Delete, bucket, record, query};
    std::lock_guard<std::mutex> lock(mu_);
    if (txn) {
        size_t count = countExisting(w, txn);
        static_cast<MemorySubTransaction*>(txn)->writes.push_back(std::move(w));
        return count;
    }
    return apply(w);
}

} // namespace quanta
