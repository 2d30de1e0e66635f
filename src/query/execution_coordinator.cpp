#include "query/execution_coordinator.h"
#include "utils/logger.h"

#include <algorithm>
#include <array>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <set>
#include <thread>

#include <tbb/task_group.h>

namespace quanta {
namespace query {

namespace {

using json = nlohmann::json;
using Clock = std::chrono::steady_clock;
using AdapterTable = std::array<EngineAdapterPtr, kStorageClassCount>;

/// State shared between the waiting caller and the worker thread
template <typename Result>
struct Run {
    std::mutex mu;
    std::condition_variable cv;
    bool done = false;
    std::atomic<bool> cancelled{false};
    Result result;
};

template <typename Result, typename Work>
std::shared_ptr<Run<Result>> launch(Work work) {
    auto run = std::make_shared<Run<Result>>();
    std::thread([run, work = std::move(work)]() mutable {
        try {
            work(*run);
        } catch (const std::exception& e) {
            QUANTA_ERROR("Execution worker failed: {}", e.what());
            run->result.status = Status::EngineError("coordinator", e.what());
        }
        {
            std::lock_guard<std::mutex> lock(run->mu);
            run->done = true;
        }
        run->cv.notify_all();
    }).detach();
    return run;
}

/// false on timeout
template <typename Result>
bool waitFor(Run<Result>& run, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(run.mu);
    return run.cv.wait_for(lock, timeout, [&run] { return run.done; });
}

double elapsedMs(Clock::time_point start) {
    return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
}

AdapterTable snapshot(const AdapterRegistry& registry) {
    AdapterTable table;
    for (StorageClass cls : kAllStorageClasses) table[static_cast<size_t>(cls)] = registry.get(cls);
    return table;
}

struct WriteRun {
    Status status;
    std::vector<size_t> counts;
    std::vector<Status> errors;
    std::map<std::string, EngineStats> engines;
};

} // namespace

std::vector<json> intersectKeys(const std::vector<KeyInput>& inputs, const std::vector<FragmentResult>& results) {
    std::vector<json> keys;
    bool first = true;

    for (const auto& input : inputs) {
        std::set<std::string> seen;
        std::vector<json> values;
        if (input.fragment >= 0 && static_cast<size_t>(input.fragment) < results.size()) {
            for (const auto& row : results[static_cast<size_t>(input.fragment)].rows) {
                auto it = row.find(input.column);
                if (it == row.end() || it->is_null()) continue;
                if (seen.insert(it->dump()).second) values.push_back(*it);
            }
        }
        if (first) {
            keys = std::move(values);
            first = false;
            continue;
        }
        std::vector<json> kept;
        for (auto& k : keys) {
            if (seen.count(k.dump())) kept.push_back(std::move(k));
        }
        keys = std::move(kept);
    }
    return keys;
}

void ExecutionCoordinator::cancelAll() const {
    for (const auto& adapter : adapters_.all()) {
        try {
            adapter->cancel();
        } catch (const std::exception& e) {
            QUANTA_ERROR("cancel() failed on {}: {}", adapter->name(), e.what());
        }
    }
}

ExecutionResult ExecutionCoordinator::execute(const PhysicalPlan& plan, const Options& options) const {
    std::shared_ptr<TransactionManager::Transaction> txn;
    if (options.transaction_id) {
        txn = transactions_.get(*options.transaction_id);
        if (!txn) {
            ExecutionResult r;
            r.status = Status::TransactionError("unknown transaction '" + *options.transaction_id + "'");
            return r;
        }
        if (!txn->acquire()) {
            ExecutionResult r;
            r.status = Status::TransactionError("transaction '" + txn->id() + "' is in use by another query");
            return r;
        }
    }

    const bool allow_partial = options.allow_partial && !txn;
    auto run = launch<ExecutionResult>(
        [fragments = plan.fragments, waves = plan.waves(), adapters = snapshot(adapters_), txn, allow_partial]
        (Run<ExecutionResult>& state) {
            ExecutionResult& result = state.result;
            result.fragments.resize(fragments.size());
            for (size_t i = 0; i < fragments.size(); ++i) result.fragments[i].fragment = static_cast<int>(i);
            std::mutex mu;

            auto runFragment = [&](int id) {
                const Fragment& f = fragments[static_cast<size_t>(id)];
                FragmentResult& out = result.fragments[static_cast<size_t>(id)];

                NativeQuery q = f.native;
                if (!f.key_inputs.empty()) {
                    auto keys = intersectKeys(f.key_inputs, result.fragments);
                    if (keys.empty()) {
                        QUANTA_DEBUG("Fragment {} skipped: empty key set", id);
                        return;
                    }
                    q.bindKeys(std::move(keys));
                }

                const auto& adapter = adapters[static_cast<size_t>(f.engine)];
                if (!adapter) {
                    out.failed = true;
                    out.error = Status::EngineError(storageClassName(f.engine), "no adapter installed");
                    return;
                }
                SubTransaction* handle = txn ? txn->handle(f.engine) : nullptr;
                {
                    std::lock_guard<std::mutex> lock(mu);
                    result.dispatch_order.push_back(id);
                }
                QUANTA_DEBUG("Fragment {} -> {}: {}", id, adapter->name(), q.text);

                auto start = Clock::now();
                try {
                    out.rows = adapter->select(f.bucket, f.record, q, handle);
                    out.executed = true;
                } catch (const std::exception& e) {
                    out.failed = true;
                    out.error = Status::EngineError(adapter->name(), e.what());
                    QUANTA_ERROR("Fragment {} failed on {}: {}", id, adapter->name(), e.what());
                }
                out.elapsed_ms = elapsedMs(start);

                std::lock_guard<std::mutex> lock(mu);
                auto& stats = result.engines[adapter->name()];
                stats.units_scanned += out.rows.size();
                stats.execution_time_ms += out.elapsed_ms;
                stats.queries++;
            };

            for (const auto& wave : waves) {
                if (state.cancelled.load()) break;
                tbb::task_group tg;
                for (int id : wave) {
                    tg.run([&runFragment, id]() { runFragment(id); });
                }
                tg.wait();

                bool failed = std::any_of(wave.begin(), wave.end(), [&](int id) {
                    return result.fragments[static_cast<size_t>(id)].failed;
                });
                if (failed && !allow_partial) break;
            }

            for (const auto& f : result.fragments) {
                if (!f.failed) continue;
                if (!allow_partial) {
                    result.status = f.error;
                    break;
                }
                if (std::find(result.failed_engines.begin(), result.failed_engines.end(), f.error.engine) ==
                    result.failed_engines.end()) {
                    result.failed_engines.push_back(f.error.engine);
                    QUANTA_WARN("Partial result: engine {} failed: {}", f.error.engine, f.error.message);
                }
            }
            if (txn) txn->release();
        });

    auto timeout = timeoutOf(options);
    if (!waitFor(*run, timeout)) {
        run->cancelled.store(true);
        cancelAll();
        QUANTA_WARN("Query timed out after {} ms", timeout.count());
        if (txn) {
            Status rb = transactions_.rollback(txn->id());
            if (!rb.ok) QUANTA_ERROR("Rollback after timeout failed: {}", rb.message);
        }
        ExecutionResult r;
        r.status = Status::TimeoutError("query exceeded timeout of " + std::to_string(timeout.count()) + " ms");
        return r;
    }

    std::lock_guard<std::mutex> lock(run->mu);
    return std::move(run->result);
}

WriteResult ExecutionCoordinator::executeWrite(const WritePlan& plan, const Options& options) const {
    WriteResult out;
    std::shared_ptr<TransactionManager::Transaction> txn;
    bool implicit = false;

    if (options.transaction_id) {
        txn = transactions_.get(*options.transaction_id);
        if (!txn) {
            out.status = Status::TransactionError("unknown transaction '" + *options.transaction_id + "'");
            return out;
        }
    } else if (plan.multiEngine() && implicit_transactions_) {
        auto [st, id] = transactions_.begin();
        if (!st.ok) {
            out.status = st;
            return out;
        }
        txn = transactions_.get(id);
        implicit = true;
    }
    if (txn && !txn->acquire()) {
        out.status = Status::TransactionError("transaction '" + txn->id() + "' is in use by another query");
        return out;
    }

    auto run = launch<WriteRun>(
        [fragments = plan.fragments, adapters = snapshot(adapters_), txn](Run<WriteRun>& state) {
            WriteRun& result = state.result;
            result.counts.assign(fragments.size(), 0);
            result.errors.assign(fragments.size(), Status::OK());
            std::mutex mu;

            tbb::task_group tg;
            for (size_t i = 0; i < fragments.size(); ++i) {
                tg.run([&, i]() {
                    const WriteFragment& f = fragments[i];
                    const auto& adapter = adapters[static_cast<size_t>(f.engine)];
                    if (!adapter) {
                        result.errors[i] = Status::EngineError(storageClassName(f.engine), "no adapter installed");
                        return;
                    }
                    if (state.cancelled.load()) {
                        result.errors[i] = Status::TimeoutError("write to " + adapter->name() + " not sent: cancelled");
                        return;
                    }
                    SubTransaction* handle = txn ? txn->handle(f.engine) : nullptr;
                    QUANTA_DEBUG("{} -> {}: {}", nativeOperationName(f.operation), adapter->name(), f.native.text);

                    auto start = Clock::now();
                    try {
                        switch (f.operation) {
                            case NativeOperation::Insert:
                                adapter->insert(f.bucket, f.record, f.native, handle);
                                result.counts[i] = 1;
                                break;
                            case NativeOperation::Update:
                                result.counts[i] = adapter->update(f.bucket, f.record, f.native, handle);
                                break;
                            default:
                                result.counts[i] = adapter->remove(f.bucket, f.record, f.native, handle);
                                break;
                        }
                    } catch (const std::exception& e) {
                        result.errors[i] = Status::EngineError(adapter->name(), e.what());
                        QUANTA_ERROR("Write on {} failed: {}", adapter->name(), e.what());
                    }

                    std::lock_guard<std::mutex> lock(mu);
                    auto& stats = result.engines[adapter->name()];
                    stats.units_scanned += result.counts[i];
                    stats.execution_time_ms += elapsedMs(start);
                    stats.queries++;
                });
            }
            tg.wait();

            for (const auto& e : result.errors) {
                if (!e.ok) {
                    result.status = e;
                    break;
                }
            }
            if (txn) txn->release();
        });

    auto timeout = timeoutOf(options);
    if (!waitFor(*run, timeout)) {
        run->cancelled.store(true);
        cancelAll();
        QUANTA_WARN("Write timed out after {} ms", timeout.count());
        std::string message = "write exceeded timeout of " + std::to_string(timeout.count()) + " ms";
        if (txn) {
            Status rb = transactions_.rollback(txn->id());
            if (!rb.ok) QUANTA_ERROR("Rollback after timeout failed: {}", rb.message);
        } else {
            std::vector<std::string> engines;
            for (const auto& f : plan.fragments) {
                auto adapter = adapters_.get(f.engine);
                engines.push_back(adapter ? adapter->name() : storageClassName(f.engine));
            }
            std::string joined;
            for (const auto& e : engines) joined += (joined.empty() ? "" : ", ") + e;
            message += "; outcome unknown on " + joined + " (no transaction to roll back)";
            out.outcome_unknown = true;
            QUANTA_ERROR("Timed-out write without transaction may still apply on {}", joined);
        }
        out.status = Status::TimeoutError(message);
        return out;
    }

    WriteRun result;
    {
        std::lock_guard<std::mutex> lock(run->mu);
        result = std::move(run->result);
    }
    out.engines = std::move(result.engines);

    if (!result.status.ok) {
        if (txn) {
            Status rb = transactions_.rollback(txn->id());
            if (!rb.ok) result.status.message += "; " + rb.message;
        }
        out.status = result.status;
        return out;
    }
    if (implicit) {
        Status st = transactions_.commit(txn->id());
        if (!st.ok) {
            out.status = st;
            return out;
        }
    }
    // per-engine counts can differ (a delete only counts rows the engine holds)
    for (size_t c : result.counts) out.affected = std::max(out.affected, c);
    return out;
}

} // namespace query
} // namespace quanta
