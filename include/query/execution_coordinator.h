#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "config/engine_config.h"
#include "engine/adapter_registry.h"
#include "query/physical_plan.h"
#include "transaction/transaction_manager.h"
#include "utils/status.h"

namespace quanta {
namespace query {

/// Rows one fragment returned
struct FragmentResult {
    int fragment = -1;
    std::vector<nlohmann::json> rows;
    bool executed = false;          // false: skipped (empty key set) or not reached
    bool failed = false;
    Status error;
    double elapsed_ms = 0.0;
};

struct EngineStats {
    uint64_t units_scanned = 0;
    double execution_time_ms = 0.0;
    size_t queries = 0;

    nlohmann::json toJSON() const {
        return {{"units_scanned", units_scanned}, {"execution_time_ms", execution_time_ms}, {"queries", queries}};
    }
};

struct ExecutionResult {
    Status status;
    std::vector<FragmentResult> fragments;          // indexed by fragment id
    std::map<std::string, EngineStats> engines;     // by adapter name
    std::vector<std::string> failed_engines;
    std::vector<int> dispatch_order;                // fragment ids in the order they were sent

    const FragmentResult* fragment(int id) const {
        return id >= 0 && static_cast<size_t>(id) < fragments.size() ? &fragments[static_cast<size_t>(id)] : nullptr;
    }
};

struct WriteResult {
    Status status;
    size_t affected = 0;
    bool outcome_unknown = false;   // timed out with writes sent outside a transaction
    std::map<std::string, EngineStats> engines;
};

/**
 * Runs plan fragments against the backend adapters.
 *
 * Fragments of one wave run concurrently on a tbb::task_group; a wave starts once the
 * previous one has finished, and key sets of upstream fragments are bound into the
 * downstream native queries. Fragments whose key set is empty are not sent.
 *
 * The whole run happens on a worker thread so the caller can stop waiting at the
 * deadline: on timeout every adapter gets cancel(), an open transaction is rolled back
 * and TimeoutError is returned. The worker owns copies of everything it touches and
 * sends nothing once the run is cancelled. A write that timed out without a
 * transaction may still land on the engines already dispatched to; the error says so.
 */
class ExecutionCoordinator {
public:
    struct Options {
        std::optional<std::string> transaction_id;
        bool allow_partial = false;
        std::optional<std::chrono::milliseconds> timeout;   // default: config
    };

    ExecutionCoordinator(const AdapterRegistry& adapters, TransactionManager& transactions,
                         config::EngineConfig::ExecutionConfig cfg,
                         bool implicit_transactions = true)
        : adapters_(adapters), transactions_(transactions), cfg_(cfg),
          implicit_transactions_(implicit_transactions) {}

    ExecutionResult execute(const PhysicalPlan& plan, const Options& options) const;

    /// Multi-engine writes run in an implicit transaction unless the caller passes one
    WriteResult executeWrite(const WritePlan& plan, const Options& options) const;

private:
    const AdapterRegistry& adapters_;
    TransactionManager& transactions_;
    config::EngineConfig::ExecutionConfig cfg_;
    bool implicit_transactions_;

    std::chrono::milliseconds timeoutOf(const Options& options) const {
        return options.timeout.value_or(cfg_.query_timeout);
    }
    void cancelAll() const;
};

/// Values of `column` over the rows of every input, intersected
std::vector<nlohmann::json> intersectKeys(const std::vector<KeyInput>& inputs,
                                          const std::vector<FragmentResult>& results);

} // namespace query
} // namespace quanta
