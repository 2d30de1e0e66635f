#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "config/engine_config.h"
#include "engine/adapter_registry.h"
#include "transaction/decision_log.h"
#include "utils/status.h"

namespace quanta {

/**
 * TransactionManager: coordinator-driven two-phase commit across the backend adapters.
 *
 *   Active -> Preparing -> Committed        all prepares succeeded
 *   Active -> Aborting  -> RolledBack       any failure, or rollback()
 *
 * Best effort only: backends have no shared protocol. The coordinator's commit
 * decision is written to the DecisionLog before any backend commit is dispatched,
 * so a crash in between is detectable at the next start (see recoverInDoubt()).
 */
class TransactionManager {
public:
    using TransactionId = std::string;

    enum class State { Active, Preparing, Committed, Aborting, RolledBack };
    static const char* stateName(State s);

    struct Participant {
        EngineAdapterPtr adapter;
        std::unique_ptr<SubTransaction> handle;
    };

    class Transaction {
    public:
        Transaction(TransactionId id, std::vector<Participant> participants);

        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;

        const TransactionId& id() const { return id_; }
        State state() const { return state_; }
        std::chrono::system_clock::time_point startTime() const { return start_time_; }

        /// Sub-transaction of one backend; nullptr if that backend does not participate
        SubTransaction* handle(StorageClass cls) const;

        /// Claims the handles for one query. false if another query holds them.
        bool acquire();
        void release();

    private:
        friend class TransactionManager;

        TransactionId id_;
        std::vector<Participant> participants_;
        State state_ = State::Active;
        std::chrono::system_clock::time_point start_time_;
        std::mutex mu_;                     // serializes commit / rollback
        std::atomic<bool> in_use_{false};
    };

    TransactionManager(const AdapterRegistry& adapters, config::EngineConfig::TransactionConfig cfg);

    /// Opens one sub-transaction per installed backend
    std::pair<Status, TransactionId> begin();

    /// nullptr if the id is not an active transaction
    std::shared_ptr<Transaction> get(const TransactionId& id) const;

    /// Prepare everywhere, then commit everywhere. A failed prepare rolls back every
    /// participant and returns TransactionError.
    Status commit(const TransactionId& id);

    /// Rolls back every participant regardless of state
    Status rollback(const TransactionId& id);

    struct Stats {
        uint64_t begun = 0;
        uint64_t committed = 0;
        uint64_t rolled_back = 0;
        uint64_t active = 0;
    };
    Stats getStats() const;

    /// Logs (CRITICAL) and returns transactions the decision log shows as committed
    /// but not completed
    std::vector<TransactionId> recoverInDoubt() const;

    const DecisionLog& decisionLog() const { return log_; }

private:
    const AdapterRegistry& adapters_;
    config::EngineConfig::TransactionConfig cfg_;
    DecisionLog log_;

    mutable std::mutex sessions_mutex_;
    std::unordered_map<TransactionId, std::shared_ptr<Transaction>> active_transactions_;

    std::string id_prefix_;
    std::atomic<uint64_t> next_transaction_id_{1};
    std::atomic<uint64_t> total_begun_{0};
    std::atomic<uint64_t> total_committed_{0};
    std::atomic<uint64_t> total_rolled_back_{0};

    TransactionId generateTransactionId();
    void removeActive(const TransactionId& id);
    std::vector<std::string> rollbackAll(Transaction& txn);
    static std::vector<std::string> participantNames(const Transaction& txn);
};

} // namespace quanta
