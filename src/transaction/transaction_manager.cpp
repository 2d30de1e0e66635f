#include "transaction/transaction_manager.h"
#include "utils/logger.h"

namespace quanta {

const char* TransactionManager::stateName(State s) {
    switch (s) {
        case State::Active: return "active";
        case State::Preparing: return "preparing";
        case State::Committed: return "committed";
        case State::Aborting: return "aborting";
        case State::RolledBack: return "rolled_back";
    }
    return "active";
}

// ===== Transaction =====

TransactionManager::Transaction::Transaction(TransactionId id, std::vector<Participant> participants)
    : id_(std::move(id)),
      participants_(std::move(participants)),
      start_time_(std::chrono::system_clock::now()) {}

SubTransaction* TransactionManager::Transaction::handle(StorageClass cls) const {
    for (const auto& p : participants_) {
        if (p.adapter->storageClass() == cls) return p.handle.get();
    }
    return nullptr;
}

bool TransactionManager::Transaction::acquire() {
    bool expected = false;
    return in_use_.compare_exchange_strong(expected, true);
}

void TransactionManager::Transaction::release() {
    in_use_.store(false);
}

// ===== TransactionManager =====

TransactionManager::TransactionManager(const AdapterRegistry& adapters,
                                       config::EngineConfig::TransactionConfig cfg)
    : adapters_(adapters), cfg_(std::move(cfg)), log_(cfg_.decision_log_path) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  std::chrono::system_clock::now().time_since_epoch()).count();
    id_prefix_ = "txn-" + std::to_string(ms) + "-";
}

TransactionManager::TransactionId TransactionManager::generateTransactionId() {
    return id_prefix_ + std::to_string(next_transaction_id_.fetch_add(1));
}

std::vector<std::string> TransactionManager::participantNames(const Transaction& txn) {
    std::vector<std::string> names;
    for (const auto& p : txn.participants_) names.push_back(p.adapter->name());
    return names;
}

std::pair<Status, TransactionManager::TransactionId> TransactionManager::begin() {
    std::vector<Participant> participants;
    for (const auto& adapter : adapters_.all()) {
        try {
            participants.push_back(Participant{adapter, adapter->beginTransaction()});
        } catch (const std::exception& e) {
            QUANTA_ERROR("beginTransaction failed on {}: {}", adapter->name(), e.what());
            for (auto& p : participants) {
                try {
                    p.adapter->rollback(*p.handle);
                } catch (const std::exception& re) {
                    QUANTA_ERROR("rollback of {} after failed begin failed: {}", p.adapter->name(), re.what());
                }
            }
            return {Status::EngineError(adapter->name(), std::string("beginTransaction failed: ") + e.what()), ""};
        }
    }

    TransactionId id = generateTransactionId();
    auto txn = std::make_shared<Transaction>(id, std::move(participants));
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        active_transactions_[id] = txn;
    }
    total_begun_++;
    QUANTA_INFO("Transaction {} begun ({} participant(s))", id, txn->participants_.size());
    return {Status::OK(), id};
}

std::shared_ptr<TransactionManager::Transaction> TransactionManager::get(const TransactionId& id) const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = active_transactions_.find(id);
    return it == active_transactions_.end() ? nullptr : it->second;
}

void TransactionManager::removeActive(const TransactionId& id) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    active_transactions_.erase(id);
}

std::vector<std::string> TransactionManager::rollbackAll(Transaction& txn) {
    std::vector<std::string> failures;
    for (auto& p : txn.participants_) {
        try {
            p.adapter->rollback(*p.handle);
        } catch (const std::exception& e) {
            QUANTA_ERROR("Transaction {}: rollback failed on {}: {}", txn.id_, p.adapter->name(), e.what());
            failures.push_back(p.adapter->name() + ": " + e.what());
        }
    }
    return failures;
}

Status TransactionManager::commit(const TransactionId& id) {
    auto txn = get(id);
    if (!txn) return Status::TransactionError("unknown transaction '" + id + "'");

    std::lock_guard<std::mutex> lock(txn->mu_);
    if (txn->state_ != State::Active) {
        return Status::TransactionError("transaction '" + id + "' is " + stateName(txn->state_));
    }

    // Phase 1
    txn->state_ = State::Preparing;
    Status failure;
    for (auto& p : txn->participants_) {
        try {
            p.adapter->prepareCommit(*p.handle);
        } catch (const std::exception& e) {
            failure = Status::TransactionError("prepareCommit failed on " + p.adapter->name() + ": " + e.what());
            failure.engine = p.adapter->name();
            break;
        }
    }
    const auto names = participantNames(*txn);
    if (failure.ok && !log_.append(id, "prepared", names)) {
        failure = Status::TransactionError("cannot record prepare of '" + id + "' in the decision log");
    }
    if (failure.ok && !log_.append(id, "commit", names)) {
        failure = Status::TransactionError("cannot record commit decision of '" + id + "' in the decision log");
    }

    if (!failure.ok) {
        txn->state_ = State::Aborting;
        QUANTA_WARN("Transaction {} aborting: {}", id, failure.message);
        if (!log_.append(id, "abort", names)) {
            QUANTA_ERROR("Transaction {}: abort decision not recorded", id);
        }
        auto rollback_failures = rollbackAll(*txn);
        for (const auto& f : rollback_failures) failure.message += "; rollback failed on " + f;
        txn->state_ = State::RolledBack;
        removeActive(id);
        total_rolled_back_++;
        return failure;
    }

    // Phase 2. The decision is durable; failures from here on leave the transaction in doubt.
    std::vector<std::string> commit_failures;
    for (auto& p : txn->participants_) {
        try {
            p.adapter->commit(*p.handle);
        } catch (const std::exception& e) {
            QUANTA_ERROR("Transaction {}: commit failed on {}: {}", id, p.adapter->name(), e.what());
            commit_failures.push_back(p.adapter->name() + ": " + e.what());
        }
    }
    txn->state_ = State::Committed;
    removeActive(id);

    if (!commit_failures.empty()) {
        std::string msg = "transaction '" + id + "' is in doubt; commit failed on ";
        for (size_t i = 0; i < commit_failures.size(); ++i) msg += (i ? ", " : "") + commit_failures[i];
        return Status::TransactionError(msg);
    }
    if (!log_.append(id, "end", names)) {
        QUANTA_ERROR("Transaction {}: end record not written", id);
    }
    total_committed_++;
    QUANTA_INFO("Transaction {} committed", id);
    return Status::OK();
}

Status TransactionManager::rollback(const TransactionId& id) {
    auto txn = get(id);
    if (!txn) return Status::TransactionError("unknown transaction '" + id + "'");

    std::lock_guard<std::mutex> lock(txn->mu_);
    txn->state_ = State::Aborting;
    if (!log_.append(id, "abort", participantNames(*txn))) {
        QUANTA_ERROR("Transaction {}: abort decision not recorded", id);
    }
    auto failures = rollbackAll(*txn);
    txn->state_ = State::RolledBack;
    removeActive(id);
    total_rolled_back_++;
    QUANTA_INFO("Transaction {} rolled back", id);

    if (!failures.empty()) {
        std::string msg = "rollback of '" + id + "' failed on ";
        for (size_t i = 0; i < failures.size(); ++i) msg += (i ? ", " : "") + failures[i];
        return Status::TransactionError(msg);
    }
    return Status::OK();
}

TransactionManager::Stats TransactionManager::getStats() const {
    Stats s;
    s.begun = total_begun_.load();
    s.committed = total_committed_.load();
    s.rolled_back = total_rolled_back_.load();
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    s.active = active_transactions_.size();
    return s;
}

std::vector<TransactionManager::TransactionId> TransactionManager::recoverInDoubt() const {
    auto in_doubt = log_.inDoubt();
    for (const auto& id : in_doubt) {
        QUANTA_CRITICAL("Transaction {} has a commit decision but no completion record; "
                        "backends may be inconsistent", id);
    }
    return in_doubt;
}

} // namespace quanta
