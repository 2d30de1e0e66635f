#pragma once

#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace quanta {

/**
 * @brief Write-ahead record of the coordinator's own 2PC decisions
 *
 * JSON lines: {"txn", "event", "ts", "engines"}, event one of
 * "prepared" | "commit" | "abort" | "end". Every append is flushed before it
 * returns, so a "commit" line exists before any backend sees a commit.
 * An empty path keeps the log in memory only.
 */
class DecisionLog {
public:
    explicit DecisionLog(std::string path);

    /// false if the line could not be written durably
    bool append(const std::string& txn_id, const std::string& event,
                const std::vector<std::string>& engines = {});

    /// All entries in append order
    std::vector<nlohmann::json> entries() const;

    /// Transactions with a "commit" decision but no "end": some backend may not have committed
    std::vector<std::string> inDoubt() const;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    mutable std::mutex mu_;
    std::vector<nlohmann::json> memory_;
};

} // namespace quanta
