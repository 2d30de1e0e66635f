#include "transaction/decision_log.h"
#include "utils/logger.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>

namespace quanta {

DecisionLog::DecisionLog(std::string path) : path_(std::move(path)) {
    if (path_.empty()) return;
    std::error_code ec;
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent, ec);
    if (ec) {
        QUANTA_ERROR("Decision log: cannot create directory {}: {}", parent.string(), ec.message());
    }
}

bool DecisionLog::append(const std::string& txn_id, const std::string& event,
                         const std::vector<std::string>& engines) {
    nlohmann::json line = {
        {"txn", txn_id},
        {"event", event},
        {"ts", std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::system_clock::now().time_since_epoch()).count()},
        {"engines", engines}};

    std::lock_guard<std::mutex> lock(mu_);
    if (path_.empty()) {
        memory_.push_back(std::move(line));
        return true;
    }

    std::ofstream ofs(path_, std::ios::app | std::ios::binary);
    if (!ofs) {
        QUANTA_ERROR("Decision log: cannot open {}", path_);
        return false;
    }
    ofs << line.dump() << "\n";
    ofs.flush();
    if (!ofs) {
        QUANTA_ERROR("Decision log: write to {} failed", path_);
        return false;
    }
    return true;
}

std::vector<nlohmann::json> DecisionLog::entries() const {
    std::lock_guard<std::mutex> lock(mu_);
    if (path_.empty()) return memory_;

    std::vector<nlohmann::json> out;
    std::ifstream ifs(path_);
    std::string line;
    size_t line_no = 0;
    while (std::getline(ifs, line)) {
        ++line_no;
        if (line.empty()) continue;
        auto parsed = nlohmann::json::parse(line, nullptr, false);
        if (parsed.is_discarded()) {
            // torn final line after a crash
            QUANTA_WARN("Decision log: skipping malformed line {} of {}", line_no, path_);
            continue;
        }
        out.push_back(std::move(parsed));
    }
    return out;
}

std::vector<std::string> DecisionLog::inDoubt() const {
    std::map<std::string, std::string> last_decision;   // txn -> "commit" | "end" | ...
    std::vector<std::string> order;
    for (const auto& e : entries()) {
        std::string txn = e.value("txn", "");
        std::string event = e.value("event", "");
        if (txn.empty()) continue;
        if (!last_decision.count(txn)) order.push_back(txn);
        if (event == "commit" || event == "end" || event == "abort") {
            last_decision[txn] = event;
        } else {
            last_decision.emplace(txn, event);
        }
    }
    std::vector<std::string> out;
    for (const auto& txn : order) {
        if (last_decision[txn] == "commit") out.push_back(txn);
    }
    return out;
}

} // namespace quanta
