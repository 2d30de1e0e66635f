#pragma once

#include <chrono>
#include <string>
#include <nlohmann/json.hpp>

namespace quanta {
namespace config {

using json = nlohmann::json;

/**
 * @brief Runtime configuration of the federated query engine
 *
 * Loaded from the `quanta:` section of a YAML file. Every key is optional and
 * falls back to the defaults below.
 */
struct EngineConfig {
    struct LoggingConfig {
        std::string level = "info";
        std::string file = "quanta.log";
    } logging;

    // Heuristic cost model. Only the relative ordering of estimates matters.
    struct PlannerConfig {
        double default_scan_cardinality = 1000.0;      // unfiltered scan of one record
        double relation_fanout = 3.0;                  // targets per source row on NAVIGATE
        double eq_selectivity = 0.1;
        double range_selectivity = 0.33;
        double indexed_selectivity_factor = 0.1;       // applied on top when the attribute is INDEXED
        size_t nested_loop_threshold = 64;             // below this (either side) joins use nested loop
    } planner;

    struct ExecutionConfig {
        std::chrono::milliseconds query_timeout{15000};
        bool allow_partial_results = false;            // default for requests that do not say
        size_t default_page_size = 100;
    } execution;

    struct TransactionConfig {
        bool implicit_for_multi_engine_writes = true;
        std::string decision_log_path = "data/quanta_txn_decisions.jsonl";
    } transaction;

    static EngineConfig defaults() { return EngineConfig{}; }

    /// Returns defaults (and logs) if the file cannot be read or parsed
    static EngineConfig loadFromYaml(const std::string& yaml_path);

    /// Same as loadFromYaml but from an in-memory document
    static EngineConfig loadFromYamlString(const std::string& yaml_text);

    json toJson() const;
};

} // namespace config
} // namespace quanta
