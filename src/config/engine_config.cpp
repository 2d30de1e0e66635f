#include "config/engine_config.h"
#include "utils/logger.h"
#include <yaml-cpp/yaml.h>

namespace quanta {
namespace config {

namespace {

EngineConfig fromYamlNode(const YAML::Node& root) {
    EngineConfig result;
    YAML::Node config = root["quanta"] ? root["quanta"] : root;

    if (config["logging"]) {
        auto logging = config["logging"];
        result.logging.level = logging["level"].as<std::string>(result.logging.level);
        result.logging.file = logging["file"].as<std::string>(result.logging.file);
    }

    if (config["planner"]) {
        auto planner = config["planner"];
        auto& p = result.planner;
        p.default_scan_cardinality = planner["default_scan_cardinality"].as<double>(p.default_scan_cardinality);
        p.relation_fanout = planner["relation_fanout"].as<double>(p.relation_fanout);
        p.eq_selectivity = planner["eq_selectivity"].as<double>(p.eq_selectivity);
        p.range_selectivity = planner["range_selectivity"].as<double>(p.range_selectivity);
        p.indexed_selectivity_factor = planner["indexed_selectivity_factor"].as<double>(p.indexed_selectivity_factor);
        p.nested_loop_threshold = planner["nested_loop_threshold"].as<size_t>(p.nested_loop_threshold);
    }

    if (config["execution"]) {
        auto execution = config["execution"];
        auto& e = result.execution;
        e.query_timeout = std::chrono::milliseconds(
            execution["query_timeout_ms"].as<long long>(e.query_timeout.count()));
        e.allow_partial_results = execution["allow_partial_results"].as<bool>(e.allow_partial_results);
        e.default_page_size = execution["default_page_size"].as<size_t>(e.default_page_size);
    }

    if (config["transaction"]) {
        auto txn = config["transaction"];
        auto& t = result.transaction;
        t.implicit_for_multi_engine_writes =
            txn["implicit_for_multi_engine_writes"].as<bool>(t.implicit_for_multi_engine_writes);
        t.decision_log_path = txn["decision_log_path"].as<std::string>(t.decision_log_path);
    }

    return result;
}

} // namespace

EngineConfig EngineConfig::loadFromYaml(const std::string& yaml_path) {
    try {
        YAML::Node root = YAML::LoadFile(yaml_path);
        auto cfg = fromYamlNode(root);
        QUANTA_INFO("Loaded engine configuration from {}", yaml_path);
        return cfg;
    } catch (const YAML::Exception& e) {
        QUANTA_ERROR("Failed to load engine configuration from {}: {}", yaml_path, e.what());
        return defaults();
    }
}

EngineConfig EngineConfig::loadFromYamlString(const std::string& yaml_text) {
    try {
        return fromYamlNode(YAML::Load(yaml_text));
    } catch (const YAML::Exception& e) {
        QUANTA_ERROR("Failed to parse engine configuration: {}", e.what());
        return defaults();
    }
}

json EngineConfig::toJson() const {
    json j;
    j["logging"]["level"] = logging.level;
    j["logging"]["file"] = logging.file;

    j["planner"]["default_scan_cardinality"] = planner.default_scan_cardinality;
    j["planner"]["relation_fanout"] = planner.relation_fanout;
    j["planner"]["eq_selectivity"] = planner.eq_selectivity;
    j["planner"]["range_selectivity"] = planner.range_selectivity;
    j["planner"]["indexed_selectivity_factor"] = planner.indexed_selectivity_factor;
    j["planner"]["nested_loop_threshold"] = planner.nested_loop_threshold;

    j["execution"]["query_timeout_ms"] = execution.query_timeout.count();
    j["execution"]["allow_partial_results"] = execution.allow_partial_results;
    j["execution"]["default_page_size"] = execution.default_page_size;

    j["transaction"]["implicit_for_multi_engine_writes"] = transaction.implicit_for_multi_engine_writes;
    j["transaction"]["decision_log_path"] = transaction.decision_log_path;
    return j;
}

} // namespace config
} // namespace quanta
