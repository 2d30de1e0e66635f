#pragma once

#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "config/engine_config.h"
#include "query/engine_translator.h"
#include "query/logical_plan.h"
#include "query/physical_plan.h"

namespace quanta {
namespace query {

/**
 * Turns an optimized logical tree into fragments plus a physical operator tree.
 *
 * Every Scan becomes one fragment and every Navigate one traversal fragment on the
 * relation engine. Key sets flow along dependencies: a binding's filtered scans
 * restrict its key set, its other scans are key lookups on that set, and a
 * traversal reads the keys of its source binding. Fragments whose inputs are
 * complete share a wave and run in parallel.
 */
class PhysicalPlanner {
public:
    PhysicalPlanner(config::EngineConfig::PlannerConfig cfg, const TranslatorSet& translators)
        : cfg_(cfg), translators_(translators) {}

    PhysicalPlan plan(const LogicalNode& root, const AnalyzedFind& find) const;

    /// One insert per engine that receives values; the scalar row always exists
    WritePlan planInsert(const AnalyzedAdd& add, const nlohmann::json& key) const;
    WritePlan planUpdate(const AnalyzedUpdate& update, const std::vector<nlohmann::json>& keys) const;
    WritePlan planRemove(const AnalyzedRemove& remove, const std::vector<nlohmann::json>& keys) const;

private:
    struct BuildState {
        const AnalyzedFind* find = nullptr;
        PhysicalPlan plan;
        std::map<std::string, std::vector<KeyInput>> key_sources;   // per binding
    };

    config::EngineConfig::PlannerConfig cfg_;
    const TranslatorSet& translators_;

    PhysicalNodePtr convert(const LogicalNode& node, BuildState& state) const;
    PhysicalNodePtr convertBinding(const LogicalNode& subtree, const std::string& binding,
                                   const std::vector<KeyInput>& entry, BuildState& state) const;
    PhysicalNodePtr mirrorBinding(const LogicalNode& node, const std::map<const ScanOp*, int>& fragment_of,
                                  const PhysicalPlan& plan) const;

    int addFragment(Fragment fragment, BuildState& state) const;
    WritePlan translateWrites(WritePlan plan) const;
    JoinAlgorithm chooseJoin(double left, double right) const;
    void finishModes(PhysicalNode& node, const PhysicalPlan& plan) const;
};

} // namespace query
} // namespace quanta
