#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "query/engine_translator.h"
#include "query/logical_plan.h"

namespace quanta {
namespace query {

/**
 * Rewrites the logical tree of a FIND. Passes run in a fixed order:
 *
 *   1. predicate pushdown     single-binding, single-engine conjuncts go into their Scan
 *                             when the engine's translator can express them
 *   2. projection pruning     scans lose attributes nobody reads; empty scans disappear
 *   3. navigation ordering    independent NAVIGATE steps, cheapest estimate first
 *   4. client-side detection  every Filter still in the tree is evaluated by the assembler
 *
 * Estimates are recomputed after each pass.
 */
class QueryOptimizer {
public:
    struct PassReport {
        std::string name;
        bool changed = false;
        std::vector<std::string> details;   // for EXPLAIN
    };

    struct Plan {
        LogicalNodePtr root;
        std::vector<PassReport> passes;

        nlohmann::json passesToJSON() const;
    };

    QueryOptimizer(const LogicalPlanner& planner, const TranslatorSet& translators)
        : planner_(planner), translators_(translators) {}

    Plan optimize(LogicalNodePtr root, const AnalyzedFind& find) const;

    PassReport pushDownPredicates(LogicalNodePtr& root) const;
    PassReport pruneAttributes(LogicalNodePtr& root, const AnalyzedFind& find) const;
    PassReport orderNavigations(LogicalNodePtr& root, const AnalyzedFind& find) const;
    PassReport markClientSideFilters(LogicalNode& root) const;

private:
    const LogicalPlanner& planner_;
    const TranslatorSet& translators_;
};

} // namespace query
} // namespace quanta
