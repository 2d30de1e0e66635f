#pragma once

#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "query/execution_coordinator.h"
#include "query/expression_evaluator.h"
#include "query/physical_plan.h"

namespace quanta {
namespace query {

/**
 * Builds the response of a FIND from the fragment results.
 *
 * Walks the physical tree bottom-up over tuples ({binding: merged row}): merges a
 * binding's engine rows on the record key, joins NAVIGATE steps through the traversal
 * pairs, then applies what the engines could not do (client-side filters, aggregation,
 * sort, limit) and normalizes the projected values.
 */
class ResultAssembler {
public:
    explicit ResultAssembler(size_t default_page_size = 100) : default_page_size_(default_page_size) {}

    struct Row {
        nlohmann::json tuple = nlohmann::json::object();
        AggregateValues aggregates;
    };

    /// {data, metadata, engines}
    nlohmann::json assemble(const PhysicalPlan& plan, const AnalyzedFind& find,
                            const ExecutionResult& execution, double elapsed_ms) const;

    /// Tuples below the projection (exposed for tests)
    std::vector<Row> evaluate(const PhysicalPlan& plan, const AnalyzedFind& find,
                              const ExecutionResult& execution) const;

    /// Aggregate results for one group of tuples
    static AggregateValues computeAggregates(const std::vector<ExprPtr>& aggregates,
                                             const std::vector<const nlohmann::json*>& group);

private:
    struct BindingRows {
        std::vector<std::string> order;                 // key.dump() in first-seen order
        std::map<std::string, nlohmann::json> rows;
        bool defines_keys = false;
    };

    struct Context {
        const PhysicalPlan& plan;
        const AnalyzedFind& find;
        const ExecutionResult& execution;
        size_t total_count = 0;
        bool counted = false;
    };

    size_t default_page_size_;

    std::vector<Row> run(const PhysicalNode& node, Context& ctx) const;
    BindingRows bindingRows(const PhysicalNode& node, Context& ctx) const;
    std::vector<Row> navigate(const PhysicalJoin& join, std::vector<Row> left, Context& ctx) const;
    std::vector<Row> aggregate(const PhysicalAggregate& agg, std::vector<Row> input) const;
    nlohmann::json project(const std::vector<OutputColumn>& columns, const Row& row) const;
};

} // namespace query
} // namespace quanta
