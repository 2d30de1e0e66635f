#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>

#include "query/ast.h"

namespace quanta {
namespace query {

/// Precomputed aggregate results of one group, keyed by canonical expression text
using AggregateValues = std::unordered_map<std::string, nlohmann::json>;

/**
 * Evaluates analyzed expressions over a tuple: a JSON object mapping each binding
 * to its merged row ({"tasks": {...}, "users": {...}}).
 *
 * NULL handling follows SQL loosely: comparisons against NULL are false except
 * `= NULL` / `!= NULL`, arithmetic with NULL yields NULL, NULL is not truthy.
 * A metric attribute evaluates to the value of its latest sample.
 */
class ExpressionEvaluator {
public:
    static nlohmann::json evaluate(const ExprPtr& expr, const nlohmann::json& tuple,
                                   const AggregateValues* aggregates = nullptr);

    /// evaluate() followed by isTruthy()
    static bool test(const ExprPtr& expr, const nlohmann::json& tuple,
                     const AggregateValues* aggregates = nullptr);

    static bool isTruthy(const nlohmann::json& value);

    /// Three-way comparison; nullopt if the values are not comparable.
    /// ISO date-time strings compare chronologically.
    static std::optional<int> compare(const nlohmann::json& a, const nlohmann::json& b);
    static bool equals(const nlohmann::json& a, const nlohmann::json& b);

    /// Total order used for sorting: NULL first, then by compare(), then by dump()
    static bool sortLess(const nlohmann::json& a, const nlohmann::json& b);

    static nlohmann::json resolve(const ResolvedAttribute& attr, const nlohmann::json& tuple);
};

} // namespace query
} // namespace quanta
