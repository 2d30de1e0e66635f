#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "query/ast.h"
#include "schema/record_schema.h"

namespace quanta {

enum class NativeOperation { Select, Traverse, Insert, Update, Delete };

/// What each returned row looks like
enum class ResultShape {
    Rows,          // scalar: flat rows
    Documents,     // document: nested objects
    Paths,         // relation: {source, target} pairs
    Points         // metric: per-key sample series
};

const char* nativeOperationName(NativeOperation op);
const char* resultShapeName(ResultShape shape);

/**
 * One request for one backend, as produced by an engine translator.
 *
 * `text` and `params` are the backend's own dialect. The structured fields describe
 * the same request for adapters that do not parse the dialect (and for tests).
 * Key sets are only known at run time: the translator reserves `key_param` and the
 * coordinator fills it through bindKeys().
 */
struct NativeQuery {
    StorageClass engine = StorageClass::Scalar;
    NativeOperation operation = NativeOperation::Select;
    std::string text;
    nlohmann::json params = nlohmann::json::array();
    std::optional<size_t> key_param;
    ResultShape shape = ResultShape::Rows;
    std::vector<std::string> columns;

    std::string bucket;
    std::string record;
    std::string binding;
    std::string key_column;
    std::vector<std::string> attributes;
    std::vector<query::ExprPtr> predicates;
    std::optional<std::vector<nlohmann::json>> keys;
    std::string relation_attribute;
    std::vector<query::OrderItem> order_by;
    nlohmann::json values;

    void bindKeys(std::vector<nlohmann::json> key_set);
    nlohmann::json toJSON() const;
};

} // namespace quanta
