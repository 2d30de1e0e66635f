#include "engine/native_query.h"

namespace quanta {

const char* nativeOperationName(NativeOperation op) {
    switch (op) {
        case NativeOperation::Select: return "select";
        case NativeOperation::Traverse: return "traverse";
        case NativeOperation::Insert: return "insert";
        case NativeOperation::Update: return "update";
        case NativeOperation::Delete: return "delete";
    }
    return "select";
}

const char* resultShapeName(ResultShape shape) {
    switch (shape) {
        case ResultShape::Rows: return "rows";
        case ResultShape::Documents: return "documents";
        case ResultShape::Paths: return "paths";
        case ResultShape::Points: return "points";
    }
    return "rows";
}

void NativeQuery::bindKeys(std::vector<nlohmann::json> key_set) {
    if (key_param && *key_param < params.size()) {
        params[*key_param] = key_set;
    }
    keys = std::move(key_set);
}

nlohmann::json NativeQuery::toJSON() const {
    nlohmann::json j = {{"engine", storageClassName(engine)},
                        {"operation", nativeOperationName(operation)},
                        {"text", text},
                        {"params", params},
                        {"shape", resultShapeName(shape)},
                        {"columns", columns}};
    if (key_param) j["key_param"] = *key_param;
    if (keys) j["key_count"] = keys->size();
    return j;
}

} // namespace quanta
