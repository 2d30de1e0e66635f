#include "schema/record_schema.h"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace quanta {

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

const char* storageClassName(StorageClass cls) {
    switch (cls) {
        case StorageClass::Scalar: return "scalar";
        case StorageClass::Document: return "document";
        case StorageClass::Relation: return "relation";
        case StorageClass::Metric: return "metric";
    }
    return "scalar";
}

std::optional<StorageClass> storageClassFromString(const std::string& s) {
    auto lower = toLower(s);
    if (lower == "scalar") return StorageClass::Scalar;
    if (lower == "document") return StorageClass::Document;
    if (lower == "relation") return StorageClass::Relation;
    if (lower == "metric") return StorageClass::Metric;
    return std::nullopt;
}

ValueType valueTypeFromHint(const std::optional<std::string>& datatype) {
    if (!datatype) return ValueType::Any;
    auto hint = toLower(*datatype);
    if (hint == "string" || hint == "text" || hint == "uuid") return ValueType::String;
    if (hint == "int" || hint == "integer" || hint == "bigint") return ValueType::Integer;
    if (hint == "float" || hint == "double" || hint == "decimal" || hint == "number") return ValueType::Number;
    if (hint == "bool" || hint == "boolean") return ValueType::Boolean;
    if (hint == "date" || hint == "timestamp" || hint == "datetime") return ValueType::DateTime;
    return ValueType::Any;
}

const char* valueTypeName(ValueType type) {
    switch (type) {
        case ValueType::Any: return "any";
        case ValueType::String: return "string";
        case ValueType::Integer: return "integer";
        case ValueType::Number: return "number";
        case ValueType::Boolean: return "boolean";
        case ValueType::DateTime: return "datetime";
    }
    return "any";
}

ValueType AttributeDefinition::valueType() const {
    // Metric samples are numeric regardless of the unit hint
    if (type == StorageClass::Metric) return ValueType::Number;
    if (type == StorageClass::Relation) return ValueType::Any;
    return valueTypeFromHint(datatype);
}

nlohmann::json AttributeDefinition::toJSON() const {
    nlohmann::json j = {{"type", storageClassName(type)}};
    if (datatype) j["datatype"] = *datatype;
    if (target) j["target"] = *target;
    if (unit) j["unit"] = *unit;
    if (indexed) j["indexed"] = true;
    if (primary_key) j["primary_key"] = true;
    return j;
}

const AttributeDefinition* RecordSchema::find(const std::string& attribute) const {
    for (const auto& [name, def] : attributes_) {
        if (name == attribute) return &def;
    }
    return nullptr;
}

bool RecordSchema::add(std::string attribute, AttributeDefinition def) {
    if (has(attribute)) return false;
    attributes_.emplace_back(std::move(attribute), std::move(def));
    return true;
}

std::vector<std::string> RecordSchema::attributesOf(StorageClass cls) const {
    std::vector<std::string> names;
    for (const auto& [name, def] : attributes_) {
        if (def.type == cls) names.push_back(name);
    }
    return names;
}

bool RecordSchema::usesEngine(StorageClass cls) const {
    return std::any_of(attributes_.begin(), attributes_.end(),
                       [cls](const Attribute& a) { return a.second.type == cls; });
}

nlohmann::json RecordSchema::toJSON() const {
    nlohmann::json attrs = nlohmann::json::object();
    for (const auto& [name, def] : attributes_) {
        attrs[name] = def.toJSON();
    }
    return {{"record", record_}, {"key", key_attribute_}, {"attributes", attrs}};
}

namespace {

AttributeDefinition definitionFromJSON(const std::string& name, const nlohmann::json& j) {
    AttributeDefinition def;
    std::string type = j.is_string() ? j.get<std::string>() : j.value("type", "");
    auto cls = storageClassFromString(type);
    if (!cls) {
        throw std::invalid_argument("attribute '" + name + "' has unknown type '" + type + "'");
    }
    def.type = *cls;
    if (j.is_object()) {
        if (j.contains("datatype")) def.datatype = j["datatype"].get<std::string>();
        if (j.contains("target")) def.target = j["target"].get<std::string>();
        if (j.contains("unit")) def.unit = j["unit"].get<std::string>();
        def.indexed = j.value("indexed", false);
        def.primary_key = j.value("primary_key", false);
    }
    return def;
}

} // namespace

RecordSpec RecordSpec::fromJSON(const nlohmann::json& j) {
    RecordSpec spec;
    spec.record = j.at("record").get<std::string>();
    const auto& attrs = j.at("attributes");
    if (attrs.is_array()) {
        for (const auto& a : attrs) {
            std::string name = a.at("name").get<std::string>();
            spec.attributes.emplace_back(name, definitionFromJSON(name, a));
        }
    } else {
        for (auto it = attrs.begin(); it != attrs.end(); ++it) {
            spec.attributes.emplace_back(it.key(), definitionFromJSON(it.key(), it.value()));
        }
    }
    return spec;
}

} // namespace quanta
