#pragma once

#include <array>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace quanta {

/// Storage classification of an attribute. This is the routing key of the whole pipeline:
/// exactly one backend owns each attribute.
enum class StorageClass {
    Scalar = 0,     // relational store
    Document = 1,   // document store
    Relation = 2,   // graph store
    Metric = 3      // time-series store
};

constexpr size_t kStorageClassCount = 4;
constexpr std::array<StorageClass, kStorageClassCount> kAllStorageClasses = {
    StorageClass::Scalar, StorageClass::Document, StorageClass::Relation, StorageClass::Metric};

const char* storageClassName(StorageClass cls);                          // "scalar", ...
std::optional<StorageClass> storageClassFromString(const std::string& s); // case-insensitive

/// Semantic category of a datatype hint, used for type checking
enum class ValueType {
    Any,        // no hint, or an opaque one
    String,
    Integer,
    Number,
    Boolean,
    DateTime
};

ValueType valueTypeFromHint(const std::optional<std::string>& datatype);
const char* valueTypeName(ValueType type);

struct AttributeDefinition {
    StorageClass type = StorageClass::Scalar;
    std::optional<std::string> datatype;   // native datatype hint (SCALAR<UUID>)
    std::optional<std::string> target;     // RELATION<users>
    std::optional<std::string> unit;       // METRIC<COUNT>
    bool indexed = false;
    bool primary_key = false;

    ValueType valueType() const;
    nlohmann::json toJSON() const;
};

/// A record name plus its attributes in declaration order. Attribute names are unique.
class RecordSchema {
public:
    using Attribute = std::pair<std::string, AttributeDefinition>;

    RecordSchema() = default;
    explicit RecordSchema(std::string record) : record_(std::move(record)) {}

    const std::string& name() const { return record_; }
    const std::vector<Attribute>& attributes() const { return attributes_; }

    const AttributeDefinition* find(const std::string& attribute) const;
    bool has(const std::string& attribute) const { return find(attribute) != nullptr; }

    /// Appends an attribute; false if the name is already taken
    bool add(std::string attribute, AttributeDefinition def);

    /// The key attribute shared by every backend row of this record
    const std::string& keyAttribute() const { return key_attribute_; }
    void setKeyAttribute(std::string attribute) { key_attribute_ = std::move(attribute); }

    /// Attributes owned by one storage class, in declaration order
    std::vector<std::string> attributesOf(StorageClass cls) const;
    bool usesEngine(StorageClass cls) const;

    nlohmann::json toJSON() const;

private:
    std::string record_;
    std::vector<Attribute> attributes_;
    std::string key_attribute_ = "id";
};

/// Input of record creation. Kept as an ordered list so that repeated names can be reported.
struct RecordSpec {
    std::string record;
    std::vector<std::pair<std::string, AttributeDefinition>> attributes;

    /// {"record": "users", "attributes": {"id": {"type": "scalar", "datatype": "UUID"}, ...}}
    static RecordSpec fromJSON(const nlohmann::json& j);
};

struct BucketInfo {
    std::string name;
    std::vector<std::string> records;

    nlohmann::json toJSON() const {
        return {{"name", name}, {"records", records}};
    }
};

} // namespace quanta
