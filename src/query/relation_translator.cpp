#include "query/relation_translator.h"
#include <sstream>

namespace quanta {
namespace query {

namespace {

using json = nlohmann::json;

std::string label(const std::string& name) {
    std::string out = "`";
    for (char c : name) {
        if (c == '`') out += '`';
        out += c;
    }
    return out + "`";
}

std::string paramRef(size_t index) {
    return "$p" + std::to_string(index);
}

} // namespace

NativeQuery RelationTranslator::translate(const Fragment& fragment) const {
    NativeQuery q = describe(fragment, ResultShape::Paths);
    std::ostringstream cypher;

    q.params.push_back(fragment.bucket);
    cypher << "MATCH (s:" << label(fragment.record) << " {bucket: " << paramRef(0) << "})";

    if (fragment.kind == FragmentKind::Traverse) {
        cypher << "-[:" << label(fragment.relation_attribute) << "]->(t)";
        if (!fragment.key_inputs.empty()) {
            q.key_param = q.params.size();
            q.params.push_back(json::array());
            cypher << " WHERE s.key IN " << paramRef(*q.key_param);
        }
        cypher << " RETURN s.key AS source, t.key AS target";
        q.text = cypher.str();
        return q;
    }

    // relation attributes read as lists of target keys
    q.shape = ResultShape::Rows;
    if (!fragment.key_inputs.empty()) {
        q.key_param = q.params.size();
        q.params.push_back(json::array());
        cypher << " WHERE s.key IN " << paramRef(*q.key_param);
    }
    for (size_t i = 0; i < fragment.attributes.size(); ++i) {
        cypher << " OPTIONAL MATCH (s)-[:" << label(fragment.attributes[i]) << "]->(t" << i << ")";
    }
    cypher << " RETURN s.key AS " << label(fragment.key_attribute);
    for (size_t i = 0; i < fragment.attributes.size(); ++i) {
        cypher << ", collect(DISTINCT t" << i << ".key) AS " << label(fragment.attributes[i]);
    }
    q.text = cypher.str();
    return q;
}

NativeQuery RelationTranslator::translateWrite(const WriteFragment& fragment) const {
    NativeQuery q = describe(fragment);
    q.shape = ResultShape::Paths;
    std::ostringstream cypher;
    q.params.push_back(fragment.bucket);

    auto writeEdges = [&]() {
        bool first = true;
        for (auto it = fragment.values.begin(); it != fragment.values.end(); ++it) {
            if (it.key() == fragment.key_attribute) continue;
            json targets = it.value().is_array() ? it.value() : json::array({it.value()});
            size_t targets_param = q.params.size();
            q.params.push_back(targets);
            if (!first) cypher << " WITH s";
            first = false;
            if (fragment.operation == NativeOperation::Update) {
                cypher << " OPTIONAL MATCH (s)-[old:" << label(it.key()) << "]->() DELETE old WITH s";
            }
            cypher << " UNWIND " << paramRef(targets_param) << " AS target"
                   << " MERGE (t {bucket: " << paramRef(0) << ", key: target})"
                   << " MERGE (s)-[:" << label(it.key()) << "]->(t)";
        }
    };

    switch (fragment.operation) {
        case NativeOperation::Insert: {
            size_t key_index = q.params.size();
            q.params.push_back(fragment.values.value(fragment.key_attribute, json()));
            cypher << "MERGE (s:" << label(fragment.record) << " {bucket: " << paramRef(0)
                   << ", key: " << paramRef(key_index) << "})";
            writeEdges();
            break;
        }
        case NativeOperation::Update: {
            q.key_param = q.params.size();
            q.params.push_back(fragment.keys);
            cypher << "MATCH (s:" << label(fragment.record) << " {bucket: " << paramRef(0) << "})"
                   << " WHERE s.key IN " << paramRef(*q.key_param);
            writeEdges();
            break;
        }
        default:
            q.key_param = q.params.size();
            q.params.push_back(fragment.keys);
            cypher << "MATCH (s:" << label(fragment.record) << " {bucket: " << paramRef(0) << "})"
                   << " WHERE s.key IN " << paramRef(*q.key_param) << " DETACH DELETE s";
            break;
    }
    q.text = cypher.str();
    return q;
}

} // namespace query
} // namespace quanta
