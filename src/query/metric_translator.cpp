#include "query/metric_translator.h"
#include "query/value_normalizer.h"
#include <sstream>

namespace quanta {
namespace query {

namespace {

using json = nlohmann::json;

std::string fluxString(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        if (c == '"' || c == '\\') out += '\\';
        out += c;
    }
    return out + "\"";
}

// line protocol escaping for measurement, tag and field names
std::string lpEscape(const std::string& s) {
    std::string out;
    for (char c : s) {
        if (c == ',' || c == ' ' || c == '=') out += '\\';
        out += c;
    }
    return out;
}

std::string keyText(const json& key) {
    return key.is_string() ? key.get<std::string>() : key.dump();
}

std::string fieldValue(const json& v) {
    if (v.is_number_integer()) return std::to_string(v.get<int64_t>()) + "i";
    if (v.is_number()) return v.dump();
    if (v.is_boolean()) return v.get<bool>() ? "true" : "false";
    return fluxString(v.is_string() ? v.get<std::string>() : v.dump());
}

} // namespace

NativeQuery MetricTranslator::translate(const Fragment& fragment) const {
    NativeQuery q = describe(fragment, ResultShape::Points);
    std::ostringstream flux;

    flux << "from(bucket: " << fluxString(fragment.bucket) << ")"
         << " |> range(start: 0)"
         << " |> filter(fn: (r) => r._measurement == " << fluxString(fragment.record) << ")";

    if (!fragment.attributes.empty()) {
        flux << " |> filter(fn: (r) => ";
        for (size_t i = 0; i < fragment.attributes.size(); ++i) {
            if (i > 0) flux << " or ";
            flux << "r._field == " << fluxString(fragment.attributes[i]);
        }
        flux << ")";
    }
    if (!fragment.key_inputs.empty()) {
        q.key_param = q.params.size();
        q.params.push_back(json::array());
        flux << " |> filter(fn: (r) => contains(value: r." << fragment.key_attribute
             << ", set: params.p" << *q.key_param << "))";
    }
    flux << " |> group(columns: [" << fluxString(fragment.key_attribute) << ", \"_field\"])"
         << " |> sort(columns: [\"_time\"])";

    q.text = flux.str();
    return q;
}

NativeQuery MetricTranslator::translateWrite(const WriteFragment& fragment) const {
    NativeQuery q = describe(fragment);
    q.shape = ResultShape::Points;
    std::ostringstream out;

    if (fragment.operation == NativeOperation::Delete) {
        q.key_param = q.params.size();
        q.params.push_back(fragment.keys);
        out << "DELETE predicate: _measurement=" << fluxString(fragment.record) << " AND (";
        for (size_t i = 0; i < fragment.keys.size(); ++i) {
            if (i > 0) out << " OR ";
            out << fragment.key_attribute << "=" << fluxString(keyText(fragment.keys[i]));
        }
        out << ")";
        q.text = out.str();
        return q;
    }

    // Insert and update both append points
    std::vector<json> keys = fragment.keys;
    if (fragment.operation == NativeOperation::Insert) {
        keys = {fragment.values.value(fragment.key_attribute, json())};
    } else {
        q.key_param = q.params.size();
        q.params.push_back(fragment.keys);
    }

    bool first = true;
    for (const auto& key : keys) {
        for (auto it = fragment.values.begin(); it != fragment.values.end(); ++it) {
            if (it.key() == fragment.key_attribute) continue;
            for (const auto& sample : normalizeMetricSamples(it.value())) {
                if (!first) out << "\n";
                first = false;
                out << lpEscape(fragment.record) << "," << lpEscape(fragment.key_attribute) << "="
                    << lpEscape(keyText(key)) << " " << lpEscape(it.key()) << "=" << fieldValue(sample["value"]);
                if (!sample["time"].is_null()) {
                    out << " " << (sample["time"].is_string() ? sample["time"].get<std::string>()
                                                              : sample["time"].dump());
                }
            }
        }
    }
    q.text = out.str();
    return q;
}

} // namespace query
} // namespace quanta
