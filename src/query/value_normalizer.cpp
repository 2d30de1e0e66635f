#include "query/value_normalizer.h"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>

namespace quanta {
namespace query {

namespace {

bool readDigits(const std::string& s, size_t& pos, size_t count, int& out) {
    if (pos + count > s.size()) return false;
    int value = 0;
    for (size_t i = 0; i < count; ++i) {
        char c = s[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        value = value * 10 + (c - '0');
    }
    pos += count;
    out = value;
    return true;
}

// Howard Hinnant's civil calendar conversions
int64_t daysFromCivil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

void civilFromDays(int64_t z, int64_t& y, unsigned& m, unsigned& d) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    y = static_cast<int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp + (mp < 10 ? 3 : -9);
    y += (m <= 2);
}

double sampleTimeKey(const nlohmann::json& sample) {
    if (!sample.is_object() || !sample.contains("time")) return 0.0;
    const auto& t = sample["time"];
    if (t.is_number()) return t.get<double>();
    return 0.0;
}

std::string sampleTimeText(const nlohmann::json& sample) {
    if (!sample.is_object() || !sample.contains("time") || !sample["time"].is_string()) return "";
    return sample["time"].get<std::string>();
}

bool isSample(const nlohmann::json& v) {
    return v.is_object() && v.contains("value") && v.contains("time");
}

} // namespace

std::optional<std::string> normalizeDateTime(const std::string& text) {
    size_t pos = 0;
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (!readDigits(text, pos, 4, year)) return std::nullopt;
    if (pos >= text.size() || text[pos++] != '-') return std::nullopt;
    if (!readDigits(text, pos, 2, month)) return std::nullopt;
    if (pos >= text.size() || text[pos++] != '-') return std::nullopt;
    if (!readDigits(text, pos, 2, day)) return std::nullopt;
    if (month < 1 || month > 12 || day < 1 || day > 31) return std::nullopt;

    std::string fraction;
    int offset_minutes = 0;

    if (pos < text.size()) {
        if (text[pos] != 'T' && text[pos] != 't' && text[pos] != ' ') return std::nullopt;
        pos++;
        if (!readDigits(text, pos, 2, hour)) return std::nullopt;
        if (pos >= text.size() || text[pos++] != ':') return std::nullopt;
        if (!readDigits(text, pos, 2, minute)) return std::nullopt;
        if (pos < text.size() && text[pos] == ':') {
            pos++;
            if (!readDigits(text, pos, 2, second)) return std::nullopt;
            if (pos < text.size() && text[pos] == '.') {
                pos++;
                while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
                    fraction += text[pos++];
                }
                if (fraction.empty()) return std::nullopt;
            }
        }
        if (hour > 23 || minute > 59 || second > 60) return std::nullopt;

        if (pos < text.size()) {
            char z = text[pos];
            if (z == 'Z' || z == 'z') {
                pos++;
            } else if (z == '+' || z == '-') {
                pos++;
                int oh = 0, om = 0;
                if (!readDigits(text, pos, 2, oh)) return std::nullopt;
                if (pos < text.size() && text[pos] == ':') pos++;
                if (!readDigits(text, pos, 2, om)) return std::nullopt;
                offset_minutes = (oh * 60 + om) * (z == '-' ? -1 : 1);
            } else {
                return std::nullopt;
            }
        }
        if (pos != text.size()) return std::nullopt;
    }

    int64_t seconds = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day)) * 86400 +
                      hour * 3600 + minute * 60 + second - offset_minutes * 60;
    int64_t days = seconds / 86400;
    int64_t rem = seconds % 86400;
    if (rem < 0) {
        rem += 86400;
        days -= 1;
    }
    int64_t y;
    unsigned m, d;
    civilFromDays(days, y, m, d);

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02d:%02d:%02d",
                  static_cast<long long>(y), m, d,
                  static_cast<int>(rem / 3600), static_cast<int>((rem % 3600) / 60), static_cast<int>(rem % 60));
    std::string out(buf);
    if (!fraction.empty()) {
        fraction.resize(3, '0');
        out += "." + fraction;
    }
    out += "Z";
    return out;
}

std::string formatEpochMillis(int64_t millis) {
    int64_t days = millis / 86400000;
    int64_t rem = millis % 86400000;
    if (rem < 0) {
        rem += 86400000;
        days -= 1;
    }
    int64_t y;
    unsigned m, d;
    civilFromDays(days, y, m, d);
    const int64_t secs = rem / 1000;
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02d:%02d:%02d.%03dZ",
                  static_cast<long long>(y), m, d,
                  static_cast<int>(secs / 3600), static_cast<int>((secs % 3600) / 60),
                  static_cast<int>(secs % 60), static_cast<int>(rem % 1000));
    return buf;
}

nlohmann::json normalizeMetricSamples(const nlohmann::json& value) {
    nlohmann::json samples = nlohmann::json::array();
    auto push = [&samples](const nlohmann::json& v) {
        if (isSample(v)) {
            nlohmann::json s = {{"time", v["time"]}, {"value", v["value"]}};
            if (s["time"].is_string()) {
                if (auto t = normalizeDateTime(s["time"].get<std::string>())) s["time"] = *t;
            }
            samples.push_back(std::move(s));
        } else if (!v.is_null()) {
            samples.push_back({{"time", nullptr}, {"value", v}});
        }
    };

    if (value.is_array()) {
        for (const auto& v : value) push(v);
    } else {
        push(value);
    }

    std::stable_sort(samples.begin(), samples.end(), [](const nlohmann::json& a, const nlohmann::json& b) {
        if (a["time"].is_string() && b["time"].is_string()) {
            return sampleTimeText(a) < sampleTimeText(b);
        }
        return sampleTimeKey(a) < sampleTimeKey(b);
    });
    return samples;
}

nlohmann::json latestSampleValue(const nlohmann::json& value) {
    if (value.is_null()) return nullptr;
    if (!value.is_array() && !isSample(value)) return value;
    nlohmann::json samples = normalizeMetricSamples(value);
    if (samples.empty()) return nullptr;
    return samples.back()["value"];
}

nlohmann::json normalizeValue(const nlohmann::json& value, const AttributeDefinition& def) {
    if (value.is_null()) return nullptr;

    if (def.type == StorageClass::Metric) {
        nlohmann::json samples = normalizeMetricSamples(value);
        if (samples.size() == 1) return samples[0]["value"];
        return samples;
    }

    switch (def.valueType()) {
        case ValueType::DateTime:
            if (value.is_string()) {
                if (auto normalized = normalizeDateTime(value.get<std::string>())) return *normalized;
            }
            return value;
        case ValueType::Integer:
        case ValueType::Number:
            if (value.is_string()) {
                const std::string& s = value.get_ref<const std::string&>();
                char* end = nullptr;
                double d = std::strtod(s.c_str(), &end);
                if (!s.empty() && end == s.c_str() + s.size()) {
                    if (def.valueType() == ValueType::Integer && s.find_first_of(".eE") == std::string::npos) {
                        return static_cast<int64_t>(std::strtoll(s.c_str(), nullptr, 10));
                    }
                    return d;
                }
            }
            return value;
        default:
            return value;
    }
}

} // namespace query
} // namespace quanta
