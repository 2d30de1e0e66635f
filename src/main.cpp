#include "config/engine_config.h"
#include "engine/adapter_registry.h"
#include "engine/memory_adapter.h"
#include "query/query_engine.h"
#include "schema/schema_registry.h"
#include "utils/logger.h"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <memory>
#include <string>

using namespace quanta;

namespace {

std::string upperTrimmed(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    std::string out = s.substr(b, e - b + 1);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return std::toupper(c); });
    return out;
}

// A BEGIN block only ends at COMMIT; everything else at a line ending in ';'
bool statementComplete(const std::string& text) {
    std::string upper = upperTrimmed(text);
    if (upper.empty() || upper.back() != ';') return false;
    if (upper.rfind("BEGIN", 0) == 0 || upper.rfind("EXPLAIN BEGIN", 0) == 0) {
        upper.pop_back();
        while (!upper.empty() && std::isspace(static_cast<unsigned char>(upper.back()))) upper.pop_back();
        auto ends_with = [&](const std::string& suffix) {
            return upper.size() >= suffix.size() && upper.compare(upper.size() - suffix.size(), suffix.size(), suffix) == 0;
        };
        return ends_with("COMMIT") || ends_with("COMMIT TRANSACTION");
    }
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string bucket = "default";

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--bucket" && i + 1 < argc) {
            bucket = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: " << argv[0] << " [options]\n"
                      << "Options:\n"
                      << "  --config FILE   Load engine config from YAML file\n"
                      << "  --bucket NAME   Bucket to create and query (default: default)\n"
                      << "Reads ';'-terminated statements from stdin and prints one JSON response each.\n";
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return 1;
        }
    }

    config::EngineConfig cfg = config_path.empty() ? config::EngineConfig::defaults()
                                                   : config::EngineConfig::loadFromYaml(config_path);
    utils::Logger::init(cfg.logging.file, utils::Logger::levelFromString(cfg.logging.level));
    QUANTA_INFO("=== Quanta federated query shell ===");

    AdapterRegistry adapters;
    adapters.set(std::make_shared<MemoryAdapter>("postgres", StorageClass::Scalar));
    adapters.set(std::make_shared<MemoryAdapter>("mongodb", StorageClass::Document));
    adapters.set(std::make_shared<MemoryAdapter>("neo4j", StorageClass::Relation));
    adapters.set(std::make_shared<MemoryAdapter>("influxdb", StorageClass::Metric));

    SchemaRegistry registry;
    query::QueryEngine engine(registry, adapters, cfg);

    auto [st, info] = engine.schema().createBucket(bucket);
    if (!st.ok) {
        QUANTA_ERROR("Failed to create bucket {}: {}", bucket, st.toString());
        utils::Logger::shutdown();
        return 1;
    }

    std::string buffer;
    std::string line;
    while (std::getline(std::cin, line)) {
        buffer += line;
        buffer += '\n';
        if (!statementComplete(buffer)) continue;

        query::QueryRequest request;
        request.bucket = info.name;
        request.query = buffer;
        buffer.clear();

        auto response = engine.execute(request);
        std::cout << response.toJSON().dump(2) << std::endl;
    }
    if (!upperTrimmed(buffer).empty()) {
        std::cerr << "Incomplete statement at end of input\n";
    }

    utils::Logger::shutdown();
    return 0;
}
