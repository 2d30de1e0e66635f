#include "engine/adapter_registry.h"

namespace quanta {

void AdapterRegistry::set(EngineAdapterPtr adapter) {
    if (!adapter) return;
    adapters_[static_cast<size_t>(adapter->storageClass())] = std::move(adapter);
}

bool AdapterRegistry::complete() const {
    for (const auto& a : adapters_) {
        if (!a) return false;
    }
    return true;
}

std::vector<EngineAdapterPtr> AdapterRegistry::all() const {
    std::vector<EngineAdapterPtr> out;
    for (const auto& a : adapters_) {
        if (a) out.push_back(a);
    }
    return out;
}

} // namespace quanta
