#pragma once

#include <array>
#include <memory>
#include <vector>

#include "engine/engine_adapter.h"

namespace quanta {

/// Dispatch table from storage class to backend adapter
class AdapterRegistry {
public:
    AdapterRegistry() = default;

    /// Installs an adapter under its own storageClass(); replaces a previous one
    void set(EngineAdapterPtr adapter);

    /// nullptr if no adapter is installed for the class
    EngineAdapterPtr get(StorageClass cls) const {
        return adapters_[static_cast<size_t>(cls)];
    }

    bool complete() const;

    /// Installed adapters in storage class order
    std::vector<EngineAdapterPtr> all() const;

private:
    std::array<EngineAdapterPtr, kStorageClassCount> adapters_;
};

} // namespace quanta
