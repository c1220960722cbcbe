#pragma once

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "provider_config.hpp"
#include "provider_descriptor.hpp"

namespace trellico {
namespace provider {

/**
 * @brief Thread-safe id -> descriptor lookup
 *
 * Read-mostly: HTTP handlers and the process supervisor look descriptors up
 * concurrently; writes only happen while the runtime is being assembled.
 * Returned shared_ptrs keep a descriptor alive even if it is replaced later.
 */
class ProviderCatalog {
public:
    ProviderCatalog() = default;

    ProviderCatalog(const ProviderCatalog &) = delete;
    ProviderCatalog &operator=(const ProviderCatalog &) = delete;

    /**
     * @brief Built-in descriptors overlaid with configured ones (matched by id)
     */
    static std::unique_ptr<ProviderCatalog> from_configs(const std::vector<ProviderConfig> &configs);

    // Adds or replaces the descriptor under descriptor->id()
    void add(std::shared_ptr<IProviderDescriptor> descriptor);

    // nullptr if not found
    std::shared_ptr<IProviderDescriptor> get(const std::string &id) const;

    bool contains(const std::string &id) const;

    // Sorted by id
    std::vector<std::string> ids() const;

    std::vector<std::shared_ptr<IProviderDescriptor>> all() const;

    size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<IProviderDescriptor>> descriptors_;
};

}  // namespace provider
}  // namespace trellico
