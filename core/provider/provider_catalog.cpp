#include "provider_catalog.hpp"

#include <algorithm>
#include <mutex>

#include "logging/logger.hpp"

namespace trellico {
namespace provider {

std::unique_ptr<ProviderCatalog> ProviderCatalog::from_configs(const std::vector<ProviderConfig> &configs) {
    auto catalog = std::make_unique<ProviderCatalog>();

    for (auto &config : builtin_provider_configs()) {
        catalog->add(std::make_shared<ConfiguredProviderDescriptor>(std::move(config)));
    }

    for (const auto &config : configs) {
        if (catalog->contains(config.id)) {
            LOG_INFO("[Provider] Overriding built-in provider '" << config.id << "' from config");
        } else {
            LOG_INFO("[Provider] Registering provider '" << config.id << "' from config");
        }
        catalog->add(std::make_shared<ConfiguredProviderDescriptor>(config));
    }

    return catalog;
}

void ProviderCatalog::add(std::shared_ptr<IProviderDescriptor> descriptor) {
    if (!descriptor) {
        return;
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    const std::string id = descriptor->id();
    descriptors_[id] = std::move(descriptor);
}

std::shared_ptr<IProviderDescriptor> ProviderCatalog::get(const std::string &id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = descriptors_.find(id);
    if (it != descriptors_.end()) {
        return it->second;
    }
    return nullptr;
}

bool ProviderCatalog::contains(const std::string &id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return descriptors_.find(id) != descriptors_.end();
}

std::vector<std::string> ProviderCatalog::ids() const {
    std::vector<std::string> result;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        result.reserve(descriptors_.size());
        for (const auto &[id, descriptor] : descriptors_) {
            static_cast<void>(descriptor);
            result.push_back(id);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::vector<std::shared_ptr<IProviderDescriptor>> ProviderCatalog::all() const {
    std::vector<std::shared_ptr<IProviderDescriptor>> result;
    for (const auto &id : ids()) {
        auto descriptor = get(id);
        if (descriptor) {
            result.push_back(std::move(descriptor));
        }
    }
    return result;
}

size_t ProviderCatalog::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return descriptors_.size();
}

}  // namespace provider
}  // namespace trellico
