/*!
 * \file domain_registry.cpp
 * \brief Process-wide owner of every enum cache, keyed by domain
 * \author Max Qian <lightapt.com>
 * \date 2024-05-12
 * \copyright Copyright (C) 2023-2024 Max Qian
 */

#include "domain_registry.hpp"

namespace enumkit::meta {

auto DomainRegistry::instance() -> DomainRegistry& {
    static DomainRegistry registry;
    return registry;
}

auto DomainRegistry::contains(std::string_view key) const -> bool {
    std::shared_lock lock(mutex_);
    return domains_.find(key) != domains_.end();
}

auto DomainRegistry::size() const -> std::size_t {
    std::shared_lock lock(mutex_);
    return domains_.size();
}

auto DomainRegistry::keys() const -> std::vector<std::string> {
    std::shared_lock lock(mutex_);
    std::vector<std::string> result;
    result.reserve(domains_.size());
    for (const auto& [key, cache] : domains_) {
        result.push_back(key);
    }
    return result;
}

}  // namespace enumkit::meta
