/*!
 * \file domain_registry.hpp
 * \brief Process-wide owner of every enum cache, keyed by domain
 * \author Max Qian <lightapt.com>
 * \date 2024-05-12
 * \copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef ENUMKIT_META_DOMAIN_REGISTRY_HPP
#define ENUMKIT_META_DOMAIN_REGISTRY_HPP

#include <any>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "enumkit/error/exception.hpp"
#include "enumkit/meta/enum_cache.hpp"
#include "enumkit/utils/string.hpp"

namespace enumkit::meta {

/**
 * \brief Keyed registry that owns every enum cache.
 *
 * Hosts look their cache up by key and never store a pointer back into the
 * registry. Each key is built at most once, even when many threads ask for
 * it at the same time.
 */
class DomainRegistry {
public:
    /**
     * \brief Get the singleton instance
     * \return Reference to the singleton instance
     */
    static auto instance() -> DomainRegistry&;

    DomainRegistry(const DomainRegistry&) = delete;
    auto operator=(const DomainRegistry&) -> DomainRegistry& = delete;

    /**
     * \brief Returns the cache stored under \p key, building it with
     * \p factory if the key is new.
     *
     * \tparam Cache Cache type stored under the key.
     * \param factory Callable returning std::shared_ptr<Cache>. It runs with
     * the registry locked and must not call back into the registry.
     * \throws enumkit::error::InvalidArgument if the key holds a different
     * cache type, or the factory returns null.
     */
    template <typename Cache, typename Factory>
    auto getOrCreate(std::string_view key, Factory&& factory)
        -> std::shared_ptr<Cache> {
        {
            std::shared_lock lock(mutex_);
            if (auto iter = domains_.find(key); iter != domains_.end()) {
                return cast<Cache>(key, iter->second);
            }
        }

        std::unique_lock lock(mutex_);
        if (auto iter = domains_.find(key); iter != domains_.end()) {
            return cast<Cache>(key, iter->second);
        }

        std::shared_ptr<Cache> cache = std::forward<Factory>(factory)();
        if (!cache) {
            THROW_INVALID_ARGUMENT("Factory for enum domain '{}' returned null",
                                   key);
        }
        domains_.emplace(std::string(key), cache);
        spdlog::debug("Registered enum domain '{}' ({} domains)", key,
                      domains_.size());
        return cache;
    }

    /**
     * \brief Cache stored under \p key, or nullptr if there is none.
     * \throws enumkit::error::InvalidArgument if the key holds a different
     * cache type.
     */
    template <typename Cache>
    [[nodiscard]] auto find(std::string_view key) const
        -> std::shared_ptr<Cache> {
        std::shared_lock lock(mutex_);
        if (auto iter = domains_.find(key); iter != domains_.end()) {
            return cast<Cache>(key, iter->second);
        }
        spdlog::debug("Enum domain '{}' is not registered", key);
        return nullptr;
    }

    /**
     * \brief Registers a runtime domain built from \p members.
     * \param validator Optional validity rule, see EnumCache::isValid().
     * \throws enumkit::error::InvalidArgument if \p key is already taken.
     */
    template <EnumUnderlying TInt>
    auto registerDomain(std::string key, std::vector<RawMember<TInt>> members,
                        bool isFlagDomain,
                        TagInspector inspector = defaultTagInspector,
                        typename EnumCache<TInt>::Validator validator = {})
        -> std::shared_ptr<EnumCache<TInt>> {
        auto cache = std::make_shared<EnumCache<TInt>>(
            key, std::move(members), isFlagDomain, std::move(inspector),
            std::move(validator));

        std::unique_lock lock(mutex_);
        if (domains_.contains(key)) {
            THROW_INVALID_ARGUMENT("Enum domain '{}' is already registered",
                                   key);
        }
        spdlog::debug("Registered runtime enum domain '{}'", key);
        domains_.emplace(std::move(key), cache);
        return cache;
    }

    [[nodiscard]] auto contains(std::string_view key) const -> bool;
    [[nodiscard]] auto size() const -> std::size_t;
    [[nodiscard]] auto keys() const -> std::vector<std::string>;

private:
    DomainRegistry() = default;

    template <typename Cache>
    static auto cast(std::string_view key, const std::any& entry)
        -> std::shared_ptr<Cache> {
        if (const auto* cache = std::any_cast<std::shared_ptr<Cache>>(&entry)) {
            return *cache;
        }
        THROW_INVALID_ARGUMENT(
            "Enum domain '{}' was registered with a different underlying "
            "type",
            key);
    }

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::any, utils::StringHash,
                       std::equal_to<>>
        domains_;
};

}  // namespace enumkit::meta

#endif  // ENUMKIT_META_DOMAIN_REGISTRY_HPP
