#pragma once

#include <memory>
#include <string_view>

#include <spdlog/logger.h>

#include "tagcache/catalog/resource_catalog.hpp"
#include "tagcache/core/errors.hpp"
#include "tagcache/core/policy.hpp"
#include "tagcache/core/types.hpp"
#include "tagcache/deps/resolver.hpp"
#include "tagcache/storage/cache_store.hpp"

namespace tagcache::deps {

    // Entry point for the command interception layer.
    class InvalidationCoordinator {
    public:
        InvalidationCoordinator(catalog::ResourceCatalog& catalog,
                                core::CacheSettings settings = {},
                                std::shared_ptr<spdlog::logger> logger = nullptr);

        // Tags for the cache entry of a read.
        [[nodiscard]] core::Status resolve_read_dependencies(const core::CachePolicy& policy,
                                                             core::SchemaOwnerId owner,
                                                             std::string_view command_text,
                                                             core::TagSet* out);

        // Call after a command has executed. For reads sets *invalidated to
        // false and touches neither the catalog nor the store. For writes
        // purges the command's tables plus kUnknownDependency.
        [[nodiscard]] core::Status invalidate_if_mutating(std::string_view command_text,
                                                          core::SchemaOwnerId owner,
                                                          const core::CachePolicy& policy,
                                                          storage::CacheStore& store,
                                                          bool* invalidated);

        // Tags a write would purge, without calling a store. Empty for reads.
        [[nodiscard]] core::Status invalidation_tags(std::string_view command_text,
                                                     core::SchemaOwnerId owner,
                                                     const core::CachePolicy& policy,
                                                     core::TagSet* out);

    private:
        catalog::ResourceCatalog& catalog_;
        DependencyResolver resolver_;
    };

} // namespace tagcache::deps
