#pragma once

#include "tagcache/core/errors.hpp"
#include "tagcache/core/types.hpp"

namespace tagcache::storage {

    // The part of a cache backend the invalidation engine talks to.
    // Implementations own their concurrency control; a non-ok status means
    // the entries may still be present.
    class CacheStore {
    public:
        virtual ~CacheStore() = default;

        // Drops every entry whose tag set intersects `tags`.
        [[nodiscard]] virtual core::Status invalidate_by_dependency_tags(const core::TagSet& tags) = 0;
    };

} // namespace tagcache::storage
