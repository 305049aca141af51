#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <unordered_map>

#include <spdlog/logger.h>

#include "tagcache/catalog/enumerator.hpp"
#include "tagcache/core/errors.hpp"
#include "tagcache/core/types.hpp"

namespace tagcache::catalog {

    // Memoized table names per schema owner.
    //
    // The first resolve for an owner asks the enumerator; every later call
    // returns the same immutable set. Concurrent first callers for one owner
    // wait on that owner's slot, so the enumerator runs once per owner.
    // Owners do not block each other. A failed enumeration is not cached.
    class ResourceCatalog {
    public:
        explicit ResourceCatalog(SchemaEnumerator& enumerator,
                                 std::shared_ptr<spdlog::logger> logger = nullptr);

        ResourceCatalog(const ResourceCatalog&) = delete;
        ResourceCatalog& operator=(const ResourceCatalog&) = delete;

        [[nodiscard]] core::Status resolve_resource_names(core::SchemaOwnerId owner,
                                                          std::shared_ptr<const core::ResourceSet>* out);

        [[nodiscard]] bool contains(core::SchemaOwnerId owner) const;
        [[nodiscard]] std::size_t size() const;

        // Owners holding a slot: memoized plus in-flight enumerations.
        [[nodiscard]] std::size_t slot_count() const;

    private:
        struct Slot {
            std::mutex mutex;
            std::shared_ptr<const core::ResourceSet> names;
        };

        [[nodiscard]] std::shared_ptr<Slot> slot_for(core::SchemaOwnerId owner);
        // Drops the slot of a failed enumeration unless a newer one replaced it.
        void release_slot(core::SchemaOwnerId owner, const std::shared_ptr<Slot>& slot);

        SchemaEnumerator& enumerator_;
        std::shared_ptr<spdlog::logger> logger_;
        mutable std::mutex mutex_;
        std::unordered_map<core::u32, std::shared_ptr<Slot>> slots_;
    };

} // namespace tagcache::catalog
