#pragma once

#include <atomic>
#include <initializer_list>
#include <map>
#include <mutex>
#include <string_view>

#include "tagcache/core/errors.hpp"
#include "tagcache/core/types.hpp"

namespace tagcache::catalog {

    // Lists the tables a schema owner declares. A failure here means the
    // data model is misconfigured; callers must not treat it as a miss.
    class SchemaEnumerator {
    public:
        virtual ~SchemaEnumerator() = default;

        [[nodiscard]] virtual core::Status enumerate(core::SchemaOwnerId owner,
                                                     core::ResourceSet* out) = 0;
    };

    // Tables declared in code, e.g. from an entity model.
    class StaticSchemaEnumerator final : public SchemaEnumerator {
    public:
        void add_schema(core::SchemaOwnerId owner, std::initializer_list<std::string_view> tables);
        void add_schema(core::SchemaOwnerId owner, core::ResourceSet tables);

        [[nodiscard]] core::Status enumerate(core::SchemaOwnerId owner,
                                             core::ResourceSet* out) override;

        // Number of successful enumerate() calls.
        [[nodiscard]] core::u64 enumeration_count() const noexcept {
            return enumerations_.load(std::memory_order_relaxed);
        }

    private:
        mutable std::mutex mutex_;
        std::map<core::u32, core::ResourceSet> schemas_;
        std::atomic<core::u64> enumerations_{0};
    };

} // namespace tagcache::catalog
