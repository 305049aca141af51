#pragma once

#include <map>
#include <mutex>
#include <string>

#include "tagcache/catalog/enumerator.hpp"
#include "tagcache/core/errors.hpp"
#include "tagcache/core/types.hpp"

namespace tagcache::db {
    using u32 = tagcache::core::u32;

    // Reads table names from sqlite_master of the database registered for
    // each schema owner. The file is opened read-only for every call; the
    // resource catalog makes that a once-per-owner cost.
    class SqliteSchemaEnumerator final : public catalog::SchemaEnumerator {
    public:
        // `path` may be a filename or a "file:" URI.
        void register_database(core::SchemaOwnerId owner, std::string path);

        [[nodiscard]] core::Status enumerate(core::SchemaOwnerId owner,
                                             core::ResourceSet* out) override;

    private:
        std::mutex mutex_;
        std::map<u32, std::string> paths_;
    };

    // One-shot variant for callers without a registry.
    core::Status sqlite_list_tables(const char* path, core::ResourceSet* out);

} // namespace tagcache::db
