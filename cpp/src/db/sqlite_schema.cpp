#include "tagcache/db/sqlite_schema.hpp"

#include <sqlite3.h>
#include <utility>

namespace tagcache::db {

using namespace tagcache::core;

namespace {
    // Views and sqlite's own bookkeeping tables are not resources.
    constexpr const char* kListTablesSQL =
        "SELECT name FROM sqlite_master "
        "WHERE type = 'table' AND name NOT LIKE 'sqlite_%' "
        "ORDER BY name";
} // namespace

Status sqlite_list_tables(const char* path, ResourceSet* out) {
    if (path == nullptr || path[0] == '\0' || out == nullptr) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(path, &db, SQLITE_OPEN_READONLY | SQLITE_OPEN_URI, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_close(db);
        return make_status(StatusDomain::Db, StatusCode::Io, static_cast<u32>(rc));
    }

    sqlite3_stmt* stmt = nullptr;
    rc = sqlite3_prepare_v2(db, kListTablesSQL, -1, &stmt, nullptr);
    if (rc != SQLITE_OK || stmt == nullptr) {
        // sqlite opens lazily; a file that is not a database fails here.
        if (stmt) sqlite3_finalize(stmt);
        sqlite3_close(db);
        return make_status(StatusDomain::Db, StatusCode::Unavailable, static_cast<u32>(rc));
    }

    ResourceSet names;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        const char* name = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        if (name && name[0] != '\0') {
            names.emplace(name);
        }
    }

    sqlite3_finalize(stmt);
    sqlite3_close(db);

    if (rc != SQLITE_DONE) {
        return make_status(StatusDomain::Db, StatusCode::Io, static_cast<u32>(rc));
    }

    *out = std::move(names);
    return ok_status();
}

void SqliteSchemaEnumerator::register_database(SchemaOwnerId owner, std::string path) {
    std::lock_guard<std::mutex> lock(mutex_);
    paths_[owner.v] = std::move(path);
}

Status SqliteSchemaEnumerator::enumerate(SchemaOwnerId owner, ResourceSet* out) {
    if (out == nullptr || !owner.is_valid()) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::string path;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = paths_.find(owner.v);
        if (it == paths_.end()) {
            return make_status(StatusDomain::Db, StatusCode::NotFound, owner.v);
        }
        path = it->second;
    }

    return sqlite_list_tables(path.c_str(), out);
}

} // namespace tagcache::db
