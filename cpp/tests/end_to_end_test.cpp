#include <string>

#include <gtest/gtest.h>

#include "tagcache/catalog/enumerator.hpp"
#include "tagcache/catalog/resource_catalog.hpp"
#include "tagcache/deps/invalidation.hpp"
#include "tagcache/storage/hashing.hpp"
#include "tagcache/storage/memory_store.hpp"
#include "test_util.hpp"

using namespace tagcache::core;

namespace {

constexpr SchemaOwnerId kApp{1};

// What an interception layer does around a read: look up, and on a miss
// "execute" and cache the rows under the read's dependency tags.
struct ReadPath {
    tagcache::deps::InvalidationCoordinator& coordinator;
    tagcache::storage::MemoryCacheStore& store;
    int executions{0};

    std::string read(const char* sql, const CachePolicy& policy = {}) {
        Hash256 key{};
        EXPECT_TRUE(is_ok(tagcache::storage::cache_key_compute(kApp, sql, "", &key)));

        std::string rows;
        if (is_ok(store.get(key, &rows))) {
            return rows;
        }

        ++executions;
        rows = "rows#" + std::to_string(executions);
        TagSet tags;
        EXPECT_TRUE(is_ok(coordinator.resolve_read_dependencies(policy, kApp, sql, &tags)));
        EXPECT_TRUE(is_ok(store.put(key, rows, tags, policy)));
        return rows;
    }

    bool write(const char* sql, const CachePolicy& policy = {}) {
        bool invalidated = false;
        EXPECT_TRUE(is_ok(coordinator.invalidate_if_mutating(sql, kApp, policy, store, &invalidated)));
        return invalidated;
    }
};

class EndToEnd : public ::testing::Test {
protected:
    EndToEnd()
        : catalog_(enumerator_, log_.logger),
          coordinator_(catalog_, CacheSettings{}, log_.logger),
          path_{coordinator_, store_} {
        enumerator_.add_schema(kApp, {"Products", "Users"});
    }

    tagcache::catalog::StaticSchemaEnumerator enumerator_;
    tagcache::test::CapturedLog log_;
    tagcache::catalog::ResourceCatalog catalog_;
    tagcache::deps::InvalidationCoordinator coordinator_;
    tagcache::storage::MemoryCacheStore store_;
    ReadPath path_;
};

} // namespace

TEST_F(EndToEnd, InsertInvalidatesCachedRead) {
    const std::string first = path_.read("SELECT * FROM Products");
    EXPECT_EQ(path_.read("SELECT * FROM Products"), first);
    EXPECT_EQ(path_.executions, 1);
    EXPECT_EQ(store_.tagged_count("Products"), 1u);

    EXPECT_TRUE(path_.write("INSERT INTO Products (Name) VALUES ('Tea')"));
    EXPECT_EQ(store_.size(), 0u);

    EXPECT_NE(path_.read("SELECT * FROM Products"), first);
    EXPECT_EQ(path_.executions, 2);
}

TEST_F(EndToEnd, WriteToOtherTableKeepsEntry) {
    path_.read("SELECT * FROM Products");
    EXPECT_TRUE(path_.write("UPDATE Users SET Name = 'x' WHERE Id = 1"));
    path_.read("SELECT * FROM Products");
    EXPECT_EQ(path_.executions, 1);
}

TEST_F(EndToEnd, UnresolvedReadIsPurgedByAnyWrite) {
    path_.read("EXEC dbo.TopSellers");
    EXPECT_EQ(store_.tagged_count("UnknownDependency"), 1u);

    EXPECT_TRUE(path_.write("DELETE FROM Users WHERE Id = 3"));
    path_.read("EXEC dbo.TopSellers");
    EXPECT_EQ(path_.executions, 2);
}

TEST_F(EndToEnd, ExplicitDependencyTiesProcedureToTable) {
    const CachePolicy policy = policy_with_dependencies({"Products"});
    path_.read("EXEC dbo.TopSellers", policy);
    EXPECT_EQ(store_.tagged_count("Products"), 1u);

    EXPECT_TRUE(path_.write("insert into Products (Name) values ('Mug')"));
    path_.read("EXEC dbo.TopSellers", policy);
    EXPECT_EQ(path_.executions, 2);
}

TEST_F(EndToEnd, ReadsDoNotInvalidate) {
    path_.read("SELECT * FROM Products");
    EXPECT_FALSE(path_.write("SELECT COUNT(*) FROM Products"));
    EXPECT_EQ(store_.size(), 1u);
}
