#include <memory>
#include <string>

#include <benchmark/benchmark.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/null_sink.h>

#include "tagcache/catalog/enumerator.hpp"
#include "tagcache/catalog/resource_catalog.hpp"
#include "tagcache/deps/invalidation.hpp"
#include "tagcache/storage/hashing.hpp"
#include "tagcache/storage/memory_store.hpp"

namespace {

std::shared_ptr<spdlog::logger> null_logger() {
    return std::make_shared<spdlog::logger>("bench", std::make_shared<spdlog::sinks::null_sink_mt>());
}

tagcache::core::ResourceSet make_schema(int n) {
    tagcache::core::ResourceSet names;
    for (int i = 0; i < n; ++i) {
        names.insert("Table" + std::to_string(i));
    }
    names.insert("Products");
    return names;
}

} // namespace

static void BM_ResolveMatched(benchmark::State& state) {
    const tagcache::deps::DependencyResolver resolver({}, null_logger());
    const tagcache::core::ResourceSet known = make_schema(static_cast<int>(state.range(0)));
    const tagcache::core::CachePolicy policy{};
    for (auto _ : state) {
        auto tags = resolver.resolve(policy, known, "SELECT * FROM [dbo].[Products] p");
        benchmark::DoNotOptimize(tags);
    }
}
BENCHMARK(BM_ResolveMatched)->Arg(8)->Arg(128)->Arg(2048);

static void BM_ResolveSentinel(benchmark::State& state) {
    const tagcache::deps::DependencyResolver resolver({}, null_logger());
    const tagcache::core::ResourceSet known = make_schema(128);
    const tagcache::core::CachePolicy policy{};
    for (auto _ : state) {
        auto tags = resolver.resolve(policy, known, "EXEC dbo.TopSellers @n = 10");
        benchmark::DoNotOptimize(tags);
    }
}
BENCHMARK(BM_ResolveSentinel);

static void BM_InvalidateWrite(benchmark::State& state) {
    tagcache::catalog::StaticSchemaEnumerator enumerator;
    enumerator.add_schema(tagcache::core::SchemaOwnerId{1}, make_schema(128));
    auto logger = null_logger();
    tagcache::catalog::ResourceCatalog catalog(enumerator, logger);
    tagcache::deps::InvalidationCoordinator coordinator(catalog, {}, logger);
    tagcache::storage::MemoryCacheStore store;

    const tagcache::core::TagSet tags{"Products"};
    for (auto _ : state) {
        state.PauseTiming();
        for (int i = 0; i < 64; ++i) {
            tagcache::core::Hash256 key{};
            (void)tagcache::storage::cache_key_compute(tagcache::core::SchemaOwnerId{1},
                                                       "SELECT * FROM Products", std::to_string(i), &key);
            (void)store.put(key, "rows", tags, tagcache::core::CachePolicy{});
        }
        state.ResumeTiming();

        bool invalidated = false;
        const tagcache::core::Status s = coordinator.invalidate_if_mutating(
            "UPDATE Products SET Price = 1", tagcache::core::SchemaOwnerId{1}, {}, store, &invalidated);
        benchmark::DoNotOptimize(static_cast<tagcache::core::u16>(s.code));
        benchmark::DoNotOptimize(invalidated);
    }
}
BENCHMARK(BM_InvalidateWrite);
