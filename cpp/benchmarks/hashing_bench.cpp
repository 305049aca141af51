#include <string>

#include <benchmark/benchmark.h>

#include "tagcache/storage/hashing.hpp"

static void BM_CacheKeyCompute(benchmark::State& state){
    const std::string sql(static_cast<size_t>(state.range(0)), 'x');

    for (auto _ : state){
        tagcache::core::Hash256 out{};
        tagcache::core::Status s = tagcache::storage::cache_key_compute(tagcache::core::SchemaOwnerId{1}, sql, "@p0=1", &out);
        benchmark::DoNotOptimize(s);
        benchmark::DoNotOptimize(out);
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(sql.size()));
}

BENCHMARK(BM_CacheKeyCompute)->Arg(0)->Arg(64)->Arg(1024)->Arg(4096);
