#include <cstddef>
#include <vector>

#include <benchmark/benchmark.h>

#include "ferry/storage/hashing.hpp"

static void BM_HashCompute(benchmark::State& state){
    const size_t n = static_cast<size_t>(state.range(0));

    std::vector<ferry::storage::u8> buf(n);
    for (size_t i = 0; i < buf.size(); ++i){
        buf[i] = static_cast<ferry::storage::u8>(i & 0xffu);
    }

    for (auto _ : state){
        ferry::core::Hash256 out{};
        ferry::core::Status s = ferry::storage::hash_compute({buf.data(), static_cast<ferry::storage::u32>(n)}, &out);
        benchmark::DoNotOptimize(s);
        benchmark::DoNotOptimize(out);
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}

BENCHMARK(BM_HashCompute)->Arg(64)->Arg(4096)->Arg(1 << 20);

static void BM_HashToHex(benchmark::State& state){
    ferry::core::Hash256 h{};
    for (size_t i = 0; i < h.b.size(); ++i){
        h.b[i] = static_cast<ferry::storage::u8>(i * 7);
    }
    for (auto _ : state){
        benchmark::DoNotOptimize(ferry::storage::hash_to_hex(h));
    }
}

BENCHMARK(BM_HashToHex);
