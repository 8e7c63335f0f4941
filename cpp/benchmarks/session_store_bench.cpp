#include <string>
#include <vector>

#include <benchmark/benchmark.h>

#include "ferry/db/session_store.hpp"

using namespace ferry::core;
using ferry::db::SessionStore;

namespace {

UploadSession make_bench_session(u64 n) {
    UploadSession s;
    s.id = "bench-" + std::to_string(n);
    s.storage_handle = "handle-" + std::to_string(n);
    s.filename = "clip.mp4";
    s.mime_type = "video/mp4";
    s.expected_size = 1u << 30;
    s.created_at = 1700000000000;
    s.updated_at = 1700000000000;
    return s;
}

} // namespace

//=============================================================================
// Writes
//=============================================================================

static void BM_SessionInsert(benchmark::State& state) {
    SessionStore store;
    if (!is_ok(store.open(":memory:"))) {
        state.SkipWithError("open failed");
        return;
    }
    u64 n = 0;
    for (auto _ : state) {
        const Status s = store.insert(make_bench_session(n++));
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SessionInsert);

static void BM_SessionUpdateProgress(benchmark::State& state) {
    SessionStore store;
    if (!is_ok(store.open(":memory:")) || !is_ok(store.insert(make_bench_session(0)))) {
        state.SkipWithError("setup failed");
        return;
    }
    u64 offset = 0;
    Timestamp now = 1700000000000;
    for (auto _ : state) {
        offset = (offset + 1048576) % (1u << 30);
        const Status s = store.update_progress("bench-0", offset, ++now);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SessionUpdateProgress);

//=============================================================================
// Reads
//=============================================================================

static void BM_SessionGet(benchmark::State& state) {
    SessionStore store;
    if (!is_ok(store.open(":memory:"))) {
        state.SkipWithError("open failed");
        return;
    }
    for (u64 i = 0; i < 1000; ++i) {
        if (!is_ok(store.insert(make_bench_session(i)))) {
            state.SkipWithError("insert failed");
            return;
        }
    }
    for (auto _ : state) {
        UploadSession out;
        const Status s = store.get("bench-500", &out);
        benchmark::DoNotOptimize(s);
        benchmark::DoNotOptimize(out.bytes_received);
    }
}
BENCHMARK(BM_SessionGet);

static void BM_SessionListInProgress(benchmark::State& state) {
    SessionStore store;
    if (!is_ok(store.open(":memory:"))) {
        state.SkipWithError("open failed");
        return;
    }
    for (u64 i = 0; i < static_cast<u64>(state.range(0)); ++i) {
        if (!is_ok(store.insert(make_bench_session(i)))) {
            state.SkipWithError("insert failed");
            return;
        }
    }
    for (auto _ : state) {
        std::vector<UploadSession> out;
        const Status s = store.list_by_status(UploadStatus::InProgress, &out);
        benchmark::DoNotOptimize(s);
        benchmark::DoNotOptimize(out.size());
    }
}
BENCHMARK(BM_SessionListInProgress)->Arg(10)->Arg(100)->Arg(1000);
