#include <benchmark/benchmark.h>

#include "ferry/protocol/tus.hpp"
#include "ferry/protocol/validation.hpp"

using namespace ferry::protocol;

static void BM_ParseUploadMetadata(benchmark::State& state) {
    const char* header = "filename aG9saWRheSB2aWRlbyAyMDI0Lm1wNA==,filetype dmlkZW8vbXA0,relativePath bnVsbA==";
    for (auto _ : state) {
        UploadMetadata md;
        const ferry::core::Status s = parse_upload_metadata(header, &md);
        benchmark::DoNotOptimize(s);
        benchmark::DoNotOptimize(md.filename.data());
    }
}
BENCHMARK(BM_ParseUploadMetadata);

static void BM_ParseContentRange(benchmark::State& state) {
    for (auto _ : state) {
        ContentRange r;
        const ferry::core::Status s = parse_content_range("bytes 1048576-2097151/734003200", &r);
        benchmark::DoNotOptimize(s);
        benchmark::DoNotOptimize(r.first);
    }
}
BENCHMARK(BM_ParseContentRange);

static void BM_ValidateUploadRequest(benchmark::State& state) {
    UploadPolicy policy;
    policy.max_upload_bytes = 8ull << 30;
    for (auto _ : state) {
        const ferry::core::Status s = validate_upload_request(policy, "holiday video 2024.MP4", "video/mp4", 734003200);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_ValidateUploadRequest);
