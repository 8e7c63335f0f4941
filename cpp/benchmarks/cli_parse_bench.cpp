#include <benchmark/benchmark.h>

#include "ferry/cli/app.hpp"
#include "ferry/cli/commands.hpp"
#include "ferry/cli/options.hpp"

static void BM_CliParseOptions(benchmark::State& state) {
    ferry::cli::u32 count = 0;
    const ferry::cli::OptionSpec* specs = ferry::cli::option_specs(&count);

    const char* argv[] = {"--no-pin", "--data", "/srv/media", "--port=9000", "-t8", "--", "extra"};
    const ferry::cli::CliArgs args{argv, 7};
    for (auto _ : state) {
        ferry::cli::ParsedOption buf[8]{};
        ferry::cli::ParsedOptions out{buf, 0, 8};
        ferry::cli::u32 consumed = 0;
        const ferry::core::Status s = ferry::cli::parse_options(args, specs, count, &out, &consumed);
        benchmark::DoNotOptimize(static_cast<ferry::core::u16>(s.code));
        benchmark::DoNotOptimize(out.len);
        benchmark::DoNotOptimize(consumed);
    }
}
BENCHMARK(BM_CliParseOptions);

static void BM_CliParseCommand(benchmark::State& state) {
    ferry::cli::u32 count = 0;
    const ferry::cli::CommandSpec* specs = ferry::cli::command_specs(&count);

    const char* argv[] = {"sweep", "--data", "/srv/media"};
    const ferry::cli::CliArgs args{argv, 3};
    for (auto _ : state) {
        ferry::cli::CommandInvocation out{};
        ferry::cli::u32 consumed = 0;
        const ferry::core::Status s = ferry::cli::parse_command(args, specs, count, &out, &consumed);
        benchmark::DoNotOptimize(static_cast<ferry::core::u16>(s.code));
        benchmark::DoNotOptimize(static_cast<ferry::cli::u32>(out.id));
        benchmark::DoNotOptimize(consumed);
    }
}
BENCHMARK(BM_CliParseCommand);
