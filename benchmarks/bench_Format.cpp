// Benchmarks for UI/Format functions
//
// Strip titles and the usage readout format several byte values every frame.

#include "UI/Format.h"

#include <cstdint>
#include <random>

#include <benchmark/benchmark.h>

namespace
{

// Benchmark formatBytes() - strip titles and detail readout
static void BM_Format_FormatBytes(benchmark::State& state)
{
    std::mt19937_64 rng(42);
    std::uniform_int_distribution<std::uint64_t> dist(0, (1ULL << 44)); // Up to 16TB

    for (auto _ : state)
    {
        const auto bytes = dist(rng);
        auto result = UI::Format::formatBytes(bytes);
        benchmark::DoNotOptimize(result.data());
    }
}
BENCHMARK(BM_Format_FormatBytes);

// Benchmark chooseByteUnit() alone, without string building
static void BM_Format_ChooseByteUnit(benchmark::State& state)
{
    std::mt19937_64 rng(42);
    std::uniform_real_distribution<double> dist(0.0, 1e15);

    for (auto _ : state)
    {
        const auto unit = UI::Format::chooseByteUnit(dist(rng));
        benchmark::DoNotOptimize(unit.scale);
    }
}
BENCHMARK(BM_Format_ChooseByteUnit);

} // namespace
