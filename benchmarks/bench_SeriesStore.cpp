// Benchmarks for Domain/SeriesStore
//
// The collector pushes one sample per series per refresh; the panel queries
// a zoomed window per strip per frame.

#include "Domain/HistoryView.h"
#include "Domain/SamplingConfig.h"
#include "Domain/SeriesKind.h"
#include "Domain/SeriesStore.h"

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>

#include <benchmark/benchmark.h>

namespace
{

void fill(Domain::SeriesStore& store, const Domain::SeriesKind& kind, std::size_t count)
{
    std::mt19937_64 rng(42);
    std::uniform_int_distribution<std::uint64_t> dist(0, 1ULL << 30);
    for (std::size_t i = 0; i < count; ++i)
    {
        store.push(kind, dist(rng));
    }
}

// Benchmark push() on a full series (steady state)
static void BM_SeriesStore_PushFull(benchmark::State& state)
{
    const std::size_t capacity = Domain::Sampling::historyCapacity(Domain::Sampling::HISTORY_SECONDS_DEFAULT,
                                                                   Domain::Sampling::REFRESH_INTERVAL_DEFAULT_MS);
    Domain::SeriesStore store(capacity);
    const auto kind = Domain::SeriesKind::ioRead();
    fill(store, kind, capacity);

    std::uint64_t value = 0;
    for (auto _ : state)
    {
        store.push(kind, value++);
    }
}
BENCHMARK(BM_SeriesStore_PushFull);

// Benchmark lookup() at different zoom factors over a 30 minute, 100ms history
static void BM_SeriesStore_LookupZoomed(benchmark::State& state)
{
    const std::size_t capacity =
        Domain::Sampling::historyCapacity(Domain::Sampling::HISTORY_SECONDS_MAX, Domain::Sampling::REFRESH_INTERVAL_MIN_MS);
    Domain::SeriesStore store(capacity);
    const auto kind = Domain::SeriesKind::ioWrite();
    fill(store, kind, capacity);

    const Domain::HistoryView view{.width = 200, .zoomFactor = static_cast<std::size_t>(state.range(0)), .offset = 0};

    for (auto _ : state)
    {
        auto window = store.lookup(kind, view);
        benchmark::DoNotOptimize(window);
    }
}
BENCHMARK(BM_SeriesStore_LookupZoomed)->Arg(1)->Arg(4)->Arg(16)->Arg(64);

// Benchmark lookup() across many filesystem series
static void BM_SeriesStore_LookupManyFileSystems(benchmark::State& state)
{
    Domain::SeriesStore store(300);
    const auto count = static_cast<int>(state.range(0));
    for (int i = 0; i < count; ++i)
    {
        fill(store, Domain::SeriesKind::fileSystemUsedSpace("/dev/sd" + std::to_string(i)), 300);
    }

    const auto target = Domain::SeriesKind::fileSystemUsedSpace("/dev/sd0");
    for (auto _ : state)
    {
        auto window = store.lookup(target, Domain::HistoryView{});
        benchmark::DoNotOptimize(window);
    }
}
BENCHMARK(BM_SeriesStore_LookupManyFileSystems)->Arg(4)->Arg(32)->Arg(256);

} // namespace
