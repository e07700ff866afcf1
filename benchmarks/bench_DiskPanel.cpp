// Benchmarks for App/DiskPanel
//
// renderDiskPanel() runs once per frame; it should stay well under a
// millisecond even with many mounted filesystems.

#include "App/DiskPanel.h"
#include "Domain/DisplayState.h"
#include "Domain/MetricsSnapshot.h"
#include "Domain/ProcessInfo.h"
#include "Domain/ProcessTable.h"
#include "Domain/SeriesKind.h"
#include "Domain/SeriesStore.h"
#include "UI/Layout.h"
#include "UI/Style.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <benchmark/benchmark.h>

namespace
{

struct PanelFixture
{
    Domain::MetricsSnapshot snapshot;
    Domain::SeriesStore series{600};
    Domain::ProcessTable processes;

    explicit PanelFixture(std::size_t fileSystems)
    {
        for (std::size_t i = 0; i < fileSystems; ++i)
        {
            const std::string name = "/dev/nvme0n1p" + std::to_string(i);
            snapshot.disks.push_back({.name = name,
                                      .mountPoint = "/mnt/" + std::to_string(i),
                                      .fileSystem = "ext4",
                                      .sizeBytes = 500ULL << 30U,
                                      .availableBytes = (i * 7ULL) << 30U});
            for (std::uint64_t s = 0; s < 600; ++s)
            {
                series.push(Domain::SeriesKind::fileSystemUsedSpace(name), (200ULL << 30U) + s);
            }
        }

        for (std::uint64_t s = 0; s < 600; ++s)
        {
            series.push(Domain::SeriesKind::ioRead(), (s * 7919) % 100000);
            series.push(Domain::SeriesKind::ioWrite(), (s * 104729) % 100000);
        }

        processes.update({{.pid = 100, .ioReadBytesPerSec = 5000.0, .ioWriteBytesPerSec = 0.0, .name = "postgres", .user = "db"}});
        snapshot.topDiskReaderPid = processes.topDiskReader();
        snapshot.diskReadBytesPerSec = 5000.0;
    }
};

static void renderMode(benchmark::State& state, Domain::DisplayMode mode)
{
    const PanelFixture fixture(static_cast<std::size_t>(state.range(0)));
    const UI::Rect area{.x = 0, .y = 0, .width = 160, .height = 40};

    const App::DiskPanel::RenderContext ctx{.snapshot = fixture.snapshot,
                                            .series = fixture.series,
                                            .processes = fixture.processes,
                                            .state = {.mode = mode, .selectedIndex = 0},
                                            .view = {.width = App::DiskPanel::stripWidth(area), .zoomFactor = 1, .offset = 0},
                                            .borderStyle = UI::Style::plain()};

    for (auto _ : state)
    {
        auto tree = App::DiskPanel::renderDiskPanel(ctx, area);
        benchmark::DoNotOptimize(tree.size());
    }
}

static void BM_DiskPanel_RenderActivity(benchmark::State& state)
{
    renderMode(state, Domain::DisplayMode::Activity);
}
BENCHMARK(BM_DiskPanel_RenderActivity)->Arg(1)->Arg(8)->Arg(64);

static void BM_DiskPanel_RenderUsage(benchmark::State& state)
{
    renderMode(state, Domain::DisplayMode::Usage);
}
BENCHMARK(BM_DiskPanel_RenderUsage)->Arg(1)->Arg(8)->Arg(64);

} // namespace
