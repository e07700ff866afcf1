#include "DiskPanel.h"

#include "Domain/SeriesKind.h"
#include "UI/Format.h"
#include "UI/Layout.h"
#include "UI/PanelTree.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <format>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace App::DiskPanel
{

namespace
{

using UI::Format::formatBytes;

[[nodiscard]] std::string padLabel(const char* label)
{
    return std::format("{:<{}}", label, DETAIL_LABEL_WIDTH);
}

[[nodiscard]] UI::Line detailLine(const char* label, std::string value)
{
    return {UI::Span::raw(padLabel(label)), UI::Span::styled(std::move(value), VALUE_STYLE)};
}

struct PanelLayout
{
    UI::Rect selector;
    std::vector<UI::Rect> rows;
};

/// Selector column on the left, detail column split into two equal rows on the right.
[[nodiscard]] PanelLayout layoutFor(const UI::Rect& area)
{
    const auto panes = UI::Layout::split(
        area, UI::Direction::Horizontal, 0, {UI::Constraint::length(SELECTOR_WIDTH), UI::Constraint::min(10)});
    return {.selector = panes[0], .rows = UI::Layout::splitEven(panes[1], UI::Direction::Vertical, 1)};
}

} // namespace

std::uint16_t stripWidth(const UI::Rect& area)
{
    return layoutFor(area).rows[0].width;
}

std::uint64_t scaleMax(const std::vector<std::uint64_t>& samples)
{
    if (samples.empty())
    {
        return 1;
    }
    return std::max<std::uint64_t>(*std::ranges::max_element(samples), 1);
}

std::string attributionLabel(const Domain::IProcessLookup& processes, std::optional<std::int32_t> pid)
{
    if (!pid.has_value())
    {
        return {};
    }

    const auto process = processes.lookup(*pid);
    if (!process.has_value())
    {
        spdlog::trace("DiskPanel: pid {} no longer in process table", *pid);
        return {};
    }

    return std::format("[{} - {} - {}]", process->pid, process->name, process->user);
}

std::string selectorLine(const Domain::FileSystemInfo& disk, bool selected)
{
    return std::format("{}{:3.0f}%: {}", selected ? SELECTED_MARKER : " ", disk.percentFree(), disk.mountPoint);
}

UI::Style selectorStyle(const Domain::FileSystemInfo& disk)
{
    return disk.isLowOnSpace() ? ALERT_STYLE : HEALTHY_STYLE;
}

std::string activityTitle(char direction, double currentBytesPerSec, std::uint64_t peakBytesPerSec, const std::string& attribution)
{
    return std::format("{} [{:^10}/s] Max [{:^10}/s] {}",
                       direction,
                       formatBytes(std::max(0.0, currentBytesPerSec)),
                       formatBytes(peakBytesPerSec),
                       attribution);
}

std::string usageTitle(const Domain::FileSystemInfo& disk)
{
    return std::format("{}  ↓Used [{:^10} ({:.1f}%)] Free [{:^10} ({:.1f}%)] Size [{:^10}]",
                       disk.name,
                       formatBytes(disk.usedBytes()),
                       disk.percentUsed(),
                       formatBytes(disk.availableBytes),
                       disk.percentFree(),
                       formatBytes(disk.sizeBytes));
}

UI::PanelTree renderDiskPanel(const RenderContext& ctx, const UI::Rect& area)
{
    UI::PanelTree tree;

    tree.add(UI::BlockElement{
        .area = area, .title = PANEL_TITLE, .titleStyle = ctx.borderStyle, .borderStyle = ctx.borderStyle, .borders = true});

    const PanelLayout layout = layoutFor(area);

    switch (ctx.state.mode)
    {
    case Domain::DisplayMode::Activity:
        renderActivity(ctx, layout.rows, tree);
        break;
    case Domain::DisplayMode::Usage:
        renderUsage(ctx, layout.rows, tree);
        break;
    }

    renderSelector(ctx, layout.selector, tree);
    return tree;
}

void renderActivity(const RenderContext& ctx, std::span<const UI::Rect> rows, UI::PanelTree& tree)
{
    if (rows.size() < 2)
    {
        return;
    }

    auto reads = ctx.series.lookup(Domain::SeriesKind::ioRead(), ctx.view);
    if (!reads.has_value())
    {
        spdlog::trace("DiskPanel: no read history for this view yet");
        return;
    }

    auto writes = ctx.series.lookup(Domain::SeriesKind::ioWrite(), ctx.view);
    if (!writes.has_value())
    {
        spdlog::trace("DiskPanel: no write history for this view yet");
        return;
    }

    const std::uint64_t readMax = scaleMax(*reads);
    const std::uint64_t writeMax = scaleMax(*writes);

    const std::string topReader = attributionLabel(ctx.processes, ctx.snapshot.topDiskReaderPid);
    const std::string topWriter = attributionLabel(ctx.processes, ctx.snapshot.topDiskWriterPid);

    tree.add(UI::SparklineElement{.area = rows[0],
                                  .title = activityTitle('R', ctx.snapshot.diskReadBytesPerSec, readMax, topReader),
                                  .data = std::move(*reads),
                                  .max = readMax,
                                  .style = READ_STYLE});

    tree.add(UI::SparklineElement{.area = rows[1],
                                  .title = activityTitle('W', ctx.snapshot.diskWriteBytesPerSec, writeMax, topWriter),
                                  .data = std::move(*writes),
                                  .max = writeMax,
                                  .style = WRITE_STYLE});
}

void renderUsage(const RenderContext& ctx, std::span<const UI::Rect> rows, UI::PanelTree& tree)
{
    if (rows.size() < 2)
    {
        return;
    }

    const auto& disks = ctx.snapshot.disks;
    if (ctx.state.selectedIndex >= disks.size())
    {
        spdlog::trace("DiskPanel: selection {} out of range ({} filesystems)", ctx.state.selectedIndex, disks.size());
        return;
    }

    const auto& disk = disks[ctx.state.selectedIndex];
    auto used = ctx.series.lookup(Domain::SeriesKind::fileSystemUsedSpace(disk.name), ctx.view);
    if (!used.has_value())
    {
        spdlog::trace("DiskPanel: no used-space history for '{}'", disk.name);
        return;
    }

    // Fixed scale: the strip shows absolute headroom, not relative movement.
    tree.add(UI::SparklineElement{.area = rows[0],
                                  .title = usageTitle(disk),
                                  .data = std::move(*used),
                                  .max = std::max<std::uint64_t>(disk.sizeBytes, 1),
                                  .style = USED_SPACE_STYLE});

    const auto columns = UI::Layout::splitEven(rows[1], UI::Direction::Horizontal, 1);

    tree.add(UI::ParagraphElement{.area = columns[0],
                                  .lines = {
                                      detailLine("Name:", disk.name),
                                      detailLine("File System", disk.fileSystem),
                                      detailLine("Mount Point:", disk.mountPoint),
                                  }});

    tree.add(UI::ParagraphElement{.area = columns[1],
                                  .lines = {
                                      detailLine("Size:", formatBytes(disk.sizeBytes)),
                                      detailLine("Used", formatBytes(disk.usedBytes())),
                                      detailLine("Free:", formatBytes(disk.availableBytes)),
                                  }});
}

void renderSelector(const RenderContext& ctx, const UI::Rect& area, UI::PanelTree& tree)
{
    UI::ListElement list{.area = area, .title = SELECTOR_TITLE, .borderStyle = ctx.borderStyle, .items = {}};
    list.items.reserve(ctx.snapshot.disks.size());

    for (std::size_t i = 0; i < ctx.snapshot.disks.size(); ++i)
    {
        const auto& disk = ctx.snapshot.disks[i];
        list.items.push_back(UI::Span::styled(selectorLine(disk, i == ctx.state.selectedIndex), selectorStyle(disk)));
    }

    tree.add(std::move(list));
}

} // namespace App::DiskPanel
