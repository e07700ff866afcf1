#pragma once

#include "Domain/DisplayState.h"
#include "Domain/FileSystemInfo.h"
#include "Domain/HistoryView.h"
#include "Domain/IProcessLookup.h"
#include "Domain/ISeriesStore.h"
#include "Domain/MetricsSnapshot.h"
#include "UI/Layout.h"
#include "UI/PanelTree.h"
#include "UI/Style.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace App::DiskPanel
{

/// Width of the filesystem selector column, in cells.
inline constexpr std::uint16_t SELECTOR_WIDTH = 30;

/// Label column width for the usage detail readout.
inline constexpr std::size_t DETAIL_LABEL_WIDTH = 23;

inline constexpr const char* PANEL_TITLE = "Disk";
inline constexpr const char* SELECTOR_TITLE = "File Systems [(a)ctivity/usage]";
inline constexpr const char* SELECTED_MARKER = "→";

inline constexpr UI::Style READ_STYLE = UI::Style::colored(UI::Color::LightYellow);
inline constexpr UI::Style WRITE_STYLE = UI::Style::colored(UI::Color::LightMagenta);
inline constexpr UI::Style USED_SPACE_STYLE = UI::Style::colored(UI::Color::LightYellow);
inline constexpr UI::Style VALUE_STYLE = UI::Style::colored(UI::Color::Green);
inline constexpr UI::Style HEALTHY_STYLE = UI::Style::colored(UI::Color::Green);
inline constexpr UI::Style ALERT_STYLE = UI::Style::colored(UI::Color::Red).withBold();

/// Everything one frame of the disk panel reads. All members are borrowed for the call.
struct RenderContext
{
    const Domain::MetricsSnapshot& snapshot;
    const Domain::ISeriesStore& series;
    const Domain::IProcessLookup& processes;
    Domain::DisplayState state;
    Domain::HistoryView view;
    UI::Style borderStyle;
};

/// Compose the whole panel into area: outer block, selector list, and the detail view
/// picked by state.mode. Pure: the same inputs always produce the same tree.
[[nodiscard]] UI::PanelTree renderDiskPanel(const RenderContext& ctx, const UI::Rect& area);

/// Two self-scaled strips (read in rows[0], write in rows[1]).
/// Appends nothing unless both series are available.
void renderActivity(const RenderContext& ctx, std::span<const UI::Rect> rows, UI::PanelTree& tree);

/// Used-space strip for the selected filesystem in rows[0], details in rows[1].
/// Appends nothing if the selection is out of range or its series is not tracked.
void renderUsage(const RenderContext& ctx, std::span<const UI::Rect> rows, UI::PanelTree& tree);

/// Selector list of every filesystem into area.
void renderSelector(const RenderContext& ctx, const UI::Rect& area, UI::PanelTree& tree);

/// Columns available to each strip when the panel fills area. Hosts size their
/// history queries with it so one point maps to one column.
[[nodiscard]] std::uint16_t stripWidth(const UI::Rect& area);

// Building blocks, exposed for tests

/// max(samples), or 1 when empty or all zero, so a strip never divides by zero.
[[nodiscard]] std::uint64_t scaleMax(const std::vector<std::uint64_t>& samples);

/// "[pid - name - user]" for a resolvable pid; empty otherwise.
[[nodiscard]] std::string attributionLabel(const Domain::IProcessLookup& processes, std::optional<std::int32_t> pid);

/// One selector line, e.g. "→  5%: /home".
[[nodiscard]] std::string selectorLine(const Domain::FileSystemInfo& disk, bool selected);

[[nodiscard]] UI::Style selectorStyle(const Domain::FileSystemInfo& disk);

[[nodiscard]] std::string activityTitle(char direction, double currentBytesPerSec, std::uint64_t peakBytesPerSec, const std::string& attribution);

[[nodiscard]] std::string usageTitle(const Domain::FileSystemInfo& disk);

} // namespace App::DiskPanel
