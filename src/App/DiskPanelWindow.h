#pragma once

#include "App/UserConfig.h"
#include "Domain/DisplayState.h"
#include "Domain/IProcessLookup.h"
#include "Domain/ISeriesStore.h"
#include "Domain/MetricsSnapshot.h"
#include "UI/ImGuiPainter.h"
#include "UI/Style.h"

#include <cstddef>
#include <string>

namespace App
{

/// ImGui window hosting the disk panel.
/// Owns the display state (mode + selection) and turns key presses into state changes;
/// everything it draws comes from App::DiskPanel.
class DiskPanelWindow
{
  public:
    /// Non-owning views of the metrics the panel draws; must outlive the render call.
    struct Sources
    {
        const Domain::MetricsSnapshot* snapshot = nullptr;
        const Domain::ISeriesStore* series = nullptr;
        const Domain::IProcessLookup* processes = nullptr;
    };

    explicit DiskPanelWindow(const UserConfig& config);
    ~DiskPanelWindow() = default;

    DiskPanelWindow(const DiskPanelWindow&) = delete;
    DiskPanelWindow& operator=(const DiskPanelWindow&) = delete;
    DiskPanelWindow(DiskPanelWindow&&) = delete;
    DiskPanelWindow& operator=(DiskPanelWindow&&) = delete;

    /// Point the panel at this frame's metrics.
    void setSources(const Sources& sources);

    /// Draw one frame. If open is nullptr, the window has no close button.
    void render(bool* open);

    [[nodiscard]] const std::string& name() const noexcept
    {
        return m_Name;
    }

    /// 'a': flip between activity and usage.
    void toggleDisplayMode();

    /// Down arrow. Wraps to the first filesystem.
    void selectNext(std::size_t fileSystemCount);

    /// Up arrow. Wraps to the last filesystem.
    void selectPrevious(std::size_t fileSystemCount);

    [[nodiscard]] const Domain::DisplayState& displayState() const noexcept
    {
        return m_State;
    }

  private:
    void handleKeys(std::size_t fileSystemCount);

    std::string m_Name = "Disk";
    const UserConfig& m_Config;
    Sources m_Sources;
    Domain::DisplayState m_State;
    UI::Style m_BorderStyle = UI::Style::plain();
    UI::ImGuiPainter m_Painter;
};

} // namespace App
