#include "DiskPanelWindow.h"

#include "App/DiskPanel.h"
#include "App/UserConfig.h"
#include "Domain/DisplayState.h"
#include "UI/ImGuiPainter.h"

#include <imgui.h>
#include <spdlog/spdlog.h>

#include <cstddef>

namespace App
{

DiskPanelWindow::DiskPanelWindow(const UserConfig& config)
    : m_Config(config), m_State(config.displayState())
{
    spdlog::debug("DiskPanelWindow: starting in {} mode, selection {}", toConfigString(m_State.mode), m_State.selectedIndex);
}

void DiskPanelWindow::setSources(const Sources& sources)
{
    m_Sources = sources;
}

void DiskPanelWindow::toggleDisplayMode()
{
    m_State.mode = Domain::toggled(m_State.mode);
    spdlog::debug("DiskPanelWindow: switched to {} mode", toConfigString(m_State.mode));
}

void DiskPanelWindow::selectNext(std::size_t fileSystemCount)
{
    if (fileSystemCount == 0)
    {
        return;
    }
    m_State.selectedIndex = (m_State.selectedIndex + 1 < fileSystemCount) ? m_State.selectedIndex + 1 : 0;
}

void DiskPanelWindow::selectPrevious(std::size_t fileSystemCount)
{
    if (fileSystemCount == 0)
    {
        return;
    }
    // An index left over from a longer list snaps back into range
    if (m_State.selectedIndex == 0 || m_State.selectedIndex >= fileSystemCount)
    {
        m_State.selectedIndex = fileSystemCount - 1;
        return;
    }
    --m_State.selectedIndex;
}

void DiskPanelWindow::handleKeys(std::size_t fileSystemCount)
{
    if (!ImGui::IsWindowFocused(ImGuiFocusedFlags_RootAndChildWindows))
    {
        return;
    }

    if (ImGui::IsKeyPressed(ImGuiKey_A, false))
    {
        toggleDisplayMode();
    }
    if (ImGui::IsKeyPressed(ImGuiKey_DownArrow))
    {
        selectNext(fileSystemCount);
    }
    if (ImGui::IsKeyPressed(ImGuiKey_UpArrow))
    {
        selectPrevious(fileSystemCount);
    }
}

void DiskPanelWindow::render(bool* open)
{
    if (!ImGui::Begin(m_Name.c_str(), open, ImGuiWindowFlags_NoScrollbar))
    {
        ImGui::End();
        return;
    }

    if (m_Sources.snapshot == nullptr || m_Sources.series == nullptr || m_Sources.processes == nullptr)
    {
        ImGui::TextDisabled("Disk metrics not available");
        ImGui::End();
        return;
    }

    handleKeys(m_Sources.snapshot->disks.size());

    const ImVec2 cellSize = UI::ImGuiPainter::currentCellSize();
    const ImVec2 origin = ImGui::GetCursorScreenPos();
    const ImVec2 avail = ImGui::GetContentRegionAvail();
    const UI::Rect area = UI::ImGuiPainter::cellsFor(avail, cellSize);

    const DiskPanel::RenderContext ctx{.snapshot = *m_Sources.snapshot,
                                       .series = *m_Sources.series,
                                       .processes = *m_Sources.processes,
                                       .state = m_State,
                                       .view = m_Config.historyView(DiskPanel::stripWidth(area)),
                                       .borderStyle = m_BorderStyle};

    const UI::PanelTree tree = DiskPanel::renderDiskPanel(ctx, area);
    m_Painter.paint(tree, origin, cellSize);

    // Claim the painted region so ImGui sizes the window content correctly.
    ImGui::SetCursorScreenPos(origin);
    ImGui::Dummy(ImVec2(static_cast<float>(area.width) * cellSize.x, static_cast<float>(area.height) * cellSize.y));

    ImGui::End();
}

} // namespace App
