#pragma once

#include "Domain/DisplayState.h"
#include "Domain/HistoryView.h"
#include "Domain/SamplingConfig.h"

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace App
{

/// User configuration settings that persist across sessions
struct UserSettings
{
    // Sampling / refresh interval (milliseconds)
    int refreshIntervalMs = Domain::Sampling::REFRESH_INTERVAL_DEFAULT_MS;

    // Maximum duration of in-memory history buffers (seconds)
    int maxHistorySeconds = Domain::Sampling::HISTORY_SECONDS_DEFAULT;

    // Disk panel start-up state
    Domain::DisplayMode displayMode = Domain::DisplayMode::Activity;
    std::size_t selectedFileSystem = 0;
    int zoomFactor = Domain::Sampling::ZOOM_FACTOR_DEFAULT;

    // spdlog level name ("trace", "debug", "info", "warn", "err", "critical", "off")
    std::string logLevel = "info";
};

[[nodiscard]] const char* toConfigString(Domain::DisplayMode mode) noexcept;

/**
 * @brief Manages user configuration persistence
 *
 * Saves/loads user preferences to a TOML file in the platform-appropriate
 * config directory:
 * - Linux: $XDG_CONFIG_HOME/diskpane/config.toml, or ~/.config/diskpane/config.toml
 */
class UserConfig
{
  public:
    /// Get the singleton instance (default config path)
    static auto get() -> UserConfig&;

    /// Config bound to an explicit file (tests, alternate profiles)
    explicit UserConfig(std::filesystem::path configPath);
    ~UserConfig() = default;

    UserConfig(const UserConfig&) = delete;
    auto operator=(const UserConfig&) -> UserConfig& = delete;
    UserConfig(UserConfig&&) = delete;
    auto operator=(UserConfig&&) -> UserConfig& = delete;

    /// Load settings from the config file (missing file keeps defaults)
    void load();

    /// Parse settings from TOML text. Returns false (and keeps defaults) on a parse error.
    bool loadFromString(std::string_view text);

    /// Save settings to config file
    void save() const;

    [[nodiscard]] auto settings() const -> const UserSettings&
    {
        return m_Settings;
    }

    [[nodiscard]] auto settings() -> UserSettings&
    {
        return m_Settings;
    }

    /// Initial selection state for the disk panel
    [[nodiscard]] auto displayState() const -> Domain::DisplayState;

    /// History query window for a strip width cells wide
    [[nodiscard]] auto historyView(std::size_t width) const -> Domain::HistoryView;

    /// Samples each series must retain to cover the configured history window
    [[nodiscard]] auto historyCapacity() const -> std::size_t;

    /// Apply the configured log level to the default spdlog logger
    void applyLogLevel() const;

    [[nodiscard]] auto configPath() const -> const std::filesystem::path&
    {
        return m_ConfigPath;
    }

  private:
    std::filesystem::path m_ConfigPath;
    UserSettings m_Settings;

    static auto getConfigDirectory() -> std::filesystem::path;
};

} // namespace App
