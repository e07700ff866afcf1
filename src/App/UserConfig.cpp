#include "UserConfig.h"

#include "Domain/DisplayState.h"
#include "Domain/HistoryView.h"
#include "Domain/Numeric.h"
#include "Domain/SamplingConfig.h"

#include <spdlog/spdlog.h>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include <pwd.h>
#include <toml++/toml.hpp>
#include <unistd.h>

namespace App
{

namespace
{

[[nodiscard]] auto readEnvVarString(const char* name) -> std::optional<std::string>
{
    const char* value = std::getenv(name); // NOLINT(concurrency-mt-unsafe)
    if (value == nullptr || value[0] == '\0')
    {
        return std::nullopt;
    }
    return std::string(value);
}

[[nodiscard]] auto displayModeFromString(std::string_view text) -> std::optional<Domain::DisplayMode>
{
    if (text == "activity")
    {
        return Domain::DisplayMode::Activity;
    }
    if (text == "usage")
    {
        return Domain::DisplayMode::Usage;
    }
    return std::nullopt;
}

void applyTable(const toml::table& config, UserSettings& settings)
{
    if (auto val = config["sampling"]["interval_ms"].value<std::int64_t>())
    {
        settings.refreshIntervalMs =
            Domain::Sampling::clampRefreshInterval(Domain::Numeric::narrowOr<int>(*val, Domain::Sampling::REFRESH_INTERVAL_DEFAULT_MS));
    }

    if (auto val = config["sampling"]["history_max_seconds"].value<std::int64_t>())
    {
        settings.maxHistorySeconds =
            Domain::Sampling::clampHistorySeconds(Domain::Numeric::narrowOr<int>(*val, Domain::Sampling::HISTORY_SECONDS_DEFAULT));
    }

    if (auto val = config["disk"]["display"].value<std::string>())
    {
        if (const auto mode = displayModeFromString(*val))
        {
            settings.displayMode = *mode;
        }
        else
        {
            spdlog::warn("Unknown disk.display '{}', keeping '{}'", *val, toConfigString(settings.displayMode));
        }
    }

    if (auto val = config["disk"]["selected"].value<std::int64_t>())
    {
        // Negative indices make no sense; out-of-range positives are tolerated by the panel
        settings.selectedFileSystem = Domain::Numeric::narrowOr<std::size_t>(*val, std::size_t{0});
    }

    if (auto val = config["disk"]["zoom"].value<std::int64_t>())
    {
        settings.zoomFactor =
            Domain::Sampling::clampZoomFactor(Domain::Numeric::narrowOr<int>(*val, Domain::Sampling::ZOOM_FACTOR_DEFAULT));
    }

    if (auto val = config["logging"]["level"].value<std::string>())
    {
        settings.logLevel = *val;
    }
}

} // namespace

const char* toConfigString(Domain::DisplayMode mode) noexcept
{
    switch (mode)
    {
    case Domain::DisplayMode::Activity:
        return "activity";
    case Domain::DisplayMode::Usage:
        return "usage";
    }
    return "activity";
}

auto UserConfig::get() -> UserConfig&
{
    static UserConfig instance(getConfigDirectory() / "config.toml");
    return instance;
}

UserConfig::UserConfig(std::filesystem::path configPath) : m_ConfigPath(std::move(configPath))
{
    spdlog::debug("Config path: {}", m_ConfigPath.string());
}

auto UserConfig::getConfigDirectory() -> std::filesystem::path
{
    // XDG_CONFIG_HOME or ~/.config
    if (auto xdgConfig = readEnvVarString("XDG_CONFIG_HOME"))
    {
        return std::filesystem::path(*xdgConfig) / "diskpane";
    }

    if (auto homeEnv = readEnvVarString("HOME"))
    {
        return std::filesystem::path(*homeEnv) / ".config" / "diskpane";
    }

    // Last resort: use passwd entry
    if (const auto* pw = getpwuid(getuid()))
    {
        return std::filesystem::path(pw->pw_dir) / ".config" / "diskpane";
    }

    return std::filesystem::current_path();
}

void UserConfig::load()
{
    std::error_code ec;
    if (!std::filesystem::exists(m_ConfigPath, ec))
    {
        spdlog::info("No config file found at {}, using defaults", m_ConfigPath.string());
        return;
    }

    try
    {
        const auto config = toml::parse_file(m_ConfigPath.string());
        applyTable(config, m_Settings);
        spdlog::info("Loaded config from {}", m_ConfigPath.string());
    }
    catch (const toml::parse_error& err)
    {
        spdlog::warn("Failed to parse config file {}: {}", m_ConfigPath.string(), err.what());
    }
}

bool UserConfig::loadFromString(std::string_view text)
{
    try
    {
        const auto config = toml::parse(text);
        applyTable(config, m_Settings);
        return true;
    }
    catch (const toml::parse_error& err)
    {
        spdlog::warn("Failed to parse config text: {}", err.what());
        return false;
    }
}

void UserConfig::save() const
{
    const std::filesystem::path configDir = m_ConfigPath.parent_path();
    if (!configDir.empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(configDir, ec);
        if (ec)
        {
            spdlog::error("Failed to create config directory {}: {}", configDir.string(), ec.message());
            return;
        }
    }

    const auto config = toml::table{
        {"sampling",
         toml::table{
             {"interval_ms", Domain::Sampling::clampRefreshInterval(m_Settings.refreshIntervalMs)},
             {"history_max_seconds", Domain::Sampling::clampHistorySeconds(m_Settings.maxHistorySeconds)},
         }},
        {"disk",
         toml::table{
             {"display", toConfigString(m_Settings.displayMode)},
             {"selected", Domain::Numeric::narrowOr<std::int64_t>(m_Settings.selectedFileSystem, std::int64_t{0})},
             {"zoom", Domain::Sampling::clampZoomFactor(m_Settings.zoomFactor)},
         }},
        {"logging", toml::table{{"level", m_Settings.logLevel}}},
    };

    std::ofstream file(m_ConfigPath);
    if (!file)
    {
        spdlog::error("Failed to open config file for writing: {}", m_ConfigPath.string());
        return;
    }

    file << "# DiskPane user configuration\n";
    file << "# - sampling: interval_ms controls refresh cadence (ms); history_max_seconds caps strip history.\n";
    file << "# - disk: display is \"activity\" or \"usage\"; zoom folds that many samples into one strip column.\n\n";
    file << config;

    spdlog::info("Saved config to {}", m_ConfigPath.string());
}

auto UserConfig::displayState() const -> Domain::DisplayState
{
    return {.mode = m_Settings.displayMode, .selectedIndex = m_Settings.selectedFileSystem};
}

auto UserConfig::historyView(std::size_t width) const -> Domain::HistoryView
{
    return {.width = width,
            .zoomFactor = static_cast<std::size_t>(Domain::Sampling::clampZoomFactor(m_Settings.zoomFactor)),
            .offset = 0};
}

auto UserConfig::historyCapacity() const -> std::size_t
{
    return Domain::Sampling::historyCapacity(m_Settings.maxHistorySeconds, m_Settings.refreshIntervalMs);
}

void UserConfig::applyLogLevel() const
{
    const auto level = spdlog::level::from_str(m_Settings.logLevel);
    if (level == spdlog::level::off && m_Settings.logLevel != "off")
    {
        spdlog::warn("Unknown log level '{}', keeping current level", m_Settings.logLevel);
        return;
    }

    spdlog::set_level(level);
    spdlog::debug("Log level set to {}", m_Settings.logLevel);
}

} // namespace App
