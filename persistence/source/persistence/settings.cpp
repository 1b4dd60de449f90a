#include <persistence/settings.hpp>

#include <utility/home_directory.hpp>

#include <cstdlib>

namespace Persistence
{
    namespace
    {
        constexpr long long defaultTransferTimeoutMs = 300'000;
        constexpr long long defaultListingTimeoutMs = 30'000;
        constexpr long long defaultProgressThrottleMs = 500;
    }

    void SyncDefaults::useDefaultsFrom(SyncDefaults const& other)
    {
        if (!humanReadable.has_value())
            humanReadable = other.humanReadable;
        if (!progress.has_value())
            progress = other.progress;
        if (!deleteExtraneous.has_value())
            deleteExtraneous = other.deleteExtraneous;
    }
    void to_json(nlohmann::json& j, SyncDefaults const& options)
    {
        j = nlohmann::json::object();
        TO_JSON_OPTIONAL(j, options, humanReadable);
        TO_JSON_OPTIONAL(j, options, progress);
        TO_JSON_OPTIONAL(j, options, deleteExtraneous);
    }
    void from_json(nlohmann::json const& j, SyncDefaults& options)
    {
        FROM_JSON_OPTIONAL(j, options, humanReadable);
        FROM_JSON_OPTIONAL(j, options, progress);
        FROM_JSON_OPTIONAL(j, options, deleteExtraneous);
    }

    void ToolPaths::useDefaultsFrom(ToolPaths const& other)
    {
        if (!scp.has_value())
            scp = other.scp;
        if (!rsync.has_value())
            rsync = other.rsync;
        if (!ssh.has_value())
            ssh = other.ssh;
    }
    void to_json(nlohmann::json& j, ToolPaths const& options)
    {
        j = nlohmann::json::object();
        TO_JSON_OPTIONAL(j, options, scp);
        TO_JSON_OPTIONAL(j, options, rsync);
        TO_JSON_OPTIONAL(j, options, ssh);
    }
    void from_json(nlohmann::json const& j, ToolPaths& options)
    {
        FROM_JSON_OPTIONAL(j, options, scp);
        FROM_JSON_OPTIONAL(j, options, rsync);
        FROM_JSON_OPTIONAL(j, options, ssh);
    }

    void Settings::useDefaultsFrom(Settings const& other)
    {
        if (!sshConfigPath.has_value())
            sshConfigPath = other.sshConfigPath;
        if (!transferTimeoutMs.has_value())
            transferTimeoutMs = other.transferTimeoutMs;
        if (!listingTimeoutMs.has_value())
            listingTimeoutMs = other.listingTimeoutMs;
        if (!progressThrottleMs.has_value())
            progressThrottleMs = other.progressThrottleMs;
        if (!defaultMode.has_value())
            defaultMode = other.defaultMode;
        if (!sync.has_value())
            sync = other.sync;
        else if (other.sync.has_value())
            sync->useDefaultsFrom(*other.sync);
        if (!strictRemotePaths.has_value())
            strictRemotePaths = other.strictRemotePaths;
        if (!tools.has_value())
            tools = other.tools;
        else if (other.tools.has_value())
            tools->useDefaultsFrom(*other.tools);
        if (!logLevel.has_value())
            logLevel = other.logLevel;
        if (!logFile.has_value())
            logFile = other.logFile;
    }

    Settings Settings::defaults()
    {
        return Settings{
            .sshConfigPath = "~/.ssh/config",
            .transferTimeoutMs = defaultTransferTimeoutMs,
            .listingTimeoutMs = defaultListingTimeoutMs,
            .progressThrottleMs = defaultProgressThrottleMs,
            .defaultMode = "IncrementalSync",
            .sync =
                SyncDefaults{
                    .humanReadable = false,
                    .progress = false,
                    .deleteExtraneous = false,
                },
            .strictRemotePaths = false,
            .tools =
                ToolPaths{
                    .scp = "scp",
                    .rsync = "rsync",
                    .ssh = "ssh",
                },
            .logLevel = "info",
            .logFile = std::nullopt,
        };
    }

    std::chrono::milliseconds Settings::transferTimeout() const
    {
        return std::chrono::milliseconds{transferTimeoutMs.value_or(defaultTransferTimeoutMs)};
    }
    std::chrono::milliseconds Settings::listingTimeout() const
    {
        return std::chrono::milliseconds{listingTimeoutMs.value_or(defaultListingTimeoutMs)};
    }
    std::chrono::milliseconds Settings::progressThrottle() const
    {
        return std::chrono::milliseconds{progressThrottleMs.value_or(defaultProgressThrottleMs)};
    }

    void to_json(nlohmann::json& j, Settings const& settings)
    {
        j = nlohmann::json::object();
        TO_JSON_OPTIONAL(j, settings, sshConfigPath);
        TO_JSON_OPTIONAL(j, settings, transferTimeoutMs);
        TO_JSON_OPTIONAL(j, settings, listingTimeoutMs);
        TO_JSON_OPTIONAL(j, settings, progressThrottleMs);
        TO_JSON_OPTIONAL(j, settings, defaultMode);
        TO_JSON_OPTIONAL(j, settings, sync);
        TO_JSON_OPTIONAL(j, settings, strictRemotePaths);
        TO_JSON_OPTIONAL(j, settings, tools);
        TO_JSON_OPTIONAL(j, settings, logLevel);
        TO_JSON_OPTIONAL(j, settings, logFile);
    }
    void from_json(nlohmann::json const& j, Settings& settings)
    {
        FROM_JSON_OPTIONAL(j, settings, sshConfigPath);
        FROM_JSON_OPTIONAL(j, settings, transferTimeoutMs);
        FROM_JSON_OPTIONAL(j, settings, listingTimeoutMs);
        FROM_JSON_OPTIONAL(j, settings, progressThrottleMs);
        FROM_JSON_OPTIONAL(j, settings, defaultMode);
        FROM_JSON_OPTIONAL(j, settings, sync);
        FROM_JSON_OPTIONAL(j, settings, strictRemotePaths);
        FROM_JSON_OPTIONAL(j, settings, tools);
        FROM_JSON_OPTIONAL(j, settings, logLevel);
        FROM_JSON_OPTIONAL(j, settings, logFile);
    }

    std::filesystem::path defaultSettingsPath()
    {
        if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg != nullptr && *xdg != '\0')
            return std::filesystem::path{xdg} / "hostxfer" / "settings.json";
        return Utility::homeDirectory() / ".config" / "hostxfer" / "settings.json";
    }
}
