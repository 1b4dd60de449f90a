#pragma once

#include <persistence/state_core.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace Persistence
{
    /**
     * @brief Default flags for incremental sync transfers.
     */
    struct SyncDefaults
    {
        std::optional<bool> humanReadable{std::nullopt};
        std::optional<bool> progress{std::nullopt};
        std::optional<bool> deleteExtraneous{std::nullopt};

        void useDefaultsFrom(SyncDefaults const& other);
    };
    void to_json(nlohmann::json& j, SyncDefaults const& options);
    void from_json(nlohmann::json const& j, SyncDefaults& options);

    /**
     * @brief Executables of the external tools. Plain names are looked up in PATH by the shell.
     */
    struct ToolPaths
    {
        std::optional<std::string> scp{std::nullopt};
        std::optional<std::string> rsync{std::nullopt};
        std::optional<std::string> ssh{std::nullopt};

        void useDefaultsFrom(ToolPaths const& other);
    };
    void to_json(nlohmann::json& j, ToolPaths const& options);
    void from_json(nlohmann::json const& j, ToolPaths& options);

    struct Settings
    {
        // May start with "~".
        std::optional<std::string> sshConfigPath{std::nullopt};
        std::optional<long long> transferTimeoutMs{std::nullopt};
        std::optional<long long> listingTimeoutMs{std::nullopt};
        std::optional<long long> progressThrottleMs{std::nullopt};
        // "RecursiveCopy" or "IncrementalSync"
        std::optional<std::string> defaultMode{std::nullopt};
        std::optional<SyncDefaults> sync{std::nullopt};
        std::optional<bool> strictRemotePaths{std::nullopt};
        std::optional<ToolPaths> tools{std::nullopt};
        std::optional<std::string> logLevel{std::nullopt};
        std::optional<std::filesystem::path> logFile{std::nullopt};

        void useDefaultsFrom(Settings const& other);

        /**
         * @brief Every field except logFile set to its built-in default.
         */
        static Settings defaults();

        std::chrono::milliseconds transferTimeout() const;
        std::chrono::milliseconds listingTimeout() const;
        std::chrono::milliseconds progressThrottle() const;
    };
    void to_json(nlohmann::json& j, Settings const& settings);
    void from_json(nlohmann::json const& j, Settings& settings);

    /**
     * @brief $XDG_CONFIG_HOME/hostxfer/settings.json, falling back to ~/.config/hostxfer/settings.json.
     */
    std::filesystem::path defaultSettingsPath();
}
