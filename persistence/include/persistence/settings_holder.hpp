#pragma once

#include <persistence/settings.hpp>

#include <filesystem>

namespace Persistence
{
    /**
     * @brief Owns the settings loaded from one settings file.
     */
    class SettingsHolder
    {
      public:
        explicit SettingsHolder(std::filesystem::path path = defaultSettingsPath());

        /**
         * @brief Loads the settings file and fills unset fields with defaults.
         * A missing file is not an error. A broken file is backed up and replaced by defaults in memory.
         *
         * @return false if the file existed but could not be read or parsed.
         */
        bool load();

        /**
         * @brief Writes the current settings to the settings file, creating parent directories.
         */
        bool save() const;

        Settings& settings();
        Settings const& settings() const;
        std::filesystem::path const& path() const;

      private:
        std::filesystem::path path_;
        Settings settings_;
    };
}
