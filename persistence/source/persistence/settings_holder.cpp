#include <persistence/settings_holder.hpp>

#include <log/log.hpp>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <chrono>
#include <fstream>
#include <system_error>

namespace Persistence
{
    namespace
    {
        void makeBackup(std::filesystem::path const& path)
        {
            const auto backupFileName = [&path]() {
                const auto now = std::chrono::system_clock::now();
                const auto time = fmt::format("{:%Y-%m-%d_%H-%M-%S}", std::chrono::floor<std::chrono::seconds>(now));

                return path.parent_path() / (path.filename().string() + ".backup_" + time);
            }();

            std::error_code ec;
            std::filesystem::copy_file(path, backupFileName, std::filesystem::copy_options::overwrite_existing, ec);
            if (ec)
                Log::error("Could not back up settings file to '{}': {}", backupFileName.string(), ec.message());
            else
                Log::info("Copied settings file to backup: {}", backupFileName.string());
        }
    }

    SettingsHolder::SettingsHolder(std::filesystem::path path)
        : path_{std::move(path)}
        , settings_{Settings::defaults()}
    {}

    bool SettingsHolder::load()
    {
        settings_ = Settings{};

        bool good = true;
        try
        {
            std::ifstream reader{path_, std::ios_base::binary};
            if (!reader.good())
            {
                std::error_code ec;
                if (std::filesystem::exists(path_, ec))
                {
                    Log::error("Settings file '{}' exists but cannot be read, using defaults.", path_.string());
                    good = false;
                }
                else
                    Log::debug("Settings file '{}' does not exist, using defaults.", path_.string());
            }
            else
            {
                // allow comments
                const auto json = nlohmann::json::parse(reader, nullptr, true, true);
                if (!json.is_object())
                    throw std::runtime_error("settings root is not an object");
                json.get_to(settings_);
                Log::debug("Loaded settings from '{}'.", path_.string());
            }
        }
        catch (std::exception const& e)
        {
            Log::error("Failed to parse settings file '{}': {}", path_.string(), e.what());
            makeBackup(path_);
            settings_ = Settings{};
            good = false;
        }

        settings_.useDefaultsFrom(Settings::defaults());
        return good;
    }

    bool SettingsHolder::save() const
    {
        std::error_code ec;
        if (path_.has_parent_path())
            std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec)
        {
            Log::error("Cannot create directory for settings file '{}': {}", path_.string(), ec.message());
            return false;
        }

        std::ofstream writer{path_, std::ios_base::binary | std::ios_base::trunc};
        if (!writer.good())
        {
            Log::error("Cannot open settings file '{}' for writing.", path_.string());
            return false;
        }
        writer << nlohmann::json(settings_).dump(4);
        return writer.good();
    }

    Settings& SettingsHolder::settings()
    {
        return settings_;
    }
    Settings const& SettingsHolder::settings() const
    {
        return settings_;
    }
    std::filesystem::path const& SettingsHolder::path() const
    {
        return path_;
    }
}
