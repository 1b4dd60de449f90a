#include <persistence/host_config_store.hpp>
#include <persistence/ssh_config_parser.hpp>

#include <log/log.hpp>
#include <utility/home_directory.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <system_error>

namespace Persistence
{
    HostConfigStore::HostConfigStore(std::filesystem::path const& configPath, std::filesystem::path homeDirectory)
        : homeDirectory_{std::move(homeDirectory)}
        , configPath_{Utility::expandTilde(configPath.string(), homeDirectory_)}
        , guard_{}
        , hosts_{}
        , modificationTime_{std::nullopt}
        , lastError_{std::nullopt}
    {}

    HostConfigStore::HostConfigStore(std::filesystem::path const& configPath)
        : HostConfigStore{configPath, Utility::homeDirectory()}
    {}

    std::shared_ptr<HostConfigStore::HostList const> HostConfigStore::emptyResult(std::optional<std::string> error)
    {
        hosts_ = std::make_shared<HostList const>();
        modificationTime_ = std::nullopt;
        lastError_ = std::move(error);
        return hosts_;
    }

    std::shared_ptr<HostConfigStore::HostList const> HostConfigStore::load()
    {
        std::scoped_lock lock{guard_};

        std::error_code ec;
        const auto status = std::filesystem::status(configPath_, ec);
        if (!std::filesystem::exists(status))
        {
            if (!hosts_ || modificationTime_)
                Log::warn("ssh config file not found: {}", configPath_.string());
            return emptyResult(std::nullopt);
        }
        if (std::filesystem::is_directory(status))
        {
            Log::error("ssh config path is a directory, not a file: {}", configPath_.string());
            return emptyResult("SSH config path is a directory, not a file");
        }

        const auto modificationTime = std::filesystem::last_write_time(configPath_, ec);
        if (ec)
        {
            Log::error("Cannot stat ssh config file '{}': {}", configPath_.string(), ec.message());
            return emptyResult("Failed to read SSH config file: " + ec.message());
        }

        if (hosts_ && modificationTime_ && *modificationTime_ == modificationTime)
            return hosts_;

        std::ifstream reader{configPath_};
        if (!reader.good())
        {
            const int error = errno;
            if (error == EACCES)
            {
                Log::error("Cannot read ssh config file '{}': permission denied", configPath_.string());
                return emptyResult("Cannot read SSH config file: permission denied");
            }
            Log::error("Cannot read ssh config file '{}': {}", configPath_.string(), std::strerror(error));
            return emptyResult(std::string{"Failed to read SSH config file: "} + std::strerror(error));
        }

        auto parsed = std::make_shared<HostList const>(parseSshConfig(reader, homeDirectory_));
        Log::debug("Parsed {} host(s) from '{}'.", parsed->size(), configPath_.string());

        hosts_ = std::move(parsed);
        modificationTime_ = modificationTime;
        lastError_ = std::nullopt;
        return hosts_;
    }

    std::optional<SharedData::HostRecord> HostConfigStore::findByAlias(std::string_view alias)
    {
        const auto hosts = load();
        const auto iter = std::find_if(hosts->begin(), hosts->end(), [alias](auto const& host) {
            return host.alias == alias;
        });
        if (iter == hosts->end())
            return std::nullopt;
        return *iter;
    }

    void HostConfigStore::invalidate()
    {
        std::scoped_lock lock{guard_};
        hosts_.reset();
        modificationTime_ = std::nullopt;
    }

    std::optional<std::string> HostConfigStore::lastError() const
    {
        std::scoped_lock lock{guard_};
        return lastError_;
    }

    std::filesystem::path const& HostConfigStore::configPath() const
    {
        return configPath_;
    }
}
