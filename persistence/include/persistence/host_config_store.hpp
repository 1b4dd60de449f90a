#pragma once

#include <shared_data/host_record.hpp>

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Persistence
{
    /**
     * @brief Holds the host records of one ssh configuration file.
     *
     * The parsed list is cached together with the modification time of the file and only re-parsed
     * when that time changes or the cache was invalidated. The list is replaced as a whole, never
     * modified, so handed out lists stay valid. All functions are thread safe.
     */
    class HostConfigStore
    {
      public:
        using HostList = std::vector<SharedData::HostRecord>;

        /**
         * @param configPath Path of the ssh configuration file, "~" is expanded.
         * @param homeDirectory Used for "~" in the config path and IdentityFile values.
         */
        HostConfigStore(std::filesystem::path const& configPath, std::filesystem::path homeDirectory);
        explicit HostConfigStore(std::filesystem::path const& configPath);

        /**
         * @brief The hosts of the configuration file. A missing or unreadable file yields an empty list.
         */
        std::shared_ptr<HostList const> load();

        std::optional<SharedData::HostRecord> findByAlias(std::string_view alias);

        /**
         * @brief Forces the next load to re-parse the file.
         */
        void invalidate();

        /**
         * @brief Why the last load produced no hosts from the file, if it failed to read it.
         */
        std::optional<std::string> lastError() const;

        std::filesystem::path const& configPath() const;

      private:
        std::shared_ptr<HostList const> emptyResult(std::optional<std::string> error);

      private:
        std::filesystem::path homeDirectory_;
        std::filesystem::path configPath_;

        mutable std::mutex guard_;
        std::shared_ptr<HostList const> hosts_;
        std::optional<std::filesystem::file_time_type> modificationTime_;
        std::optional<std::string> lastError_;
    };
}
