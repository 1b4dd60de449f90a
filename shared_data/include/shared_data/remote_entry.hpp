#pragma once

#include <shared_data/shared_data.hpp>

#include <string>

namespace SharedData
{
    /**
     * @brief One line of a remote long-format directory listing.
     */
    struct RemoteEntry
    {
        std::string name{};
        bool isDirectory{false};
        // Empty for directories.
        std::string size{};
        std::string permissions{};
        std::string modifiedDate{};

        bool operator==(RemoteEntry const&) const = default;
    };
    BOOST_DESCRIBE_STRUCT(RemoteEntry, (), (name, isDirectory, size, permissions, modifiedDate))
}
