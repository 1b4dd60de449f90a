#pragma once

#include <shared_data/shared_data.hpp>

#include <optional>
#include <string>

namespace SharedData
{
    /**
     * @brief One host alias from the ssh configuration file.
     */
    struct HostRecord
    {
        std::string alias{};
        std::optional<std::string> hostName{std::nullopt};
        std::optional<std::string> user{std::nullopt};
        std::optional<int> port{std::nullopt};
        std::optional<std::string> identityFilePath{std::nullopt};
        std::optional<std::string> proxyJumpAlias{std::nullopt};

        bool operator==(HostRecord const&) const = default;

        /**
         * @brief "alias (hostName)" or just the alias.
         */
        std::string displayName() const
        {
            if (hostName)
                return alias + " (" + *hostName + ")";
            return alias;
        }
    };
    BOOST_DESCRIBE_STRUCT(HostRecord, (), (alias, hostName, user, port, identityFilePath, proxyJumpAlias))
}
