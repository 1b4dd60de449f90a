#pragma once

#include <shared_data/transfer_request.hpp>

#include <string>

namespace SharedData
{
    /**
     * @brief A complete shell command line. Every caller supplied string in it is escaped,
     * only a leading "~" of a remote path is left for the remote shell to expand.
     */
    struct BuiltCommand
    {
        std::string commandLine{};
        TransferDirection direction{TransferDirection::Upload};
        TransferMode mode{TransferMode::IncrementalSync};
        // Whether the command prints progress lines (rsync -P).
        bool reportsProgress{false};
    };
    BOOST_DESCRIBE_STRUCT(BuiltCommand, (), (commandLine, direction, mode, reportsProgress))
}
