#pragma once

#include <shared_data/host_record.hpp>
#include <shared_data/shared_data.hpp>

#include <string>

namespace SharedData
{
    BOOST_DEFINE_ENUM_CLASS(TransferDirection, Upload, Download);

    BOOST_DEFINE_ENUM_CLASS(TransferMode, RecursiveCopy, IncrementalSync);

    /**
     * @brief Flags that only have an effect in incremental sync mode.
     */
    struct SyncOptions
    {
        bool humanReadable{false};
        bool showProgress{false};
        bool deleteExtraneous{false};

        bool operator==(SyncOptions const&) const = default;
    };
    BOOST_DESCRIBE_STRUCT(SyncOptions, (), (humanReadable, showProgress, deleteExtraneous))

    struct TransferRequest
    {
        TransferDirection direction{TransferDirection::Upload};
        TransferMode mode{TransferMode::IncrementalSync};
        // Both paths are raw user input.
        std::string localPath{};
        std::string remotePath{};
        HostRecord host{};
        SyncOptions options{};
    };
    BOOST_DESCRIBE_STRUCT(TransferRequest, (), (direction, mode, localPath, remotePath, host, options))
}
