#pragma once

#include <transfer/transfer_service.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Cli
{
    enum ExitCode : int
    {
        Success = 0,
        Failure = 1,
        UsageError = 2,
    };

    struct TransferFlags
    {
        std::optional<std::string> mode{std::nullopt};
        bool humanReadable{false};
        bool progress{false};
        bool deleteExtraneous{false};
        bool dryRun{false};
        std::optional<long long> timeoutMs{std::nullopt};
    };

    struct CommandContext
    {
        Transfer::TransferService& service;
        bool json{false};
    };

    int listHosts(CommandContext const& context);

    /**
     * @param arguments upload: local host remote, download: remote host local.
     */
    int transfer(
        CommandContext const& context,
        SharedData::TransferDirection direction,
        std::vector<std::string> const& arguments,
        TransferFlags const& flags);

    /**
     * @param arguments host [path]
     */
    int listRemote(CommandContext const& context, std::vector<std::string> const& arguments);

    /**
     * @brief "scp", "rsync" or a TransferMode name.
     */
    std::optional<SharedData::TransferMode> parseMode(std::string_view mode);

    /**
     * @brief Pretty printed JSON. Invalid UTF-8 in strings is replaced by U+FFFD instead of throwing.
     */
    std::string toJsonText(nlohmann::json const& json);
}
