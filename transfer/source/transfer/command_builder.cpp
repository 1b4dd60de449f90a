#include <transfer/command_builder.hpp>
#include <transfer/remote_path.hpp>
#include <transfer/shell_escape.hpp>

#include <fmt/format.h>

#include <stdexcept>

using namespace SharedData;

namespace Transfer
{
    namespace
    {
        struct Operands
        {
            std::string source;
            std::string destination;
        };

        Operands makeOperands(TransferRequest const& request)
        {
            // The colon stays outside of both escaped tokens.
            auto remote = shellEscape(request.host.alias) + ":" + escapeRemotePath(request.remotePath);
            auto local = shellEscape(request.localPath);

            if (request.direction == TransferDirection::Upload)
                return {.source = std::move(local), .destination = std::move(remote)};
            return {.source = std::move(remote), .destination = std::move(local)};
        }
    }

    RecursiveCopyBuilder::RecursiveCopyBuilder(ToolConfig tools)
        : tools_{std::move(tools)}
    {}

    BuiltCommand RecursiveCopyBuilder::buildCommand(TransferRequest const& request) const
    {
        const auto operands = makeOperands(request);
        return BuiltCommand{
            .commandLine = fmt::format(
                "{} -F {} -r {} {}",
                shellQuoteIfNeeded(tools_.scp),
                shellEscape(tools_.sshConfigPath),
                operands.source,
                operands.destination),
            .direction = request.direction,
            .mode = TransferMode::RecursiveCopy,
            .reportsProgress = false,
        };
    }

    IncrementalSyncBuilder::IncrementalSyncBuilder(ToolConfig tools)
        : tools_{std::move(tools)}
    {}

    std::string IncrementalSyncBuilder::flags(SyncOptions const& options)
    {
        // archive, verbose, compress
        std::string result = "-avz";
        if (options.humanReadable)
            result.push_back('h');
        // --partial --progress
        if (options.showProgress)
            result.push_back('P');

        if (options.deleteExtraneous)
            result.append(" --delete");
        return result;
    }

    BuiltCommand IncrementalSyncBuilder::buildCommand(TransferRequest const& request) const
    {
        const auto operands = makeOperands(request);
        const auto remoteShell =
            fmt::format("{} -F {}", shellQuoteIfNeeded(tools_.ssh), shellQuoteIfNeeded(tools_.sshConfigPath));

        return BuiltCommand{
            .commandLine = fmt::format(
                "{} -e {} {} {} {}",
                shellQuoteIfNeeded(tools_.rsync),
                shellEscape(remoteShell),
                flags(request.options),
                operands.source,
                operands.destination),
            .direction = request.direction,
            .mode = TransferMode::IncrementalSync,
            .reportsProgress = request.options.showProgress,
        };
    }

    CommandBuilder makeCommandBuilder(TransferMode mode, ToolConfig tools)
    {
        switch (mode)
        {
            case TransferMode::RecursiveCopy:
                return RecursiveCopyBuilder{std::move(tools)};
            case TransferMode::IncrementalSync:
                return IncrementalSyncBuilder{std::move(tools)};
        }
        throw std::invalid_argument("Unknown transfer mode.");
    }

    BuiltCommand buildCommand(CommandBuilder const& builder, TransferRequest const& request)
    {
        return std::visit(
            [&request](auto const& concreteBuilder) {
                return concreteBuilder.buildCommand(request);
            },
            builder);
    }

    std::string buildListingCommand(ToolConfig const& tools, std::string_view alias, std::string_view remotePath)
    {
        const auto remoteCommand = "ls -lAh -- " + escapeRemotePath(remotePath);
        return fmt::format(
            "{} -F {} {} {}",
            shellQuoteIfNeeded(tools.ssh),
            shellEscape(tools.sshConfigPath),
            shellEscape(alias),
            shellEscape(remoteCommand));
    }
}
