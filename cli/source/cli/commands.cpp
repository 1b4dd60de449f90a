#include <cli/commands.hpp>

#include <log/log.hpp>
#include <shared_data/shared_data.hpp>
#include <utility/algorithm/case_convert.hpp>
#include <utility/enum_string_convert.hpp>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <iostream>

using namespace SharedData;

namespace Cli
{
    namespace
    {
        void printError(CommandContext const& context, std::string const& message)
        {
            if (context.json)
                std::cout << toJsonText(nlohmann::json{{"error", message}}) << std::endl;
            else
                std::cerr << message << std::endl;
        }

        std::optional<HostRecord> resolveHost(CommandContext const& context, std::string const& alias)
        {
            auto host = context.service.findHost(alias);
            if (!host)
            {
                if (auto error = context.service.hostStore().lastError())
                    printError(context, *error);
                else
                    printError(context, fmt::format("Unknown host alias '{}'.", alias));
            }
            return host;
        }
    }

    std::string toJsonText(nlohmann::json const& json)
    {
        // Remote file names and tool output are not necessarily UTF-8.
        return json.dump(4, ' ', false, nlohmann::json::error_handler_t::replace);
    }

    std::optional<TransferMode> parseMode(std::string_view mode)
    {
        const auto lowered = Utility::Algorithm::toLowerCase(std::string{mode});
        if (lowered == "scp")
            return TransferMode::RecursiveCopy;
        if (lowered == "rsync")
            return TransferMode::IncrementalSync;
        return Utility::tryEnumFromString<TransferMode>(mode);
    }

    int listHosts(CommandContext const& context)
    {
        const auto hosts = context.service.listHosts();
        if (auto error = context.service.hostStore().lastError())
        {
            printError(context, *error);
            return ExitCode::Failure;
        }

        if (context.json)
        {
            std::cout << toJsonText(nlohmann::json(*hosts)) << std::endl;
            return ExitCode::Success;
        }

        if (hosts->empty())
        {
            std::cout << "No hosts found in " << context.service.hostStore().configPath().string() << std::endl;
            return ExitCode::Success;
        }

        for (auto const& host : *hosts)
        {
            std::cout << host.displayName();
            if (host.user)
                std::cout << " user=" << *host.user;
            if (host.port)
                std::cout << " port=" << *host.port;
            if (host.proxyJumpAlias)
                std::cout << " via=" << *host.proxyJumpAlias;
            std::cout << '\n';
        }
        std::cout.flush();
        return ExitCode::Success;
    }

    int transfer(
        CommandContext const& context,
        TransferDirection direction,
        std::vector<std::string> const& arguments,
        TransferFlags const& flags)
    {
        if (arguments.size() != 3)
        {
            std::cerr << (direction == TransferDirection::Upload ? "usage: hostxfer upload <local> <host> <remote>"
                                                                 : "usage: hostxfer download <remote> <host> <local>")
                      << std::endl;
            return ExitCode::UsageError;
        }

        auto const& settings = context.service.settings();
        const auto mode = parseMode(flags.mode.value_or(settings.defaultMode.value_or("IncrementalSync")));
        if (!mode)
        {
            std::cerr << "Unknown transfer mode, use 'scp' or 'rsync'." << std::endl;
            return ExitCode::UsageError;
        }

        const auto host = resolveHost(context, arguments[1]);
        if (!host)
            return ExitCode::Failure;

        const auto syncDefaults = settings.sync.value_or(Persistence::SyncDefaults{});
        TransferRequest request{
            .direction = direction,
            .mode = *mode,
            .localPath = direction == TransferDirection::Upload ? arguments[0] : arguments[2],
            .remotePath = direction == TransferDirection::Upload ? arguments[2] : arguments[0],
            .host = *host,
            .options =
                SyncOptions{
                    .humanReadable = flags.humanReadable || syncDefaults.humanReadable.value_or(false),
                    .showProgress = flags.progress || syncDefaults.progress.value_or(false),
                    .deleteExtraneous = flags.deleteExtraneous || syncDefaults.deleteExtraneous.value_or(false),
                },
        };

        const auto command = context.service.prepare(request);
        if (!command)
        {
            printError(context, command.error().error.value_or("Invalid input"));
            return ExitCode::Failure;
        }

        if (flags.dryRun)
        {
            if (context.json)
                std::cout << toJsonText(nlohmann::json(*command)) << std::endl;
            else
                std::cout << command->commandLine << std::endl;
            return ExitCode::Success;
        }

        auto options = context.service.transferOptions();
        if (flags.timeoutMs)
            options.timeout = std::chrono::milliseconds{*flags.timeoutMs};

        const auto result = context.service.execute(*command, options, [](std::string const& progress) {
            std::cerr << progress << std::endl;
        });

        if (context.json)
            std::cout << toJsonText(nlohmann::json(result)) << std::endl;
        else
            (result ? std::cout : std::cerr) << result.userMessage << std::endl;

        return result ? ExitCode::Success : ExitCode::Failure;
    }

    int listRemote(CommandContext const& context, std::vector<std::string> const& arguments)
    {
        if (arguments.empty() || arguments.size() > 2)
        {
            std::cerr << "usage: hostxfer ls <host> [path]" << std::endl;
            return ExitCode::UsageError;
        }

        const auto host = resolveHost(context, arguments[0]);
        if (!host)
            return ExitCode::Failure;

        const auto entries = context.service.listRemoteDirectory(*host, arguments.size() == 2 ? arguments[1] : "");
        if (!entries)
        {
            printError(context, entries.error().message);
            return ExitCode::Failure;
        }

        if (context.json)
        {
            std::cout << toJsonText(nlohmann::json(*entries)) << std::endl;
            return ExitCode::Success;
        }

        for (auto const& entry : *entries)
        {
            std::cout << fmt::format(
                "{:<11} {:>6} {:<12} {}{}\n",
                entry.permissions,
                entry.size,
                entry.modifiedDate,
                entry.name,
                entry.isDirectory ? "/" : "");
        }
        std::cout.flush();
        return ExitCode::Success;
    }
}
