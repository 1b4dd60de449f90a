#include <transfer/listing_parser.hpp>
#include <transfer/transfer_service.hpp>

#include <log/log.hpp>
#include <utility/enum_string_convert.hpp>
#include <utility/home_directory.hpp>

using namespace SharedData;

namespace Transfer
{
    namespace
    {
        Persistence::Settings withDefaults(Persistence::Settings settings)
        {
            settings.useDefaultsFrom(Persistence::Settings::defaults());
            return settings;
        }

        ToolConfig makeToolConfig(Persistence::Settings const& settings, std::filesystem::path const& sshConfigPath)
        {
            ToolConfig tools{};
            if (settings.tools)
            {
                tools.scp = settings.tools->scp.value_or(tools.scp);
                tools.rsync = settings.tools->rsync.value_or(tools.rsync);
                tools.ssh = settings.tools->ssh.value_or(tools.ssh);
            }
            tools.sshConfigPath = sshConfigPath.string();
            return tools;
        }

        void logRejection(std::string_view what, ValidationResult const& result)
        {
            Log::warn(
                "Rejected {}: {} ({})",
                what,
                result.error.value_or("invalid"),
                Utility::enumToString(result.errorType.value_or(ValidationErrorType::EmptyPath)));
        }
    }

    TransferService::TransferService(Persistence::Settings settings, std::filesystem::path home)
        : settings_{withDefaults(std::move(settings))}
        , home_{std::move(home)}
        , store_{settings_.sshConfigPath.value_or("~/.ssh/config"), home_}
        , validator_{settings_.strictRemotePaths.value_or(false), home_}
        , normalizer_{home_}
        , tools_{makeToolConfig(settings_, store_.configPath())}
        , executor_{}
    {}

    TransferService::TransferService(Persistence::Settings settings)
        : TransferService{std::move(settings), Utility::homeDirectory()}
    {}

    std::shared_ptr<Persistence::HostConfigStore::HostList const> TransferService::listHosts()
    {
        return store_.load();
    }

    std::optional<HostRecord> TransferService::findHost(std::string_view alias)
    {
        return store_.findByAlias(alias);
    }

    Persistence::HostConfigStore& TransferService::hostStore()
    {
        return store_;
    }

    ValidationResult TransferService::validateLocalPath(std::string_view path) const
    {
        return validator_.validateLocalPath(path);
    }
    ValidationResult TransferService::validateLocalDestination(std::string_view path) const
    {
        return validator_.validateLocalDestination(path);
    }
    ValidationResult TransferService::validateRemotePath(std::string_view path) const
    {
        return validator_.validateRemotePath(path);
    }
    ValidationResult TransferService::validatePort(double port) const
    {
        return Validator::validatePort(port);
    }
    ValidationResult TransferService::validateHostRecord(std::optional<HostRecord> const& host) const
    {
        return Validator::validateHostRecord(host);
    }

    std::expected<BuiltCommand, ValidationResult> TransferService::prepare(TransferRequest const& request) const
    {
        if (auto result = validator_.validateHostRecord(request.host); !result)
        {
            logRejection("host", result);
            return std::unexpected(std::move(result));
        }

        if (auto result = validator_.validateRemotePath(request.remotePath); !result)
        {
            logRejection("remote path", result);
            return std::unexpected(std::move(result));
        }

        auto localResult = request.direction == TransferDirection::Upload
            ? validator_.validateLocalPath(request.localPath)
            : validator_.validateLocalDestination(request.localPath);
        if (!localResult)
        {
            logRejection("local path", localResult);
            return std::unexpected(std::move(localResult));
        }

        return buildCommand(request);
    }

    BuiltCommand TransferService::buildCommand(TransferRequest const& request) const
    {
        const auto normalized = normalizer_.normalize(request);
        auto command = Transfer::buildCommand(makeCommandBuilder(normalized.mode, tools_), normalized);
        Log::debug("Built command: {}", command.commandLine);
        return command;
    }

    ExecutionOptions TransferService::transferOptions() const
    {
        return ExecutionOptions{
            .timeout = settings_.transferTimeout(),
            .progressThrottle = settings_.progressThrottle(),
            .context = ClassificationContext::Transfer,
        };
    }

    TransferResult TransferService::execute(
        BuiltCommand const& command,
        std::function<void(std::string const&)> const& onProgress) const
    {
        return execute(command, transferOptions(), onProgress);
    }

    TransferResult TransferService::execute(
        BuiltCommand const& command,
        ExecutionOptions const& options,
        std::function<void(std::string const&)> const& onProgress) const
    {
        return executor_.run(command, options, onProgress);
    }

    Execution TransferService::startExecution(BuiltCommand const& command) const
    {
        return startExecution(command, transferOptions());
    }

    Execution TransferService::startExecution(BuiltCommand const& command, ExecutionOptions const& options) const
    {
        return executor_.start(command.commandLine, options);
    }

    std::expected<std::vector<RemoteEntry>, ListingError>
    TransferService::listRemoteDirectory(HostRecord const& host, std::string_view remotePath) const
    {
        if (auto result = validator_.validateHostRecord(host); !result)
        {
            logRejection("host", result);
            return std::unexpected(ListingError{
                .message = result.error.value_or(""),
                .validationError = result.errorType,
            });
        }

        const std::string path = remotePath.empty() ? std::string{"~"} : std::string{remotePath};
        if (auto result = validator_.validateRemotePath(path); !result)
        {
            logRejection("remote path", result);
            return std::unexpected(ListingError{
                .message = result.error.value_or(""),
                .validationError = result.errorType,
            });
        }

        const auto command = buildListingCommand(tools_, host.alias, path);
        const auto result = executor_.run(
            command,
            ExecutionOptions{
                .timeout = settings_.listingTimeout(),
                .progressThrottle = settings_.progressThrottle(),
                .context = ClassificationContext::Listing,
            });

        if (!result)
        {
            return std::unexpected(ListingError{
                .message = result.userMessage,
                .executionError = result.errorType.value_or(ExecutionErrorType::Unclassified),
                .rawStderr = result.rawStderr,
            });
        }

        auto entries = parseRemoteListing(result.rawStdout.value_or(""));
        Log::info("Found {} entries in '{}' on '{}'.", entries.size(), path, host.alias);
        return entries;
    }

    Persistence::Settings const& TransferService::settings() const
    {
        return settings_;
    }

    ToolConfig const& TransferService::tools() const
    {
        return tools_;
    }
}
