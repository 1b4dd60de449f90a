#pragma once

#include <shared_data/built_command.hpp>
#include <shared_data/transfer_request.hpp>

#include <string>
#include <string_view>
#include <variant>

namespace Transfer
{
    /**
     * @brief Executables and the ssh configuration file the built commands refer to.
     */
    struct ToolConfig
    {
        std::string scp{"scp"};
        std::string rsync{"rsync"};
        std::string ssh{"ssh"};
        // Already expanded, handed to -F.
        std::string sshConfigPath{};
    };

    /**
     * @brief <scp> -F <config> -r <source> <alias>:<destination>
     */
    class RecursiveCopyBuilder
    {
      public:
        explicit RecursiveCopyBuilder(ToolConfig tools);

        SharedData::BuiltCommand buildCommand(SharedData::TransferRequest const& request) const;

      private:
        ToolConfig tools_;
    };

    /**
     * @brief <rsync> -e '<ssh> -F <config>' -avz[h][P] [--delete] <source> <alias>:<destination>
     */
    class IncrementalSyncBuilder
    {
      public:
        explicit IncrementalSyncBuilder(ToolConfig tools);

        SharedData::BuiltCommand buildCommand(SharedData::TransferRequest const& request) const;

        /**
         * @brief The combined short flag token followed by the long flags, e.g. "-avzhP --delete".
         */
        static std::string flags(SharedData::SyncOptions const& options);

      private:
        ToolConfig tools_;
    };

    using CommandBuilder = std::variant<RecursiveCopyBuilder, IncrementalSyncBuilder>;

    CommandBuilder makeCommandBuilder(SharedData::TransferMode mode, ToolConfig tools);

    /**
     * @brief Builds the command line for an already validated and normalized request.
     */
    SharedData::BuiltCommand buildCommand(CommandBuilder const& builder, SharedData::TransferRequest const& request);

    /**
     * @brief <ssh> -F <config> <alias> 'ls -lAh -- <remote path>'
     * The remote command is one escaped word, the remote path inside it is rendered by escapeRemotePath.
     */
    std::string buildListingCommand(ToolConfig const& tools, std::string_view alias, std::string_view remotePath);
}
